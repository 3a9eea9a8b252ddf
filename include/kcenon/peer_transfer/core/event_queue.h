/**
 * @file event_queue.h
 * @brief FIFO of events drained by an observer
 */

#ifndef KCENON_PEER_TRANSFER_CORE_EVENT_QUEUE_H
#define KCENON_PEER_TRANSFER_CORE_EVENT_QUEUE_H

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief Single-threaded event queue
 *
 * Producers push events on the event loop; the observer pulls them with
 * poll() or drain() on the same loop. An optional notifier is invoked after
 * each push so that a front end can schedule a drain; it must not touch the
 * queue re-entrantly.
 *
 * The queue is unbounded: events stay until the observer takes them. A merge
 * rule, when set, lets an incoming event replace the newest pending one, so
 * repeated snapshots of the same thing do not pile up while nobody drains.
 *
 * @code
 * queue->set_notifier([&] { boost::asio::post(io, [&] { render(queue->drain()); }); });
 * @endcode
 */
template <typename Event>
class event_queue {
public:
    using notifier = std::function<void()>;
    using merge_rule = std::function<bool(const Event& pending, const Event& incoming)>;

    void push(Event event) {
        if (merge_ && !events_.empty() && merge_(events_.back(), event)) {
            events_.back() = std::move(event);
        } else {
            events_.push_back(std::move(event));
        }
        if (notifier_) {
            notifier_();
        }
    }

    /**
     * @brief Take the oldest event
     */
    [[nodiscard]] auto poll() -> std::optional<Event> {
        if (events_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    /**
     * @brief Take every pending event, oldest first
     */
    [[nodiscard]] auto drain() -> std::vector<Event> {
        std::vector<Event> out(std::make_move_iterator(events_.begin()),
                               std::make_move_iterator(events_.end()));
        events_.clear();
        return out;
    }

    [[nodiscard]] auto size() const -> std::size_t { return events_.size(); }
    [[nodiscard]] auto empty() const -> bool { return events_.empty(); }

    void clear() { events_.clear(); }

    void set_notifier(notifier fn) { notifier_ = std::move(fn); }

    void set_merge_rule(merge_rule rule) { merge_ = std::move(rule); }

private:
    std::deque<Event> events_;
    notifier notifier_;
    merge_rule merge_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_EVENT_QUEUE_H
