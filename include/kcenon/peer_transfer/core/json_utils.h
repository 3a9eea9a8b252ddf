/**
 * @file json_utils.h
 * @brief Minimal JSON reading and writing for control frames and signal codes
 *
 * Only flat objects are materialized: nested objects and arrays are parsed for
 * validity and kept as opaque members so that unknown fields never break a
 * frame.
 */

#ifndef KCENON_PEER_TRANSFER_CORE_JSON_UTILS_H
#define KCENON_PEER_TRANSFER_CORE_JSON_UTILS_H

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer::json {

/**
 * @brief Type of a top-level member value
 */
enum class value_type {
    null,
    boolean,
    number,
    string,
    composite  ///< Nested object or array (content not retained)
};

/**
 * @brief A top-level member value of a JSON object
 */
struct value {
    value_type type = value_type::null;
    bool boolean = false;
    double number = 0.0;
    bool is_integer = false;  ///< Number literal had no fraction or exponent
    std::string text;         ///< Decoded string, or raw literal for numbers

    [[nodiscard]] auto is_string() const -> bool { return type == value_type::string; }
    [[nodiscard]] auto is_number() const -> bool { return type == value_type::number; }
};

/**
 * @brief Parsed flat JSON object
 */
class object {
public:
    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    [[nodiscard]] auto find(std::string_view key) const -> const value*;

    /**
     * @brief Get a string member
     * @return The string, or nullopt when missing or not a string
     */
    [[nodiscard]] auto get_string(std::string_view key) const
        -> std::optional<std::string>;

    /**
     * @brief Get a non-negative integral number member
     * @return The number, or nullopt when missing, fractional, negative or too large
     */
    [[nodiscard]] auto get_uint(std::string_view key) const
        -> std::optional<uint64_t>;

    [[nodiscard]] auto size() const -> std::size_t { return members_.size(); }

    void set(std::string key, value v);

private:
    std::map<std::string, value, std::less<>> members_;
};

/**
 * @brief Parse text that must contain exactly one JSON object
 * @param text Input text (surrounding whitespace allowed)
 * @return Parsed object, or nullopt on any syntax error or non-object root
 */
[[nodiscard]] auto parse_object(std::string_view text) -> std::optional<object>;

/**
 * @brief Escape a string for embedding inside JSON double quotes
 */
[[nodiscard]] auto escape(std::string_view input) -> std::string;

/**
 * @brief Incremental writer for flat JSON objects
 *
 * @code
 * auto text = json::writer()
 *     .add("type", "meta")
 *     .add("size", uint64_t{1024})
 *     .str();
 * @endcode
 */
class writer {
public:
    auto add(std::string_view key, std::string_view text) -> writer&;
    auto add(std::string_view key, const char* text) -> writer&;
    auto add(std::string_view key, uint64_t number) -> writer&;
    auto add(std::string_view key, bool flag) -> writer&;

    /**
     * @brief Finish and return the serialized object
     */
    [[nodiscard]] auto str() const -> std::string;

private:
    void begin_member(std::string_view key);

    std::string body_;
};

}  // namespace kcenon::peer_transfer::json

#endif  // KCENON_PEER_TRANSFER_CORE_JSON_UTILS_H
