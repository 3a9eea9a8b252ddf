/**
 * @file json_utils.cpp
 * @brief Implementation of the minimal JSON reader and writer
 */

#include <kcenon/peer_transfer/core/json_utils.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace kcenon::peer_transfer::json {

namespace {

constexpr int max_nesting_depth = 64;

class parser {
public:
    explicit parser(std::string_view text) : text_(text), pos_(0) {}

    auto parse_root(object& out) -> bool {
        skip_whitespace();
        if (!consume('{')) return false;

        skip_whitespace();
        if (consume('}')) {
            skip_whitespace();
            return at_end();
        }

        while (true) {
            skip_whitespace();
            std::string key;
            if (!parse_string(key)) return false;

            skip_whitespace();
            if (!consume(':')) return false;

            value v;
            if (!parse_value(v, 1)) return false;
            out.set(std::move(key), std::move(v));

            skip_whitespace();
            if (consume(',')) continue;
            if (consume('}')) break;
            return false;
        }

        skip_whitespace();
        return at_end();
    }

private:
    auto parse_value(value& out, int depth) -> bool {
        skip_whitespace();
        if (at_end()) return false;

        char c = text_[pos_];
        switch (c) {
            case '"':
                out.type = value_type::string;
                return parse_string(out.text);
            case '{':
            case '[':
                out.type = value_type::composite;
                return skip_composite(depth);
            case 't':
                out.type = value_type::boolean;
                out.boolean = true;
                return consume_literal("true");
            case 'f':
                out.type = value_type::boolean;
                out.boolean = false;
                return consume_literal("false");
            case 'n':
                out.type = value_type::null;
                return consume_literal("null");
            default:
                return parse_number(out);
        }
    }

    auto skip_composite(int depth) -> bool {
        if (depth > max_nesting_depth) return false;

        char open = text_[pos_++];
        char close = open == '{' ? '}' : ']';

        skip_whitespace();
        if (consume(close)) return true;

        while (true) {
            skip_whitespace();
            if (open == '{') {
                std::string ignored;
                if (!parse_string(ignored)) return false;
                skip_whitespace();
                if (!consume(':')) return false;
            }

            value nested;
            if (!parse_value(nested, depth + 1)) return false;

            skip_whitespace();
            if (consume(',')) continue;
            return consume(close);
        }
    }

    auto parse_number(value& out) -> bool {
        std::size_t start = pos_;
        bool integral = true;

        if (peek() == '-') ++pos_;

        if (peek() == '0') {
            ++pos_;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) ++pos_;
        } else {
            return false;
        }

        if (peek() == '.') {
            integral = false;
            ++pos_;
            if (!is_digit(peek())) return false;
            while (is_digit(peek())) ++pos_;
        }

        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!is_digit(peek())) return false;
            while (is_digit(peek())) ++pos_;
        }

        out.type = value_type::number;
        out.is_integer = integral;
        out.text = std::string(text_.substr(start, pos_ - start));
        out.number = std::strtod(out.text.c_str(), nullptr);
        return true;
    }

    auto parse_string(std::string& out) -> bool {
        if (!consume('"')) return false;
        out.clear();

        while (!at_end()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c != '\\') {
                out += c;
                continue;
            }

            if (at_end()) return false;
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t code_point = 0;
                    if (!parse_hex4(code_point)) return false;
                    if (code_point >= 0xD800 && code_point <= 0xDBFF) {
                        uint32_t low = 0;
                        if (!consume('\\') || !consume('u') || !parse_hex4(low)) return false;
                        if (low < 0xDC00 || low > 0xDFFF) return false;
                        code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
                        return false;
                    }
                    append_utf8(out, code_point);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    auto parse_hex4(uint32_t& out) -> bool {
        if (text_.size() - pos_ < 4) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            out <<= 4;
            if (c >= '0' && c <= '9') {
                out |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                out |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                out |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return false;
            }
        }
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (text_.substr(pos_, literal.size()) != literal) return false;
        pos_ += literal.size();
        return true;
    }

    auto consume(char c) -> bool {
        if (!at_end() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : text_[pos_];
    }

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= text_.size(); }

    static auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

    std::string_view text_;
    std::size_t pos_;
};

}  // namespace

// object implementation

auto object::contains(std::string_view key) const -> bool {
    return members_.find(key) != members_.end();
}

auto object::find(std::string_view key) const -> const value* {
    auto it = members_.find(key);
    return it == members_.end() ? nullptr : &it->second;
}

auto object::get_string(std::string_view key) const -> std::optional<std::string> {
    const auto* v = find(key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->text;
}

auto object::get_uint(std::string_view key) const -> std::optional<uint64_t> {
    const auto* v = find(key);
    if (!v || !v->is_number() || !v->is_integer) return std::nullopt;

    uint64_t parsed = 0;
    const char* first = v->text.data();
    const char* last = first + v->text.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return parsed;
}

void object::set(std::string key, value v) {
    members_[std::move(key)] = std::move(v);
}

auto parse_object(std::string_view text) -> std::optional<object> {
    object out;
    parser p(text);
    if (!p.parse_root(out)) return std::nullopt;
    return out;
}

auto escape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// writer implementation

void writer::begin_member(std::string_view key) {
    if (!body_.empty()) body_ += ',';
    body_ += '"';
    body_ += escape(key);
    body_ += "\":";
}

auto writer::add(std::string_view key, std::string_view text) -> writer& {
    begin_member(key);
    body_ += '"';
    body_ += escape(text);
    body_ += '"';
    return *this;
}

auto writer::add(std::string_view key, const char* text) -> writer& {
    return add(key, std::string_view(text));
}

auto writer::add(std::string_view key, uint64_t number) -> writer& {
    begin_member(key);
    body_ += std::to_string(number);
    return *this;
}

auto writer::add(std::string_view key, bool flag) -> writer& {
    begin_member(key);
    body_ += flag ? "true" : "false";
    return *this;
}

auto writer::str() const -> std::string {
    return "{" + body_ + "}";
}

}  // namespace kcenon::peer_transfer::json
