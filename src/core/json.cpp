/**
 * @file json.cpp
 * @brief Implementation of the minimal JSON document model
 */

#include <kcenon/bulk_download/core/json.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace kcenon::bulk_download {

// ============================================================================
// Escaping
// ============================================================================

auto escape_json_string(std::string_view input) -> std::string {
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
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

constexpr int max_nesting_depth = 64;

class parser {
public:
    explicit parser(std::string_view text) : text_(text) {}

    auto parse_document() -> result<json_value> {
        skip_whitespace();
        auto value = parse_value(0);
        if (!value) {
            return value;
        }
        skip_whitespace();
        if (pos_ != text_.size()) {
            return fail("trailing characters after document");
        }
        return value;
    }

private:
    auto fail(const std::string& what) const -> unexpected {
        return unexpected(error(error_code::snapshot_format_error,
                                what + " at offset " + std::to_string(pos_)));
    }

    void skip_whitespace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
                break;
            }
            ++pos_;
        }
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    auto parse_value(int depth) -> result<json_value> {
        if (depth > max_nesting_depth) {
            return fail("nesting too deep");
        }
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }

        char c = text_[pos_];
        switch (c) {
            case '{':
                return parse_object(depth);
            case '[':
                return parse_array(depth);
            case '"': {
                auto s = parse_string();
                if (!s) {
                    return unexpected(s.error());
                }
                return json_value(std::move(s.value()));
            }
            case 't':
                if (consume_literal("true")) return json_value(true);
                return fail("invalid literal");
            case 'f':
                if (consume_literal("false")) return json_value(false);
                return fail("invalid literal");
            case 'n':
                if (consume_literal("null")) return json_value(nullptr);
                return fail("invalid literal");
            default:
                if (c == '-' || (c >= '0' && c <= '9')) {
                    return parse_number();
                }
                return fail(std::string("unexpected character '") + c + "'");
        }
    }

    auto parse_number() -> result<json_value> {
        std::size_t start = pos_;
        if (text_[pos_] == '-') ++pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if ((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' ||
                c == '+' || c == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        std::string token(text_.substr(start, pos_ - start));
        char* end = nullptr;
        double value = std::strtod(token.c_str(), &end);
        if (end == token.c_str() || *end != '\0' || !std::isfinite(value)) {
            pos_ = start;
            return fail("invalid number");
        }
        return json_value(value);
    }

    auto parse_hex4() -> std::optional<uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else return std::nullopt;
        }
        return cp;
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

    auto parse_string() -> result<std::string> {
        ++pos_;  // opening quote
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) {
                        return fail("invalid unicode escape");
                    }
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) {
                            return fail("unpaired surrogate");
                        }
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return fail("invalid low surrogate");
                        }
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(out, *cp);
                    break;
                }
                default:
                    return fail("invalid escape sequence");
            }
        }
        return fail("unterminated string");
    }

    auto parse_array(int depth) -> result<json_value> {
        ++pos_;
        json_array items;
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return json_value(std::move(items));
        }
        while (true) {
            skip_whitespace();
            auto item = parse_value(depth + 1);
            if (!item) {
                return item;
            }
            items.push_back(std::move(item.value()));
            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("unterminated array");
            }
            char c = text_[pos_++];
            if (c == ']') {
                return json_value(std::move(items));
            }
            if (c != ',') {
                --pos_;
                return fail("expected ',' or ']'");
            }
        }
    }

    auto parse_object(int depth) -> result<json_value> {
        ++pos_;
        json_value obj{json_object{}};
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return obj;
        }
        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected object key");
            }
            auto key = parse_string();
            if (!key) {
                return unexpected(key.error());
            }
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("expected ':'");
            }
            ++pos_;
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            obj.set(std::move(key.value()), std::move(value.value()));
            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("unterminated object");
            }
            char c = text_[pos_++];
            if (c == '}') {
                return obj;
            }
            if (c != ',') {
                --pos_;
                return fail("expected ',' or '}'");
            }
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

void append_number(std::string& out, double value) {
    double integral = 0.0;
    if (std::modf(value, &integral) == 0.0 &&
        std::fabs(value) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
        out += std::to_string(static_cast<int64_t>(value));
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    out += buf;
}

void append_newline(std::string& out, int indent, int depth) {
    if (indent <= 0) {
        return;
    }
    out += '\n';
    out.append(static_cast<std::size_t>(indent * depth), ' ');
}

}  // namespace

// ============================================================================
// json_value implementation
// ============================================================================

auto json_value::find(std::string_view key) const -> const json_value* {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& [name, value] : as_object()) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

auto json_value::set(std::string key, json_value value) -> json_value& {
    if (is_null()) {
        data_ = json_object{};
    }
    auto& members = std::get<json_object>(data_);
    for (auto& [name, existing] : members) {
        if (name == key) {
            existing = std::move(value);
            return *this;
        }
    }
    members.emplace_back(std::move(key), std::move(value));
    return *this;
}

auto json_value::push_back(json_value value) -> json_value& {
    if (is_null()) {
        data_ = json_array{};
    }
    std::get<json_array>(data_).push_back(std::move(value));
    return *this;
}

auto json_value::get_string(std::string_view key) const -> std::optional<std::string> {
    const auto* v = find(key);
    if (v == nullptr || !v->is_string()) {
        return std::nullopt;
    }
    return v->as_string();
}

auto json_value::get_int(std::string_view key) const -> std::optional<int64_t> {
    const auto* v = find(key);
    if (v == nullptr || !v->is_number()) {
        return std::nullopt;
    }
    const double n = v->as_number();
    const auto limit = static_cast<double>(max_exact_integer);
    if (!std::isfinite(n) || std::trunc(n) != n || n > limit || n < -limit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(n);
}

auto json_value::as_unsigned(uint64_t max) const -> std::optional<uint64_t> {
    if (!is_number()) {
        return std::nullopt;
    }
    const double n = as_number();
    const auto limit = static_cast<double>(std::min(max, max_exact_integer));
    if (!std::isfinite(n) || std::trunc(n) != n || n < 0 || n > limit) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(n);
}

auto json_value::get_bool(std::string_view key) const -> std::optional<bool> {
    const auto* v = find(key);
    if (v == nullptr || !v->is_bool()) {
        return std::nullopt;
    }
    return v->as_bool();
}

auto json_value::dump(int indent) const -> std::string {
    std::string out;
    dump_to(out, indent, 0);
    return out;
}

void json_value::dump_to(std::string& out, int indent, int depth) const {
    switch (type()) {
        case kind::null:
            out += "null";
            break;
        case kind::boolean:
            out += as_bool() ? "true" : "false";
            break;
        case kind::number:
            append_number(out, as_number());
            break;
        case kind::string:
            out += '"';
            out += escape_json_string(as_string());
            out += '"';
            break;
        case kind::array: {
            const auto& items = as_array();
            if (items.empty()) {
                out += "[]";
                break;
            }
            out += '[';
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ',';
                append_newline(out, indent, depth + 1);
                items[i].dump_to(out, indent, depth + 1);
            }
            append_newline(out, indent, depth);
            out += ']';
            break;
        }
        case kind::object: {
            const auto& members = as_object();
            if (members.empty()) {
                out += "{}";
                break;
            }
            out += '{';
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i > 0) out += ',';
                append_newline(out, indent, depth + 1);
                out += '"';
                out += escape_json_string(members[i].first);
                out += indent > 0 ? "\": " : "\":";
                members[i].second.dump_to(out, indent, depth + 1);
            }
            append_newline(out, indent, depth);
            out += '}';
            break;
        }
    }
}

auto json_value::parse(std::string_view text) -> result<json_value> {
    parser p(text);
    return p.parse_document();
}

}  // namespace kcenon::bulk_download
