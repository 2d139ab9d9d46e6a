// value.cpp - Record access and the JSON codec

#include <ooxml_fidelity/value.h>
#include <ooxml_fidelity/builders.h>
#include <ooxml_fidelity/log.h>
#include <ooxml_fidelity/serialization.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace ooxml_fidelity {

// ============================================================
// Value
// ============================================================

Value Value::map(std::initializer_list<std::pair<std::string, Value>> fields) {
    MapBuilder builder;
    for (const auto& [key, field] : fields) {
        builder.set(key, field);
    }
    return builder.finish();
}

Value Value::vector(std::initializer_list<Value> items) {
    VectorBuilder builder;
    for (const auto& item : items) {
        builder.push_back(item);
    }
    return builder.finish();
}

Value Value::at(const std::string& key) const {
    return at_or(key, Value{});
}

Value Value::at(std::size_t index) const {
    const auto* items = get_if<ValueList>();
    if (items && index < items->size()) {
        return (*items)[index].get();
    }
    return Value{};
}

Value Value::at_or(const std::string& key, Value fallback) const {
    if (const auto* fields = get_if<ValueMap>()) {
        if (const auto* found = fields->find(key)) {
            return found->get();
        }
    }
    return fallback;
}

bool Value::contains(const std::string& key) const {
    const auto* fields = get_if<ValueMap>();
    return fields && fields->count(key) > 0;
}

std::size_t Value::size() const noexcept {
    if (const auto* fields = get_if<ValueMap>()) return fields->size();
    if (const auto* items = get_if<ValueList>()) return items->size();
    return 0;
}

int64_t Value::as_int64(int64_t fallback) const noexcept {
    const auto* number = get_if<int64_t>();
    return number ? *number : fallback;
}

double Value::as_double(double fallback) const noexcept {
    const auto* number = get_if<double>();
    return number ? *number : fallback;
}

bool Value::as_bool(bool fallback) const noexcept {
    const auto* flag = get_if<bool>();
    return flag ? *flag : fallback;
}

std::string Value::as_string(std::string fallback) const {
    const auto* text = get_if<std::string>();
    return text ? *text : fallback;
}

std::string_view Value::as_string_view() const noexcept {
    const auto* text = get_if<std::string>();
    return text ? std::string_view{*text} : std::string_view{};
}

double Value::as_number(double fallback) const noexcept {
    if (const auto* real = get_if<double>()) return *real;
    if (const auto* integer = get_if<int64_t>()) return static_cast<double>(*integer);
    return fallback;
}

ValueMap Value::as_map() const {
    const auto* fields = get_if<ValueMap>();
    return fields ? *fields : ValueMap{};
}

ValueList Value::as_vector() const {
    const auto* items = get_if<ValueList>();
    return items ? *items : ValueList{};
}

Value Value::set(const std::string& key, Value field) const {
    const auto* fields = get_if<ValueMap>();
    if (!fields) {
        detail::log_input_error("Value::set", key, "record is not a map");
        return *this;
    }
    return Value{fields->set(key, ValueBox{std::move(field)})};
}

Value Value::push_back(Value item) const {
    const auto* items = get_if<ValueList>();
    if (!items) {
        detail::log_warning("Value::push_back", "record is not a list");
        return *this;
    }
    return Value{items->push_back(ValueBox{std::move(item)})};
}

// ============================================================
// JSON writer
// ============================================================

namespace {

void append_escaped(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

/// Shortest of 15 or 17 significant digits that reads back exactly.
/// NaN and infinities have no JSON form and are written as null.
void append_real(std::string& out, double number) {
    if (!std::isfinite(number)) {
        out += "null";
        return;
    }
    char digits[32];
    std::snprintf(digits, sizeof(digits), "%.15g", number);
    if (std::strtod(digits, nullptr) != number) {
        std::snprintf(digits, sizeof(digits), "%.17g", number);
    }
    out += digits;
}

class JsonWriter {
public:
    explicit JsonWriter(bool compact) : compact_(compact) {}

    std::string take() { return std::move(out_); }

    void write(const Value& value, int depth) {
        std::visit([&](const auto& field) { write_field(field, depth); }, value.data());
    }

private:
    void write_field(std::monostate, int) { out_ += "null"; }
    void write_field(bool flag, int) { out_ += flag ? "true" : "false"; }
    void write_field(int64_t number, int) { out_ += std::to_string(number); }
    void write_field(double number, int) { append_real(out_, number); }
    void write_field(const std::string& text, int) { append_escaped(out_, text); }

    void write_field(const ValueMap& fields, int depth) {
        if (fields.size() == 0) {
            out_ += "{}";
            return;
        }
        // immer::map iterates in hash order; keys are sorted for stable output
        std::vector<const ValueMap::value_type*> sorted;
        sorted.reserve(fields.size());
        for (const auto& entry : fields) {
            sorted.push_back(&entry);
        }
        std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) { return a->first < b->first; });

        out_ += '{';
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            if (i > 0) out_ += ',';
            break_line(depth + 1);
            append_escaped(out_, sorted[i]->first);
            out_ += compact_ ? ":" : ": ";
            write(sorted[i]->second.get(), depth + 1);
        }
        break_line(depth);
        out_ += '}';
    }

    void write_field(const ValueList& items, int depth) {
        if (items.size() == 0) {
            out_ += "[]";
            return;
        }
        out_ += '[';
        bool first = true;
        for (const auto& item : items) {
            if (!first) out_ += ',';
            first = false;
            break_line(depth + 1);
            write(*item, depth + 1);
        }
        break_line(depth);
        out_ += ']';
    }

    void break_line(int depth) {
        if (compact_) return;
        out_ += '\n';
        out_.append(static_cast<std::size_t>(depth) * 2, ' ');
    }

    bool compact_;
    std::string out_;
};

// ============================================================
// JSON reader
// ============================================================

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document() {
        skip_space();
        if (at_end()) {
            throw JsonError("Empty JSON input");
        }
        Value document = read_value();
        skip_space();
        if (!at_end()) {
            fail("Trailing characters");
        }
        return document;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw JsonError(what + " at position " + std::to_string(pos_));
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_space() {
        while (!at_end() && (peek() == ' ' || peek() == '\n' || peek() == '\r' || peek() == '\t')) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_space();
        if (peek() != c) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    /// Consumes `c` if it is next
    bool accept(char c) {
        skip_space();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect_word(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) {
            fail("Expected '" + std::string(word) + "'");
        }
        pos_ += word.size();
    }

    Value read_value() {
        skip_space();
        switch (peek()) {
            case '{': return read_object();
            case '[': return read_array();
            case '"': return Value{read_string()};
            case 't': expect_word("true"); return Value{true};
            case 'f': expect_word("false"); return Value{false};
            case 'n': expect_word("null"); return Value{};
            default: break;
        }
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return read_number();
        }
        fail(at_end() ? "Unexpected end of input" : std::string("Unexpected character '") + peek() + "'");
    }

    Value read_object() {
        expect('{');
        MapBuilder fields;
        if (accept('}')) {
            return fields.finish();
        }
        do {
            skip_space();
            std::string key = read_string();
            expect(':');
            fields.set(key, read_value());
        } while (accept(','));
        expect('}');
        return fields.finish();
    }

    Value read_array() {
        expect('[');
        VectorBuilder items;
        if (accept(']')) {
            return items.finish();
        }
        do {
            items.push_back(read_value());
        } while (accept(','));
        expect(']');
        return items.finish();
    }

    std::string read_string() {
        expect('"');
        std::string text;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return text;
            }
            if (c != '\\') {
                text += c;
                continue;
            }
            if (at_end()) break;
            const char escape = text_[pos_++];
            switch (escape) {
                case '"':  text += '"'; break;
                case '\\': text += '\\'; break;
                case '/':  text += '/'; break;
                case 'b':  text += '\b'; break;
                case 'f':  text += '\f'; break;
                case 'n':  text += '\n'; break;
                case 'r':  text += '\r'; break;
                case 't':  text += '\t'; break;
                case 'u':  append_utf8(text, read_code_point()); break;
                default:   fail(std::string("Invalid escape '\\") + escape + "'");
            }
        }
        throw JsonError("Unterminated string");
    }

    unsigned read_code_unit() {
        unsigned code = 0;
        const char* first = text_.data() + pos_;
        const char* last = text_.data() + std::min(pos_ + 4, text_.size());
        auto [ptr, ec] = std::from_chars(first, last, code, 16);
        if (ec != std::errc{} || ptr != first + 4) {
            fail("Invalid unicode escape");
        }
        pos_ += 4;
        return code;
    }

    // A high surrogate must be followed by an escaped low surrogate
    unsigned read_code_point() {
        const unsigned high = read_code_unit();
        if (high >= 0xDC00 && high <= 0xDFFF) {
            fail("Unpaired low surrogate");
        }
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        if (text_.substr(pos_, 2) != "\\u") {
            fail("Unpaired high surrogate");
        }
        pos_ += 2;
        const unsigned low = read_code_unit();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("Unpaired high surrogate");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    /// Integers stay int64; anything with a fraction, an exponent or out of
    /// int64 range becomes a double
    Value read_number() {
        const std::size_t start = pos_;
        auto digits = [&] {
            while (!at_end() && peek() >= '0' && peek() <= '9') ++pos_;
        };
        bool integral = true;
        if (peek() == '-') ++pos_;
        digits();
        if (peek() == '.') {
            integral = false;
            ++pos_;
            digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            digits();
        }

        const std::string_view literal = text_.substr(start, pos_ - start);
        if (integral) {
            int64_t integer = 0;
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), integer);
            if (ec == std::errc{} && ptr == literal.data() + literal.size()) {
                return Value{integer};
            }
        }
        const std::string copy(literal);
        char* end = nullptr;
        const double real = std::strtod(copy.c_str(), &end);
        if (end != copy.c_str() + copy.size()) {
            fail("Malformed number");
        }
        return Value{real};
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    JsonWriter writer(compact);
    writer.write(val, 0);
    return writer.take();
}

Value from_json(const std::string& json_str, std::string* error_out) {
    try {
        return JsonReader(json_str).read_document();
    } catch (const JsonError& e) {
        detail::log_input_error("from_json", "JSON text", e.what());
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

} // namespace ooxml_fidelity
