/**
 * JSON Reader Implementation — recursive descent with position tracking
 */

#include "io/json_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace wormsim {

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

static std::runtime_error type_mismatch(const char* wanted, JsonType got) {
    return std::runtime_error(std::string("JsonValue: expected ") + wanted +
                              ", found " + json_type_name(got));
}

bool JsonValue::as_bool() const {
    if (type != JsonType::BOOL) throw type_mismatch("bool", type);
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type != JsonType::NUMBER) throw type_mismatch("number", type);
    return num_val_;
}

int JsonValue::as_int() const {
    double v = as_number();
    if (v != static_cast<double>(static_cast<long long>(v))) {
        throw std::runtime_error("JsonValue: expected integer, found " + std::to_string(v));
    }
    return static_cast<int>(v);
}

const std::string& JsonValue::as_string() const {
    if (type != JsonType::STRING) throw type_mismatch("string", type);
    return str_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (type != JsonType::OBJECT) return null_value();
    auto it = obj_map_.find(key);
    return it == obj_map_.end() ? null_value() : it->second;
}

bool JsonValue::has(const std::string& key) const {
    return type == JsonType::OBJECT && obj_map_.count(key) > 0;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (type != JsonType::ARRAY || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

size_t JsonValue::size() const {
    if (type == JsonType::ARRAY) return arr_val_.size();
    if (type == JsonType::OBJECT) return obj_map_.size();
    return 0;
}

bool JsonValue::add_member(const std::string& key, JsonValue&& val) {
    auto [it, inserted] = obj_map_.emplace(key, std::move(val));
    if (inserted) keys_.push_back(key);
    return inserted;
}

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_whitespace();
        JsonValue val = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) {
            throw error("unexpected content after document");
        }
        return val;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;

    char peek() const {
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    char advance() {
        if (pos_ >= src_.size()) throw error("unexpected end of input");
        char c = src_[pos_++];
        if (c == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        return c;
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("expected '") + c + "', got '" + got + "'");
        }
    }

    bool consume_literal(const char* word) {
        std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0) return false;
        for (size_t i = 0; i < w.size(); i++) advance();
        return true;
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            advance();
        }
    }

    JsonParseError error(const std::string& msg) const {
        return JsonParseError(msg, line_, column_);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '"') return JsonValue(parse_string());
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (consume_literal("true")) return JsonValue(true);
        if (consume_literal("false")) return JsonValue(false);
        if (consume_literal("null")) return JsonValue();

        if (c == '\0') throw error("unexpected end of input");
        throw error(std::string("unexpected character '") + c + "'");
    }

    void append_utf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= src_.size()) throw error("unterminated string");
            char c = advance();
            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }

            char esc = advance();
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    std::string hex;
                    for (int i = 0; i < 4; i++) {
                        char h = advance();
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw error("invalid \\u escape");
                        }
                        hex += h;
                    }
                    append_utf8(result, std::strtoul(hex.c_str(), nullptr, 16));
                    break;
                }
                default:
                    throw error(std::string("unknown escape \\") + esc);
            }
        }
        return result;
    }

    void digits(const char* what) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error(std::string("expected digit ") + what);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') advance();

        if (peek() == '0') {
            advance();
        } else {
            digits("in number");
        }
        if (peek() == '.') {
            advance();
            digits("after decimal point");
        }
        if (peek() == 'e' || peek() == 'E') {
            advance();
            if (peek() == '+' || peek() == '-') advance();
            digits("in exponent");
        }

        std::string numstr = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(numstr.c_str(), nullptr));
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj;
        obj.set_object();

        skip_whitespace();
        if (peek() == '}') {
            advance();
            return obj;
        }

        while (true) {
            skip_whitespace();
            int key_line = line_;
            int key_column = column_;
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            JsonValue val = parse_value();
            if (!obj.add_member(key, std::move(val))) {
                throw JsonParseError("duplicate key \"" + key + "\"", key_line, key_column);
            }

            skip_whitespace();
            if (peek() != ',') break;
            advance();
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr;
        arr.set_array();

        skip_whitespace();
        if (peek() == ']') {
            advance();
            return arr;
        }

        while (true) {
            arr.add_element(parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            advance();
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open scenario file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

}  // namespace wormsim
