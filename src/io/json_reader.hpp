/**
 * JSON Reader — recursive-descent parser for scenario files.
 *
 * Produces a tree of JsonValue nodes. Objects remember member order so
 * that anything iterating a scenario (station lists, sample tables)
 * sees the file's order. Parse errors report line and column.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("scenario.json");
 *   double horizon = root["horizon_s"].get_number(86400.0);
 *   int planes = root["constellation"]["walker"]["planes"].as_int();
 */

#ifndef WORMSIM_JSON_READER_HPP
#define WORMSIM_JSON_READER_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace wormsim {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

const char* json_type_name(JsonType type);

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& message, int line, int column)
        : std::runtime_error("JSON parse error at line " + std::to_string(line) +
                             ", column " + std::to_string(column) + ": " + message),
          line_(line), column_(column) {}

    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Strict accessors (throw std::runtime_error on type mismatch)
    bool as_bool() const;
    double as_number() const;
    int as_int() const;
    const std::string& as_string() const;

    // Lenient accessors (default when absent or of another type)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    // Object access; missing keys yield a null value
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;

    /** Member names in file order. */
    const std::vector<std::string>& keys() const { return keys_; }

    // Array access; out-of-range indices yield a null value
    const JsonValue& operator[](size_t index) const;
    const std::vector<JsonValue>& as_array() const { return arr_val_; }

    size_t size() const;

    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }

    /** @return false when the key already exists (value is kept unchanged). */
    bool add_member(const std::string& key, JsonValue&& val);
    void add_element(JsonValue&& val) { arr_val_.push_back(std::move(val)); }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> obj_map_;
    std::vector<std::string> keys_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a complete JSON document. Trailing content and duplicate
     * object keys are errors.
     * @throws JsonParseError
     */
    static JsonValue parse(const std::string& json);

    /**
     * @throws std::runtime_error if the file cannot be read
     * @throws JsonParseError on malformed content
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace wormsim

#endif  // WORMSIM_JSON_READER_HPP
