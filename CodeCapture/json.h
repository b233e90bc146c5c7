#ifndef _CodeCapture_json_h_
#define _CodeCapture_json_h_

namespace Capture {

// ============================================================================
// Minimal JSON support for the HTTP envelope and the config file
// ============================================================================

// Scalar member of a flat JSON object. Nested objects and arrays are
// skipped by the reader and show up as Kind::Other.
struct JsonValue {
    enum class Kind { Null, Bool, Number, String, Other };

    Kind kind = Kind::Null;
    bool boolean = false;
    double number = 0.0;
    std::string text;

    bool is_string() const { return kind == Kind::String; }
    bool is_bool() const { return kind == Kind::Bool; }
    bool is_number() const { return kind == Kind::Number; }
    bool is_null() const { return kind == Kind::Null; }
};

using JsonObject = std::map<std::string, JsonValue>;

// Parses a top-level JSON object. Throws std::runtime_error on malformed input.
JsonObject parse_json_object(const std::string& json);

// Builds one JSON object; nested objects are added pre-serialized via add_raw.
class JsonObjectBuilder {
public:
    JsonObjectBuilder& add(const std::string& key, const std::string& value);
    JsonObjectBuilder& add(const std::string& key, const char* value);
    JsonObjectBuilder& add(const std::string& key, bool value);
    JsonObjectBuilder& add(const std::string& key, int value);
    JsonObjectBuilder& add(const std::string& key, long long value);
    JsonObjectBuilder& add(const std::string& key, std::uint64_t value);
    JsonObjectBuilder& add(const std::string& key, double value);
    JsonObjectBuilder& add_null(const std::string& key);
    JsonObjectBuilder& add_raw(const std::string& key, const std::string& json);

    std::string str() const;

private:
    std::vector<std::pair<std::string, std::string>> fields_;
};

}

#endif
