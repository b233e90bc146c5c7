#include "CodeCapture.h"

namespace Capture {

// ============================================================================
// Simple JSON Parser (flat objects only)
// ============================================================================

namespace {

struct Cursor {
    const char* p;
    const char* end;

    bool done() const { return p >= end; }
    char peek() const { return p < end ? *p : '\0'; }
};

void skip_whitespace(Cursor& c) {
    while (!c.done() && std::isspace(static_cast<unsigned char>(*c.p))) c.p++;
}

void append_utf8(std::string& out, unsigned long cp) {
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

unsigned long parse_hex4(Cursor& c) {
    if (c.end - c.p < 4) throw std::runtime_error("Truncated \\u escape");
    unsigned long value = 0;
    for (int i = 0; i < 4; ++i) {
        char h = *c.p++;
        value <<= 4;
        if (h >= '0' && h <= '9') value |= static_cast<unsigned long>(h - '0');
        else if (h >= 'a' && h <= 'f') value |= static_cast<unsigned long>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') value |= static_cast<unsigned long>(h - 'A' + 10);
        else throw std::runtime_error("Invalid \\u escape");
    }
    return value;
}

std::string parse_string(Cursor& c) {
    if (c.peek() != '"') throw std::runtime_error("Expected '\"'");
    c.p++; // Skip opening quote

    std::string result;
    while (!c.done() && *c.p != '"') {
        if (*c.p == '\\') {
            c.p++;
            if (c.done()) break;
            char e = *c.p++;
            switch (e) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case '/': result += '/'; break;
                case '\\': result += '\\'; break;
                case '"': result += '"'; break;
                case 'u': {
                    unsigned long cp = parse_hex4(c);
                    if (cp >= 0xD800 && cp <= 0xDBFF && c.end - c.p >= 6 && c.p[0] == '\\' && c.p[1] == 'u') {
                        c.p += 2;
                        unsigned long low = parse_hex4(c);
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            append_utf8(result, cp);
                            cp = low;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default: result += e;
            }
        } else {
            result += *c.p++;
        }
    }

    if (c.peek() != '"') throw std::runtime_error("Unterminated string");
    c.p++; // Skip closing quote

    return result;
}

double parse_number(Cursor& c) {
    const char* start = c.p;
    while (!c.done() && (std::isdigit(static_cast<unsigned char>(*c.p)) || *c.p == '-' || *c.p == '+' ||
                         *c.p == '.' || *c.p == 'e' || *c.p == 'E')) {
        c.p++;
    }
    std::string token(start, c.p);
    if (token.empty()) throw std::runtime_error("Expected number");
    try {
        size_t used = 0;
        double v = std::stod(token, &used);
        if (used != token.size()) throw std::runtime_error("Invalid number: " + token);
        return v;
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid number: " + token);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Number out of range: " + token);
    }
}

bool match_literal(Cursor& c, const char* lit) {
    size_t n = std::strlen(lit);
    if (static_cast<size_t>(c.end - c.p) < n || std::strncmp(c.p, lit, n) != 0) return false;
    c.p += n;
    return true;
}

// Skips a nested object or array, honouring strings.
void skip_container(Cursor& c) {
    char open = *c.p;
    char close = open == '{' ? '}' : ']';
    c.p++;

    int depth = 1;
    while (!c.done() && depth > 0) {
        char ch = *c.p;
        if (ch == '"') {
            parse_string(c);
            continue;
        }
        if (ch == open) depth++;
        else if (ch == close) depth--;
        else if (ch == '{' || ch == '[') {
            skip_container(c);
            continue;
        }
        c.p++;
    }
    if (depth != 0) throw std::runtime_error("Unterminated container");
}

JsonValue parse_value(Cursor& c) {
    skip_whitespace(c);
    JsonValue v;
    char ch = c.peek();
    if (ch == '"') {
        v.kind = JsonValue::Kind::String;
        v.text = parse_string(c);
    } else if (ch == '{' || ch == '[') {
        v.kind = JsonValue::Kind::Other;
        skip_container(c);
    } else if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
        v.kind = JsonValue::Kind::Number;
        v.number = parse_number(c);
    } else if (match_literal(c, "true")) {
        v.kind = JsonValue::Kind::Bool;
        v.boolean = true;
    } else if (match_literal(c, "false")) {
        v.kind = JsonValue::Kind::Bool;
        v.boolean = false;
    } else if (match_literal(c, "null")) {
        v.kind = JsonValue::Kind::Null;
    } else {
        throw std::runtime_error("Unexpected character in JSON value");
    }
    return v;
}

} // namespace

JsonObject parse_json_object(const std::string& json) {
    Cursor c{json.data(), json.data() + json.size()};
    JsonObject obj;

    skip_whitespace(c);
    if (c.peek() != '{') throw std::runtime_error("Expected '{'");
    c.p++;

    skip_whitespace(c);
    if (c.peek() == '}') {
        c.p++;
    } else {
        while (true) {
            skip_whitespace(c);
            std::string key = parse_string(c);
            skip_whitespace(c);
            if (c.peek() != ':') throw std::runtime_error("Expected ':' after key '" + key + "'");
            c.p++;
            obj[key] = parse_value(c);
            skip_whitespace(c);
            if (c.peek() == ',') {
                c.p++;
                continue;
            }
            if (c.peek() == '}') {
                c.p++;
                break;
            }
            throw std::runtime_error("Expected ',' or '}'");
        }
    }

    skip_whitespace(c);
    if (!c.done()) throw std::runtime_error("Trailing data after JSON object");
    return obj;
}

// ============================================================================
// Serialization
// ============================================================================

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, const std::string& value) {
    fields_.emplace_back(key, "\"" + json_escape(value) + "\"");
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, const char* value) {
    return add(key, std::string(value ? value : ""));
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, bool value) {
    fields_.emplace_back(key, value ? "true" : "false");
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, int value) {
    fields_.emplace_back(key, std::to_string(value));
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, long long value) {
    fields_.emplace_back(key, std::to_string(value));
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, std::uint64_t value) {
    fields_.emplace_back(key, std::to_string(value));
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.emplace_back(key, oss.str());
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add_null(const std::string& key) {
    fields_.emplace_back(key, "null");
    return *this;
}

JsonObjectBuilder& JsonObjectBuilder::add_raw(const std::string& key, const std::string& json) {
    fields_.emplace_back(key, json);
    return *this;
}

std::string JsonObjectBuilder::str() const {
    std::string out = "{";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) out += ",";
        out += "\"" + json_escape(fields_[i].first) + "\":" + fields_[i].second;
    }
    out += "}";
    return out;
}

}
