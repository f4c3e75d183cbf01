/*
 * Minimal JSON value implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/util/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace agentworker {

Json::Json() = default;
Json::Json(std::nullptr_t) {}
Json::Json(bool b) : m_type(Type::Bool), m_bool(b) {}
Json::Json(int n) : m_type(Type::Number), m_number(n) {}
Json::Json(long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
Json::Json(long long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
Json::Json(unsigned n) : m_type(Type::Number), m_number(n) {}
Json::Json(unsigned long n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
Json::Json(double n) : m_type(Type::Number), m_number(n) {}
Json::Json(const char* s) : m_type(Type::String), m_string(s ? s : "") {}
Json::Json(std::string s) : m_type(Type::String), m_string(std::move(s)) {}

Json Json::array() { Json j; j.m_type = Type::Array; return j; }
Json Json::object() { Json j; j.m_type = Type::Object; return j; }

bool Json::as_bool(bool def) const { return m_type == Type::Bool ? m_bool : def; }
double Json::as_number(double def) const { return m_type == Type::Number ? m_number : def; }
std::int64_t Json::as_int64(std::int64_t def) const {
    return m_type == Type::Number ? static_cast<std::int64_t>(std::llround(m_number)) : def;
}
std::string Json::as_string(const std::string& def) const { return m_type == Type::String ? m_string : def; }

const Json::Array& Json::items() const {
    static const Array empty;
    return m_type == Type::Array ? m_array : empty;
}

const Json::Object& Json::members() const {
    static const Object empty;
    return m_type == Type::Object ? m_object : empty;
}

bool Json::contains(const std::string& key) const {
    if (m_type != Type::Object) return false;
    for (auto& m : m_object) if (m.first == key) return true;
    return false;
}

const Json& Json::operator[](const std::string& key) const {
    static const Json null_value;
    if (m_type != Type::Object) return null_value;
    for (auto& m : m_object) if (m.first == key) return m.second;
    return null_value;
}

Json& Json::set(const std::string& key, Json value) {
    if (m_type == Type::Null) m_type = Type::Object;
    for (auto& m : m_object) {
        if (m.first == key) { m.second = std::move(value); return *this; }
    }
    m_object.emplace_back(key, std::move(value));
    return *this;
}

Json& Json::push_back(Json value) {
    if (m_type == Type::Null) m_type = Type::Array;
    m_array.push_back(std::move(value));
    return *this;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

void Json::dump_to(std::string& out) const {
    switch (m_type) {
        case Type::Null: out += "null"; break;
        case Type::Bool: out += m_bool ? "true" : "false"; break;
        case Type::Number: {
            if (!std::isfinite(m_number)) { out += "null"; break; }
            char buf[32];
            if (m_number == std::floor(m_number) && std::fabs(m_number) < 9.0e15) std::snprintf(buf, sizeof(buf), "%.0f", m_number);
            else std::snprintf(buf, sizeof(buf), "%.17g", m_number);
            out += buf;
            break;
        }
        case Type::String: out += '"'; out += json_escape(m_string); out += '"'; break;
        case Type::Array:
            out += '[';
            for (size_t i = 0; i < m_array.size(); ++i) {
                if (i) out += ',';
                m_array[i].dump_to(out);
            }
            out += ']';
            break;
        case Type::Object:
            out += '{';
            for (size_t i = 0; i < m_object.size(); ++i) {
                if (i) out += ',';
                out += '"'; out += json_escape(m_object[i].first); out += "\":";
                m_object[i].second.dump_to(out);
            }
            out += '}';
            break;
    }
}

std::string Json::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

namespace {

constexpr int kMaxDepth = 64;

class Parser {
public:
    explicit Parser(const std::string& s) : m_s(s) {}

    bool document(Json& out) {
        skip_ws();
        if (!value(out, 0)) return false;
        skip_ws();
        return m_pos == m_s.size();
    }

private:
    void skip_ws() {
        while (m_pos < m_s.size() && (m_s[m_pos] == ' ' || m_s[m_pos] == '\t' || m_s[m_pos] == '\n' || m_s[m_pos] == '\r')) ++m_pos;
    }

    bool literal(const char* word) {
        size_t n = std::char_traits<char>::length(word);
        if (m_s.compare(m_pos, n, word) != 0) return false;
        m_pos += n;
        return true;
    }

    bool value(Json& out, int depth) {
        if (depth > kMaxDepth || m_pos >= m_s.size()) return false;
        char c = m_s[m_pos];
        if (c == '{') return object(out, depth);
        if (c == '[') return array(out, depth);
        if (c == '"') { std::string s; if (!string(s)) return false; out = Json(std::move(s)); return true; }
        if (c == 't') { if (!literal("true")) return false; out = Json(true); return true; }
        if (c == 'f') { if (!literal("false")) return false; out = Json(false); return true; }
        if (c == 'n') { if (!literal("null")) return false; out = Json(); return true; }
        return number(out);
    }

    bool number(Json& out) {
        size_t start = m_pos;
        if (m_s[m_pos] == '-') ++m_pos;
        bool digits = false;
        while (m_pos < m_s.size() && (std::isdigit(static_cast<unsigned char>(m_s[m_pos])) || m_s[m_pos] == '.' || m_s[m_pos] == 'e' || m_s[m_pos] == 'E' || m_s[m_pos] == '+' || m_s[m_pos] == '-')) {
            if (std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) digits = true;
            ++m_pos;
        }
        if (!digits) return false;
        std::string text = m_s.substr(start, m_pos - start);
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) return false;
        out = Json(v);
        return true;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) out.push_back(static_cast<char>(cp));
        else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
        else if (cp < 0x10000) { out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
        else { out.push_back(static_cast<char>(0xF0 | (cp >> 18))); out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    }

    bool hex4(unsigned& cp) {
        if (m_pos + 4 > m_s.size()) return false;
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = m_s[m_pos++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    bool string(std::string& out) {
        ++m_pos; // opening quote
        while (m_pos < m_s.size()) {
            char c = m_s[m_pos++];
            if (c == '"') return true;
            if (c != '\\') { out.push_back(c); continue; }
            if (m_pos >= m_s.size()) return false;
            char e = m_s[m_pos++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = 0;
                    if (!hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && m_s.compare(m_pos, 2, "\\u") == 0) {
                        m_pos += 2;
                        unsigned low = 0;
                        if (!hex4(low)) return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return false;
            }
        }
        return false;
    }

    bool array(Json& out, int depth) {
        ++m_pos;
        out = Json::array();
        skip_ws();
        if (m_pos < m_s.size() && m_s[m_pos] == ']') { ++m_pos; return true; }
        while (true) {
            skip_ws();
            Json item;
            if (!value(item, depth + 1)) return false;
            out.push_back(std::move(item));
            skip_ws();
            if (m_pos >= m_s.size()) return false;
            if (m_s[m_pos] == ',') { ++m_pos; continue; }
            if (m_s[m_pos] == ']') { ++m_pos; return true; }
            return false;
        }
    }

    bool object(Json& out, int depth) {
        ++m_pos;
        out = Json::object();
        skip_ws();
        if (m_pos < m_s.size() && m_s[m_pos] == '}') { ++m_pos; return true; }
        while (true) {
            skip_ws();
            if (m_pos >= m_s.size() || m_s[m_pos] != '"') return false;
            std::string key;
            if (!string(key)) return false;
            skip_ws();
            if (m_pos >= m_s.size() || m_s[m_pos] != ':') return false;
            ++m_pos;
            skip_ws();
            Json item;
            if (!value(item, depth + 1)) return false;
            out.set(key, std::move(item));
            skip_ws();
            if (m_pos >= m_s.size()) return false;
            if (m_s[m_pos] == ',') { ++m_pos; continue; }
            if (m_s[m_pos] == '}') { ++m_pos; return true; }
            return false;
        }
    }

    const std::string& m_s;
    size_t m_pos = 0;
};

} // namespace

std::optional<Json> Json::parse(const std::string& text) {
    Json out;
    Parser p(text);
    if (!p.document(out)) return std::nullopt;
    return out;
}

} // namespace agentworker
