/*
 * Minimal JSON value - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentworker {

// Hand-written JSON document used by the control-plane codec and the IPC frames.
// Objects keep insertion order; numbers are doubles (timestamps in ms fit).
class Json {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    using Array = std::vector<Json>;
    using Member = std::pair<std::string, Json>;
    using Object = std::vector<Member>;

    Json();
    Json(std::nullptr_t);
    Json(bool b);
    Json(int n);
    Json(long n);
    Json(long long n);
    Json(unsigned n);
    Json(unsigned long n);
    Json(double n);
    Json(const char* s);
    Json(std::string s);

    static Json array();
    static Json object();
    static std::optional<Json> parse(const std::string& text);

    Type type() const { return m_type; }
    bool is_null() const { return m_type == Type::Null; }
    bool is_bool() const { return m_type == Type::Bool; }
    bool is_number() const { return m_type == Type::Number; }
    bool is_string() const { return m_type == Type::String; }
    bool is_array() const { return m_type == Type::Array; }
    bool is_object() const { return m_type == Type::Object; }

    bool as_bool(bool def = false) const;
    double as_number(double def = 0.0) const;
    std::int64_t as_int64(std::int64_t def = 0) const;
    std::string as_string(const std::string& def = "") const;
    const Array& items() const;
    const Object& members() const;

    bool contains(const std::string& key) const;
    // Missing keys read as null.
    const Json& operator[](const std::string& key) const;
    // Turns a null value into an object; replaces an existing key.
    Json& set(const std::string& key, Json value);
    Json& push_back(Json value);

    std::string dump() const;

private:
    void dump_to(std::string& out) const;

    Type m_type = Type::Null;
    bool m_bool = false;
    double m_number = 0.0;
    std::string m_string;
    Array m_array;
    Object m_object;
};

std::string json_escape(const std::string& s);

} // namespace agentworker
