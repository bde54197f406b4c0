#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace JsonPipe {

class Value;
struct Member;

using Array = std::vector<Value>;

/// Insertion-ordered JSON object. Keys are unique: setting an existing key
/// replaces its value in place.
class Object {
public:
    Object() = default;
    Object(std::initializer_list<Member> members);

    std::size_t size() const;
    bool empty() const;

    const Value * find(std::string_view key) const;
    Value * find(std::string_view key);
    bool contains(std::string_view key) const;

    void set(std::string key, Value v);
    bool erase(std::string_view key);

    const std::vector<Member> & members() const;

    // Member order is not significant
    bool operator==(const Object & other) const;

private:
    std::vector<Member> m_members;
};

enum class ValueType : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object
};

constexpr std::string_view value_type_to_string(ValueType t) {
    switch(t) {
    case ValueType::null   : return "null"; break;
    case ValueType::boolean: return "boolean"; break;
    case ValueType::number : return "number"; break;
    case ValueType::string : return "string"; break;
    case ValueType::array  : return "array"; break;
    case ValueType::object : return "object"; break;
    }
    return "N/A";
}

/// An assembled JSON value. Numbers are doubles unless the assembler was
/// asked to keep them as their literal text.
class Value {
public:
    using Storage = std::variant<std::nullptr_t, bool, double, std::string, Array, Object>;

    Value();
    Value(std::nullptr_t);
    Value(bool b);
    template<class N>
        requires (std::is_arithmetic_v<N> && !std::is_same_v<N, bool>)
    Value(N n): m_data(static_cast<double>(n)) {}
    Value(std::string s);
    Value(std::string_view s);
    Value(const char * s);
    Value(Array a);
    Value(Object o);

    ValueType type() const;

    bool is_null() const;
    bool is_bool() const;
    bool is_number() const;
    bool is_string() const;
    bool is_array() const;
    bool is_object() const;

    // Accessors require the matching type()
    bool as_bool() const;
    double as_number() const;
    const std::string & as_string() const;
    const Array & as_array() const;
    Array & as_array();
    const Object & as_object() const;
    Object & as_object();

    // Member lookup; nullptr when this is not an object or the key is absent
    const Value * find(std::string_view key) const;

    const Storage & storage() const;

    bool operator==(const Value & other) const;

private:
    Storage m_data;
};

struct Member {
    std::string key;
    Value       value;
};


inline Object::Object(std::initializer_list<Member> members) {
    for(const Member & m : members) {
        set(m.key, m.value);
    }
}

inline std::size_t Object::size() const {
    return m_members.size();
}

inline bool Object::empty() const {
    return m_members.empty();
}

inline const Value * Object::find(std::string_view key) const {
    for(const Member & m : m_members) {
        if(m.key == key) {
            return &m.value;
        }
    }
    return nullptr;
}

inline Value * Object::find(std::string_view key) {
    for(Member & m : m_members) {
        if(m.key == key) {
            return &m.value;
        }
    }
    return nullptr;
}

inline bool Object::contains(std::string_view key) const {
    return find(key) != nullptr;
}

inline void Object::set(std::string key, Value v) {
    if(Value * existing = find(key)) {
        *existing = std::move(v);
        return;
    }
    m_members.push_back(Member{std::move(key), std::move(v)});
}

inline bool Object::erase(std::string_view key) {
    for(auto it = m_members.begin(); it != m_members.end(); ++it) {
        if(it->key == key) {
            m_members.erase(it);
            return true;
        }
    }
    return false;
}

inline const std::vector<Member> & Object::members() const {
    return m_members;
}

inline bool Object::operator==(const Object & other) const {
    if(m_members.size() != other.m_members.size()) {
        return false;
    }
    for(const Member & m : m_members) {
        const Value * v = other.find(m.key);
        if(!v || !(*v == m.value)) {
            return false;
        }
    }
    return true;
}


inline Value::Value(): m_data(nullptr) {}
inline Value::Value(std::nullptr_t): m_data(nullptr) {}
inline Value::Value(bool b): m_data(b) {}
inline Value::Value(std::string s): m_data(std::move(s)) {}
inline Value::Value(std::string_view s): m_data(std::string(s)) {}
inline Value::Value(const char * s): m_data(std::string(s)) {}
inline Value::Value(Array a): m_data(std::move(a)) {}
inline Value::Value(Object o): m_data(std::move(o)) {}

inline ValueType Value::type() const {
    return static_cast<ValueType>(m_data.index());
}

inline bool Value::is_null() const   { return type() == ValueType::null; }
inline bool Value::is_bool() const   { return type() == ValueType::boolean; }
inline bool Value::is_number() const { return type() == ValueType::number; }
inline bool Value::is_string() const { return type() == ValueType::string; }
inline bool Value::is_array() const  { return type() == ValueType::array; }
inline bool Value::is_object() const { return type() == ValueType::object; }

inline bool Value::as_bool() const {
    return std::get<bool>(m_data);
}
inline double Value::as_number() const {
    return std::get<double>(m_data);
}
inline const std::string & Value::as_string() const {
    return std::get<std::string>(m_data);
}
inline const Array & Value::as_array() const {
    return std::get<Array>(m_data);
}
inline Array & Value::as_array() {
    return std::get<Array>(m_data);
}
inline const Object & Value::as_object() const {
    return std::get<Object>(m_data);
}
inline Object & Value::as_object() {
    return std::get<Object>(m_data);
}

inline const Value * Value::find(std::string_view key) const {
    if(const Object * o = std::get_if<Object>(&m_data)) {
        return o->find(key);
    }
    return nullptr;
}

inline const Value::Storage & Value::storage() const {
    return m_data;
}

inline bool Value::operator==(const Value & other) const {
    return m_data == other.m_data;
}

} // namespace JsonPipe
