#pragma once

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

#include "value.hpp"

namespace JsonPipe {

namespace serializer_detail {

inline void WriteEscaped(std::string & out, std::string_view s) {
    out.push_back('"');
    const char * p = s.data();
    const char * e = s.data() + s.size();
    while(p < e) {
        // Safe run
        const char * run = p;
        while(run < e) {
            unsigned char uc = static_cast<unsigned char>(*run);
            if(*run == '"' || *run == '\\' || uc < 0x20) break;
            ++run;
        }
        out.append(p, run);
        p = run;
        if(p == e) break;

        unsigned char uc = static_cast<unsigned char>(*p++);
        switch(uc) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b";  break;
        case '\f': out += "\\f";  break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default: {
            constexpr char hex[] = "0123456789abcdef";
            out += "\\u00";
            out.push_back(hex[(uc >> 4) & 0xF]);
            out.push_back(hex[uc & 0xF]);
            break;
        }
        }
    }
    out.push_back('"');
}

inline void WriteNumber(std::string & out, double d) {
    // JSON has no NaN/Infinity
    if(!std::isfinite(d)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if(ec != std::errc()) {
        out += "null";
        return;
    }
    out.append(buf, end);
}

inline void WriteValue(std::string & out, const Value & v) {
    switch(v.type()) {
    case ValueType::null:
        out += "null";
        break;
    case ValueType::boolean:
        out += v.as_bool() ? "true" : "false";
        break;
    case ValueType::number:
        WriteNumber(out, v.as_number());
        break;
    case ValueType::string:
        WriteEscaped(out, v.as_string());
        break;
    case ValueType::array: {
        out.push_back('[');
        bool first = true;
        for(const Value & el : v.as_array()) {
            if(!first) out.push_back(',');
            first = false;
            WriteValue(out, el);
        }
        out.push_back(']');
        break;
    }
    case ValueType::object: {
        out.push_back('{');
        bool first = true;
        for(const Member & m : v.as_object().members()) {
            if(!first) out.push_back(',');
            first = false;
            WriteEscaped(out, m.key);
            out.push_back(':');
            WriteValue(out, m.value);
        }
        out.push_back('}');
        break;
    }
    }
}

} // namespace serializer_detail

/// Compact JSON text, members in insertion order.
inline std::string Serialize(const Value & v) {
    std::string out;
    serializer_detail::WriteValue(out, v);
    return out;
}

inline void Serialize(const Value & v, std::string & out) {
    serializer_detail::WriteValue(out, v);
}

} // namespace JsonPipe
