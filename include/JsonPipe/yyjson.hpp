#pragma once
#include <yyjson.h>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "parse.hpp"
#include "value.hpp"

namespace JsonPipe {

/// Builds a yyjson mutable tree for `v` inside `doc`; nullptr on allocation
/// failure.
inline yyjson_mut_val * ToYyjson(const Value & v, yyjson_mut_doc * doc) {
    switch(v.type()) {
    case ValueType::null:
        return yyjson_mut_null(doc);
    case ValueType::boolean:
        return yyjson_mut_bool(doc, v.as_bool());
    case ValueType::number:
        return yyjson_mut_real(doc, v.as_number());
    case ValueType::string:
        return yyjson_mut_strncpy(doc, v.as_string().data(), v.as_string().size());
    case ValueType::array: {
        yyjson_mut_val * arr = yyjson_mut_arr(doc);
        if(!arr) return nullptr;
        for(const Value & el : v.as_array()) {
            yyjson_mut_val * child = ToYyjson(el, doc);
            if(!child || !yyjson_mut_arr_add_val(arr, child)) {
                return nullptr;
            }
        }
        return arr;
    }
    case ValueType::object: {
        yyjson_mut_val * obj = yyjson_mut_obj(doc);
        if(!obj) return nullptr;
        for(const Member & m : v.as_object().members()) {
            yyjson_mut_val * key_node = yyjson_mut_strncpy(doc, m.key.data(), m.key.size());
            yyjson_mut_val * child = ToYyjson(m.value, doc);
            if(!key_node || !child || !yyjson_mut_obj_add(obj, key_node, child)) {
                return nullptr;
            }
        }
        return obj;
    }
    }
    return nullptr;
}

inline Value FromYyjson(yyjson_val * val) {
    if(!val || yyjson_is_null(val)) {
        return Value();
    }
    if(yyjson_is_bool(val)) {
        return Value(yyjson_get_bool(val) != 0);
    }
    if(yyjson_is_num(val)) {
        if(yyjson_is_real(val)) {
            return Value(yyjson_get_real(val));
        } else if(yyjson_is_sint(val)) {
            return Value(static_cast<double>(yyjson_get_sint(val)));
        }
        return Value(static_cast<double>(yyjson_get_uint(val)));
    }
    if(yyjson_is_str(val)) {
        return Value(std::string(yyjson_get_str(val), yyjson_get_len(val)));
    }
    if(yyjson_is_arr(val)) {
        Array out;
        out.reserve(yyjson_arr_size(val));
        yyjson_arr_iter it;
        yyjson_arr_iter_init(val, &it);
        while(yyjson_val * el = yyjson_arr_iter_next(&it)) {
            out.push_back(FromYyjson(el));
        }
        return Value(std::move(out));
    }
    Object out;
    yyjson_obj_iter it;
    yyjson_obj_iter_init(val, &it);
    while(yyjson_val * key = yyjson_obj_iter_next(&it)) {
        out.set(std::string(yyjson_get_str(key), yyjson_get_len(key)), FromYyjson(yyjson_obj_iter_get_val(key)));
    }
    return Value(std::move(out));
}

/// Whole-document parse through yyjson, for comparison with streamed output.
inline DocumentResult YyjsonParse(std::string_view json) {
    yyjson_read_err err;
    yyjson_doc * doc = yyjson_read_opts(const_cast<char *>(json.data()), json.size(), 0, nullptr, &err);
    if(!doc) {
        return Failure(StreamError::MALFORMED_INPUT, err.msg ? std::string(err.msg) : std::string());
    }
    Value v = FromYyjson(yyjson_doc_get_root(doc));
    yyjson_doc_free(doc);
    return v;
}

/// Compact JSON through yyjson's writer.
inline std::string YyjsonWrite(const Value & v) {
    yyjson_mut_doc * doc = yyjson_mut_doc_new(nullptr);
    if(!doc) {
        return {};
    }
    std::string out;
    if(yyjson_mut_val * root = ToYyjson(v, doc)) {
        yyjson_mut_doc_set_root(doc, root);
        std::size_t len = 0;
        if(char * json = yyjson_mut_write(doc, 0, &len)) {
            out.assign(json, len);
            std::free(json);
        }
    }
    yyjson_mut_doc_free(doc);
    return out;
}

} // namespace JsonPipe
