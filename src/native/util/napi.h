/* Copyright (C) 2016 NooBaa */
#pragma once

#include <climits>
#include <node_api.h>

#ifdef __cplusplus
    #include <napi.h>
#endif

#include "buf.h"

namespace dataid
{

// create a Napi::Error from errno value, with the libuv error name as code
Napi::Error napi_sys_error(Napi::Env env, std::string msg = "", int errno_val = errno);

// create a Napi::Error from a library exception, keeps the errno code of source errors
Napi::Error napi_dataid_error(Napi::Env env, const std::exception& e);

// single value getters

inline bool
napi_is_defined(Napi::Value v)
{
    return !v.IsEmpty() && !v.IsUndefined() && !v.IsNull();
}

inline int32_t
napi_get_i32(Napi::Value v)
{
    return v.As<Napi::Number>().Int32Value();
}

inline std::string
napi_get_str(Napi::Value v)
{
    return v.As<Napi::String>().Utf8Value();
}

inline uint64_t
napi_get_u64_hex(Napi::Value v)
{
    auto s = napi_get_str(v);
    try {
        return std::stoull(s, nullptr, 16);
    } catch (const std::exception& e) {
        throw Napi::Error::New(v.Env(),
            std::string("Invalid u64 hex string '") + s + "': " + e.what());
    }
}

// object property getters with default value

inline int32_t
napi_get_i32_or(Napi::Object obj, const char* key, int32_t default_value)
{
    auto v = obj.Get(key);
    if (!v.IsNumber()) return default_value;
    return napi_get_i32(v);
}

inline bool
napi_get_bool_or(Napi::Object obj, const char* key, bool default_value)
{
    auto v = obj.Get(key);
    if (!v.IsBoolean()) return default_value;
    return v.As<Napi::Boolean>().Value();
}

inline uint64_t
napi_get_u64_hex_or(Napi::Object obj, const char* key, uint64_t default_value)
{
    auto v = obj.Get(key);
    if (!v.IsString()) return default_value;
    return napi_get_u64_hex(v);
}

// length of a node buffer as an int, throws RangeError for buffers of 2GB and more
inline int
napi_buffer_length(Napi::Env env, const Napi::Buffer<uint8_t>& buf, const char* func)
{
    if (buf.Length() > static_cast<size_t>(INT_MAX)) {
        throw Napi::RangeError::New(env, XSTR() << func << ": buffer too large " << DVAL(buf.Length()));
    }
    return static_cast<int>(buf.Length());
}

// copies a Buf into a new node buffer
inline Napi::Buffer<uint8_t>
napi_new_buffer(Napi::Env env, const Buf& buf)
{
    return Napi::Buffer<uint8_t>::Copy(env, buf.data(), buf.length());
}

} // namespace dataid
