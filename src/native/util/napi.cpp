/* Copyright (C) 2016 NooBaa */
#include "napi.h"

#include <uv.h>

#include "../chunk/source.h"

namespace dataid
{

Napi::Error
napi_sys_error(Napi::Env env, std::string msg, int errno_val)
{
    const char* err_code = uv_err_name(uv_translate_sys_error(errno_val));
    const char* err_desc = uv_strerror(uv_translate_sys_error(errno_val));
    if (msg.empty()) {
        msg = err_desc;
    } else {
        msg += ": ";
        msg += err_desc;
    }
    auto err = Napi::Error::New(env, msg);
    err.Set("code", Napi::String::New(env, err_code));
    return err;
}

Napi::Error
napi_dataid_error(Napi::Env env, const std::exception& e)
{
    int errno_val = 0;
    if (auto open_err = dynamic_cast<const SourceOpenError*>(&e)) {
        errno_val = open_err->err();
    } else if (auto read_err = dynamic_cast<const SourceReadError*>(&e)) {
        errno_val = read_err->err();
    }
    auto err = Napi::Error::New(env, e.what());
    if (errno_val) {
        err.Set("code", Napi::String::New(env, uv_err_name(uv_translate_sys_error(errno_val))));
    }
    return err;
}

} // namespace dataid
