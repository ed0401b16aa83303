/* Copyright (C) 2016 NooBaa */
#include "util/napi.h"

namespace dataid
{

void b58_napi(Napi::Env env, Napi::Object exports);
void splitter_napi(Napi::Env env, Napi::Object exports);
void data_id_napi(Napi::Env env, Napi::Object exports);

/**
 * Registers the native bindings (base58, chunk splitter, data id)
 * onto the module exports object.
 */
Napi::Object
dataid_native_napi(Napi::Env env, Napi::Object exports)
{
    b58_napi(env, exports);
    splitter_napi(env, exports);
    data_id_napi(env, exports);
    return exports;
}

NODE_API_MODULE(dataid_native, dataid_native_napi)
} // namespace dataid
