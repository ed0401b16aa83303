/* Copyright (C) 2016 NooBaa */
#include "../util/b58.h"
#include "../util/common.h"
#include "../util/napi.h"

namespace dataid
{

static Napi::Value _b58_encode(const Napi::CallbackInfo& info);
static Napi::Value _b58_decode(const Napi::CallbackInfo& info);

void
b58_napi(Napi::Env env, Napi::Object exports)
{
    exports["b58_encode"] = Napi::Function::New(env, _b58_encode);
    exports["b58_decode"] = Napi::Function::New(env, _b58_decode);
}

static Napi::Value
_b58_encode(const Napi::CallbackInfo& info)
{
    if (!info[0].IsBuffer()) {
        throw Napi::TypeError::New(info.Env(), "b58_encode: 1st argument should be Buffer");
    }
    auto buf = info[0].As<Napi::Buffer<uint8_t>>();
    const int input_len = napi_buffer_length(info.Env(), buf, "b58_encode");

    int output_len = b58_encode_len(input_len);
    if (output_len < 0) {
        throw Napi::Error::New(info.Env(), XSTR() << "b58_encode: unsupported length " << input_len);
    }
    std::unique_ptr<uint8_t[]> output(new uint8_t[output_len]);

    int r = b58_encode(buf.Data(), input_len, output.get());
    if (r < 0) {
        throw Napi::Error::New(info.Env(), XSTR() << "b58_encode: failed " << r);
    }

    return Napi::String::New(info.Env(), reinterpret_cast<char*>(output.get()), r);
}

static Napi::Value
_b58_decode(const Napi::CallbackInfo& info)
{
    std::string str;
    int input_len = 0;
    const uint8_t* input = 0;

    if (info[0].IsBuffer()) {
        auto buf = info[0].As<Napi::Buffer<uint8_t>>();
        input = buf.Data();
        input_len = napi_buffer_length(info.Env(), buf, "b58_decode");

    } else if (info[0].IsString()) {
        str = info[0].As<Napi::String>().Utf8Value();
        input = reinterpret_cast<const uint8_t*>(str.data());
        input_len = str.length() > 16 ? -1 : static_cast<int>(str.length());

    } else {
        throw Napi::TypeError::New(info.Env(), "b58_decode: 1st argument should be Buffer|String");
    }

    int output_len = b58_decode_len(input_len);
    if (output_len < 0) {
        throw Napi::Error::New(info.Env(), XSTR() << "b58_decode: unsupported length " << input_len);
    }
    std::unique_ptr<uint8_t[]> output(new uint8_t[output_len]);

    int r = b58_decode(input, input_len, output.get());
    if (r < 0) {
        throw Napi::Error::New(info.Env(), XSTR() << "b58_decode: failed " << r);
    }

    return Napi::Buffer<uint8_t>::Copy(info.Env(), output.get(), r);
}

} // namespace dataid
