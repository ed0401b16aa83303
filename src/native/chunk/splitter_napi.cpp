/* Copyright (C) 2016 NooBaa */
#include "../util/napi.h"
#include "splitter.h"

namespace dataid
{

#define SPLITTER_JS_SIGNATURE "function chunk_splitter(buffer, options?, callback?)"

static Napi::Value _chunk_splitter(const Napi::CallbackInfo& info);
static SplitterConfig _splitter_config(Napi::Env env, Napi::Value options);
static GearParams _gear_params(Napi::Value val, const GearParams& defaults);

struct SplitResult
{
    std::vector<int> lengths;
    // empty unless calc_sha256 was requested
    Buf sha256;
};

static SplitResult _split(const Buf& input, const SplitterConfig& config);
static Napi::Value _splitter_result(Napi::Env env, const SplitResult& res);

void
splitter_napi(Napi::Env env, Napi::Object exports)
{
    exports["chunk_splitter"] = Napi::Function::New(env, _chunk_splitter);
}

class SplitterWorker : public Napi::AsyncWorker
{
public:
    SplitterWorker(Napi::Function callback, const Buf& input, const SplitterConfig& config)
        : Napi::AsyncWorker(callback)
        , _input(input)
        , _config(config)
    {
    }

    virtual void Execute()
    {
        try {
            _result = _split(_input, _config);
        } catch (const std::exception& e) {
            SetError(e.what());
        }
    }

    virtual void OnOK()
    {
        auto result = _splitter_result(Env(), _result);
        Callback().MakeCallback(Env().Global(), { Env().Null(), result });
    }

private:
    // owned copy of the js buffer, the worker thread must not touch js memory
    Buf _input;
    SplitterConfig _config;
    SplitResult _result;
};

static Napi::Value
_chunk_splitter(const Napi::CallbackInfo& info)
{
    if (!info[0].IsBuffer()) {
        throw Napi::TypeError::New(
            info.Env(), "Argument 'buffer' should be Buffer - " SPLITTER_JS_SIGNATURE);
    }
    if (napi_is_defined(info[1]) && !info[1].IsObject()) {
        throw Napi::TypeError::New(
            info.Env(), "Argument 'options' should be Object or undefined - " SPLITTER_JS_SIGNATURE);
    }
    if (!info[2].IsFunction() && !info[2].IsUndefined()) {
        throw Napi::TypeError::New(
            info.Env(),
            "Argument 'callback' should be "
            "Function or undefined "
            "- " SPLITTER_JS_SIGNATURE);
    }

    const SplitterConfig config = _splitter_config(info.Env(), info[1]);
    auto buf = info[0].As<Napi::Buffer<uint8_t>>();
    const Buf input(buf.Data(), napi_buffer_length(info.Env(), buf, "chunk_splitter"));

    if (info[2].IsUndefined()) {
        SplitResult res;
        try {
            res = _split(input, config);
        } catch (const std::exception& e) {
            throw napi_dataid_error(info.Env(), e);
        }
        return _splitter_result(info.Env(), res);

    } else {
        auto callback = info[2].As<Napi::Function>();
        SplitterWorker* worker = new SplitterWorker(callback, input, config);
        worker->Queue();
        return info.Env().Undefined();
    }
}

static SplitterConfig
_splitter_config(Napi::Env env, Napi::Value options)
{
    SplitterConfig config;
    if (!napi_is_defined(options)) return config;
    auto obj = options.As<Napi::Object>();
    config.fine = _gear_params(obj.Get("fine"), config.fine);
    config.coarse = _gear_params(obj.Get("coarse"), config.coarse);
    config.fine_chunks = napi_get_i32_or(obj, "fine_chunks", config.fine_chunks);
    config.calc_sha256 = napi_get_bool_or(obj, "calc_sha256", config.calc_sha256);
    try {
        config.validate();
    } catch (const ConfigError& e) {
        throw Napi::Error::New(env, XSTR() << "Invalid splitter config - " << e.what());
    }
    return config;
}

// masks are given as hex strings since js numbers cannot hold 64 bits
static GearParams
_gear_params(Napi::Value val, const GearParams& defaults)
{
    GearParams params = defaults;
    if (!val.IsObject()) return params;
    auto obj = val.As<Napi::Object>();
    params.norm_size = napi_get_i32_or(obj, "norm_size", params.norm_size);
    params.min_size = napi_get_i32_or(obj, "min_size", params.min_size);
    params.max_size = napi_get_i32_or(obj, "max_size", params.max_size);
    params.mask1 = napi_get_u64_hex_or(obj, "mask1", params.mask1);
    params.mask2 = napi_get_u64_hex_or(obj, "mask2", params.mask2);
    return params;
}

static SplitResult
_split(const Buf& input, const SplitterConfig& config)
{
    SplitResult res;
    Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(input)), config);
    Buf chunk;
    while (splitter.next(chunk)) {
        res.lengths.push_back(chunk.length());
    }
    if (config.calc_sha256) {
        res.sha256 = splitter.sha256();
    }
    return res;
}

// the chunk lengths array, with the stream digest as its sha256 property when requested
static Napi::Value
_splitter_result(Napi::Env env, const SplitResult& res)
{
    const int count = res.lengths.size();
    auto arr = Napi::Array::New(env, count);
    for (int i = 0; i < count; ++i) {
        arr[i] = Napi::Number::New(env, res.lengths[i]);
    }
    if (!res.sha256.empty()) {
        arr["sha256"] = napi_new_buffer(env, res.sha256);
    }
    return arr;
}

} // namespace dataid
