/* Copyright (C) 2016 NooBaa */
#include "../util/napi.h"
#include "data_id.h"

namespace dataid
{

DBG_INIT_VAR(dataid_debug_level);

static Napi::Value _data_id(const Napi::CallbackInfo& info);
static Napi::Value _data_id_sync(const Napi::CallbackInfo& info);
static Napi::Value _data_id_distance(const Napi::CallbackInfo& info);
static Napi::Value _set_debug_level(const Napi::CallbackInfo& info);
static Napi::Value _set_log_config(const Napi::CallbackInfo& info);

void
data_id_napi(Napi::Env env, Napi::Object exports)
{
    exports["data_id"] = Napi::Function::New(env, _data_id);
    exports["data_id_sync"] = Napi::Function::New(env, _data_id_sync);
    exports["data_id_distance"] = Napi::Function::New(env, _data_id_distance);
    exports["set_debug_level"] = Napi::Function::New(env, _set_debug_level);
    exports["set_log_config"] = Napi::Function::New(env, _set_log_config);
}

/**
 * DataIdWorker computes the data id of a file on the libuv thread pool.
 * Each worker runs its own splitter, so concurrent calls share nothing.
 */
class DataIdWorker : public Napi::AsyncWorker
{
public:
    DataIdWorker(Napi::Function callback, std::string path)
        : Napi::AsyncWorker(callback)
        , _path(path)
        , _errno(0)
    {
    }

    virtual void Execute()
    {
        DBG2("DataIdWorker: start " << DVAL(_path));
        try {
            _id = data_id_file(_path);
        } catch (const SourceOpenError& e) {
            _errno = e.err();
            SetError(e.what());
        } catch (const SourceReadError& e) {
            _errno = e.err();
            SetError(e.what());
        } catch (const std::exception& e) {
            SetError(e.what());
        }
    }

    virtual void OnOK()
    {
        DBG2("DataIdWorker: done " << DVAL(_path) << DVAL(_id));
        Callback().MakeCallback(Env().Global(), { Env().Null(), Napi::String::New(Env(), _id) });
    }

    virtual void OnError(const Napi::Error& error)
    {
        if (_errno) {
            error.Value().Set("code", napi_sys_error(Env(), "", _errno).Value().Get("code"));
        }
        error.Value().Set("path", Napi::String::New(Env(), _path));
        Callback().MakeCallback(Env().Global(), { error.Value() });
    }

private:
    std::string _path;
    std::string _id;
    int _errno;
};

static Napi::Value
_data_id(const Napi::CallbackInfo& info)
{
    if (!info[0].IsString()) {
        throw Napi::TypeError::New(info.Env(), "data_id: 1st argument should be String (path)");
    }
    if (!info[1].IsFunction()) {
        throw Napi::TypeError::New(info.Env(), "data_id: 2nd argument should be Function (callback)");
    }
    DataIdWorker* worker = new DataIdWorker(info[1].As<Napi::Function>(), napi_get_str(info[0]));
    worker->Queue();
    return info.Env().Undefined();
}

static Napi::Value
_data_id_sync(const Napi::CallbackInfo& info)
{
    if (!info[0].IsString()) {
        throw Napi::TypeError::New(info.Env(), "data_id_sync: 1st argument should be String (path)");
    }
    const std::string path = napi_get_str(info[0]);
    try {
        return Napi::String::New(info.Env(), data_id_file(path));
    } catch (const std::exception& e) {
        auto err = napi_dataid_error(info.Env(), e);
        err.Set("path", Napi::String::New(info.Env(), path));
        throw err;
    }
}

static Napi::Value
_data_id_distance(const Napi::CallbackInfo& info)
{
    if (!info[0].IsString() || !info[1].IsString()) {
        throw Napi::TypeError::New(info.Env(), "data_id_distance: arguments should be String, String");
    }
    try {
        return Napi::Number::New(info.Env(), data_id_distance(napi_get_str(info[0]), napi_get_str(info[1])));
    } catch (const DecodeError& e) {
        throw Napi::Error::New(info.Env(), e.what());
    }
}

static Napi::Value
_set_debug_level(const Napi::CallbackInfo& info)
{
    int level = info[0].As<Napi::Number>();
    DBG_SET_LEVEL(level);
    DBG1("DataId::set_debug_level " << level);
    return info.Env().Undefined();
}

static Napi::Value
_set_log_config(const Napi::CallbackInfo& info)
{
    LOG_TO_STDERR_ENABLED = info[0].As<Napi::Boolean>();
    DBG1("DataId::set_log_config " << DVAL(LOG_TO_STDERR_ENABLED));
    return info.Env().Undefined();
}

} // namespace dataid
