/* Copyright (C) 2016 NooBaa */
#pragma once

#include <algorithm>
#include <assert.h>
#include <chrono>
#include <ctime>
#include <errno.h>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "os.h"

namespace dataid
{

#ifndef __func__
#define __func__ __FUNCTION__
#endif

#define DVAL(x) #x "=" << x << " "

// logs go to stderr so that tools can keep stdout for their results
extern bool LOG_TO_STDERR_ENABLED;

#define LOG(x)                                                  \
    do {                                                        \
        if (dataid::LOG_TO_STDERR_ENABLED) {                    \
            std::cerr << dataid::LOG_PREFIX() << x << std::endl; \
        }                                                       \
    } while (0)

// to use DBG the module/file should use either DBG_INIT or DBG_INIT_VAR.
#define DBG_INIT(level) static int __module_debug_var__ = level
#define DBG_INIT_VAR(debug_var) static int& __module_debug_var__ = debug_var
#define DBG_SET_LEVEL(level) __module_debug_var__ = level
#define DBG_VISIBLE(level) (level <= __module_debug_var__)
#define DBG(level, x)                        \
    do {                                     \
        if (DBG_VISIBLE(level)) {            \
            LOG("[L" << level << "] " << x); \
        }                                    \
    } while (0)
#define DBG0(x) DBG(0, x)
#define DBG1(x) DBG(1, x)
#define DBG2(x) DBG(2, x)
#define DBG3(x) DBG(3, x)
#define DBG4(x) DBG(4, x)
#define DBG5(x) DBG(5, x)

#define PANIC(info)                          \
    do {                                     \
        int saved = errno;                   \
        std::cerr << "PANIC: " << info       \
                  << " " << strerror(saved)  \
                  << " (" << saved << ")"    \
                  << " " << __func__ << "()" \
                  << " at " << __FILE__      \
                  << ":" << __LINE__         \
                  << std::endl;              \
        abort();                             \
    } while (0)

#ifdef NDEBUG
#define ASSERT(...)
#else
#define ASSERT(cond, info)                                      \
    do {                                                        \
        auto ret = (cond);                                      \
        if (!ret) {                                             \
            PANIC("ASSERT FAILED: " << #cond << " - " << info); \
        }                                                       \
    } while (0)
#endif

// the single debug level shared by all library modules (see DBG_INIT_VAR)
extern int dataid_debug_level;

class XSTR
{
public:
    std::stringstream stream;

    operator std::string() { return stream.str(); }

    template <class T>
    XSTR& operator<<(const T& x)
    {
        stream << x;
        return *this;
    }
};

class Exception : public std::exception
{
public:
    Exception(std::string msg)
        : _msg(std::string("Exception: ") + msg) {}

    virtual ~Exception() throw() {}

    virtual const char* what() const throw()
    {
        return _msg.c_str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Exception& e)
    {
        return os << e._msg;
    }

private:
    const std::string _msg;
};

/**
 * ConfigError is thrown when a chunking parameter set breaks its invariants.
 * Configurations are rejected as given and never clamped into range.
 */
class ConfigError : public Exception
{
public:
    ConfigError(std::string msg)
        : Exception(std::string("ConfigError: ") + msg) {}
};

static inline std::string
LOG_PREFIX()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto now_time = system_clock::to_time_t(now);
    auto now_micros = duration_cast<microseconds>(now.time_since_epoch());
    struct tm now_tm;
    localtime_r(&now_time, &now_tm);
    return XSTR()
        << std::put_time(&now_tm, "%Y-%m-%d %T")
        << "." << std::setfill('0') << std::setw(6) << (now_micros.count() % 1000000)
        << " [PID-" << getpid() << "/TID-" << get_current_tid() << "] ";
}

} // namespace dataid
