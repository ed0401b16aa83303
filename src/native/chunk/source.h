/* Copyright (C) 2016 NooBaa */
#pragma once

#include <string>

#include "../util/buf.h"
#include "../util/common.h"

namespace dataid
{

/**
 * SourceReadError is fatal to a chunking session.
 * It is never retried by the chunker, retry policy belongs to the source owner.
 */
class SourceReadError : public Exception
{
public:
    SourceReadError(std::string msg, int err = 0)
        : Exception(_format(msg, err))
        , _err(err)
    {
    }

    int err() const { return _err; }

private:
    static std::string
    _format(const std::string& msg, int err)
    {
        XSTR s;
        s << "SourceReadError: " << msg;
        if (err) s << " - " << strerror(err) << " (" << err << ")";
        return s;
    }

    int _err;
};

class SourceOpenError : public Exception
{
public:
    SourceOpenError(std::string path, int err)
        : Exception(XSTR() << "SourceOpenError: " << path << " - " << strerror(err) << " (" << err << ")")
        , _err(err)
    {
    }

    int err() const { return _err; }

private:
    int _err;
};

/**
 * ByteSource is a read once, forward only stream of bytes.
 */
class ByteSource
{
public:
    virtual ~ByteSource() {}

    /**
     * reads up to len bytes into data.
     * returns the number of bytes read which may be less than len at any time,
     * and returns 0 only at end of stream.
     * throws SourceReadError on failure.
     */
    virtual int read(uint8_t* data, int len) = 0;
};

/**
 * FileSource reads from a file descriptor.
 */
class FileSource : public ByteSource
{
public:
    // opens the file for reading, throws SourceOpenError
    explicit FileSource(const std::string& path);

    // reads from an already open fd, closed on destruction only when owned
    explicit FileSource(int fd, bool owned, std::string name);

    virtual ~FileSource();

    virtual int read(uint8_t* data, int len);

    const std::string& name() const { return _name; }

private:
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    int _fd;
    bool _owned;
    std::string _name;
};

/**
 * MemorySource reads from a buffer, sharing its allocation.
 */
class MemorySource : public ByteSource
{
public:
    explicit MemorySource(const Buf& buf)
        : _buf(buf)
        , _pos(0)
    {
    }

    virtual int read(uint8_t* data, int len);

private:
    Buf _buf;
    int _pos;
};

} // namespace dataid
