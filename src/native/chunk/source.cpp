/* Copyright (C) 2016 NooBaa */
#include "source.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace dataid
{

DBG_INIT_VAR(dataid_debug_level);

FileSource::FileSource(const std::string& path)
    : _fd(-1)
    , _owned(true)
    , _name(path)
{
    do {
        _fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (_fd < 0 && errno == EINTR);
    if (_fd < 0) {
        throw SourceOpenError(path, errno);
    }
    DBG2("FileSource: opened " << DVAL(_name) << DVAL(_fd));
}

FileSource::FileSource(int fd, bool owned, std::string name)
    : _fd(fd)
    , _owned(owned)
    , _name(name)
{
}

FileSource::~FileSource()
{
    if (_owned && _fd >= 0) {
        if (::close(_fd)) {
            LOG("WARNING: FileSource: close failed " << DVAL(_name) << strerror(errno));
        }
        _fd = -1;
    }
}

int
FileSource::read(uint8_t* data, int len)
{
    while (true) {
        const ssize_t r = ::read(_fd, data, len);
        if (r >= 0) {
            DBG5("FileSource::read " << DVAL(_name) << DVAL(len) << DVAL(r));
            return static_cast<int>(r);
        }
        if (errno != EINTR) {
            throw SourceReadError(_name, errno);
        }
    }
}

int
MemorySource::read(uint8_t* data, int len)
{
    const int n = std::min<int>(len, _buf.length() - _pos);
    if (n <= 0) return 0;
    memcpy(data, _buf.data() + _pos, n);
    _pos += n;
    return n;
}

} // namespace dataid
