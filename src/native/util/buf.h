/* Copyright (C) 2016 NooBaa */
#pragma once

#include <string>
#include <vector>

#include "common.h"

namespace dataid
{

/**
 * Buf is a byte range over a reference counted allocation.
 * Copies and slices share the allocation, so a slice stays valid
 * for as long as any Buf refers to it.
 */
class Buf
{
public:
    Buf()
        : _data(0), _len(0) {}

    explicit Buf(int len)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length()) {}

    explicit Buf(int len, uint8_t fill)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length())
    {
        memset(_data, fill, _len);
    }

    // copyful
    explicit Buf(const void* data, int len)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length())
    {
        if (len) memcpy(_data, data, len);
    }

    explicit Buf(const std::string& str)
        : Buf(str.data(), static_cast<int>(str.size()))
    {
    }

    explicit Buf(const std::vector<uint8_t>& vec)
        : Buf(vec.data(), static_cast<int>(vec.size()))
    {
    }

    Buf(const Buf& other) { init(other); }

    Buf(const Buf& other, int offset, int len)
    {
        init(other);
        slice(offset, len);
    }

    // copyful concat
    template <typename Iter>
    Buf(int len, Iter begin, Iter end)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length())
    {
        uint8_t* data = _data;
        while (len > 0) {
            ASSERT(begin != end, DVAL(len));
            const Buf& buf = *begin;
            int now = std::min<int>(len, buf.length());
            memcpy(data, buf.data(), now);
            data += now;
            len -= now;
            begin++;
        }
    }

    ~Buf() {}

    const Buf&
    operator=(const Buf& other)
    {
        init(other);
        return other;
    }

    inline uint8_t*
    data()
    {
        return _data;
    }

    inline const uint8_t*
    data() const
    {
        return _data;
    }

    inline const char*
    cdata() const
    {
        return reinterpret_cast<const char*>(_data);
    }

    inline int
    length() const
    {
        return _len;
    }

    inline bool
    empty() const
    {
        return _len == 0;
    }

    inline uint8_t& operator[](int i) { return _data[i]; }

    inline const uint8_t& operator[](int i) const { return _data[i]; }

    inline void
    slice(int offset, int len)
    {
        // skip to offset
        if (offset > _len) {
            offset = _len;
        }
        if (offset < 0) {
            offset = 0;
        }
        _data += offset;
        _len -= offset;
        // truncate to length
        if (_len > len) {
            _len = len;
        }
        if (_len < 0) {
            _len = 0;
        }
    }

    // number of Buf objects sharing the allocation
    inline long
    alloc_refs() const
    {
        return _alloc.use_count();
    }

    inline bool
    same(const Buf& buf) const
    {
        return (_len == buf._len) && (_len == 0 || !memcmp(_data, buf._data, _len));
    }

    inline std::string
    str() const
    {
        return std::string(cdata(), _len);
    }

    inline std::string
    hex() const
    {
        std::string str;
        str.resize(2 * _len);
        for (int i = 0, j = 0; i < _len; ++i, j += 2) {
            str[j] = HEX_CHARS[_data[i] >> 4];
            str[j + 1] = HEX_CHARS[_data[i] & 0xf];
        }
        return str;
    }

private:
    class Alloc
    {
    private:
        uint8_t* _data;
        int _len;

    public:
        explicit Alloc(int len)
            : _data(0), _len(len)
        {
            if (len < 0) {
                throw Exception(XSTR() << "Buf: negative length " << DVAL(len));
            }
            _data = new uint8_t[len > 0 ? len : 1];
        }

        Alloc(const Alloc& other) = delete;
        Alloc& operator=(const Alloc& other) = delete;

        ~Alloc() { delete[] _data; }

        inline uint8_t*
        data()
        {
            return _data;
        }

        inline int
        length()
        {
            return _len;
        }
    };

    void
    init(const Buf& other)
    {
        _alloc = other._alloc;
        _data = other._data;
        _len = other._len;
    }

    static const char HEX_CHARS[16];

    std::shared_ptr<Alloc> _alloc;
    uint8_t* _data;
    int _len;
};

} // namespace dataid
