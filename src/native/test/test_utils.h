/* Copyright (C) 2016 NooBaa */
#pragma once

#include <random>
#include <vector>

#include "../chunk/splitter.h"

namespace dataid
{
namespace test
{

inline Buf
random_buf(int len, uint32_t seed)
{
    std::mt19937 gen(seed);
    Buf buf(len);
    for (int i = 0; i < len; ++i) {
        buf[i] = gen() & 0xff;
    }
    return buf;
}

inline std::vector<Buf>
split_all(std::unique_ptr<ByteSource> source, const SplitterConfig& config = SplitterConfig())
{
    std::vector<Buf> chunks;
    Splitter splitter(std::move(source), config);
    Buf chunk;
    while (splitter.next(chunk)) {
        chunks.push_back(chunk);
    }
    return chunks;
}

inline std::vector<Buf>
split_all(const Buf& input, const SplitterConfig& config = SplitterConfig())
{
    return split_all(std::unique_ptr<ByteSource>(new MemorySource(input)), config);
}

inline std::vector<int>
chunk_lengths(const std::vector<Buf>& chunks)
{
    std::vector<int> lengths;
    for (const Buf& c : chunks) {
        lengths.push_back(c.length());
    }
    return lengths;
}

// end offsets of the chunks in the stream
inline std::vector<int64_t>
chunk_ends(const std::vector<Buf>& chunks)
{
    std::vector<int64_t> ends;
    int64_t pos = 0;
    for (const Buf& c : chunks) {
        pos += c.length();
        ends.push_back(pos);
    }
    return ends;
}

/**
 * TrickleSource returns short reads of varying sizes.
 */
class TrickleSource : public ByteSource
{
public:
    explicit TrickleSource(const Buf& buf)
        : _buf(buf), _pos(0), _reads(0) {}

    virtual int
    read(uint8_t* data, int len)
    {
        static const int SIZES[] = { 1, 7, 13, 0x100, 3, 1000 };
        const int want = SIZES[_reads++ % 6];
        const int n = std::min(std::min(len, want), _buf.length() - _pos);
        if (n <= 0) return 0;
        memcpy(data, _buf.data() + _pos, n);
        _pos += n;
        return n;
    }

private:
    Buf _buf;
    int _pos;
    int _reads;
};

/**
 * FailingSource yields its buffer and then fails instead of ending.
 */
class FailingSource : public ByteSource
{
public:
    FailingSource(const Buf& buf, int err)
        : _buf(buf), _pos(0), _err(err), _failures(0) {}

    virtual int
    read(uint8_t* data, int len)
    {
        const int n = std::min(len, _buf.length() - _pos);
        if (n <= 0) {
            _failures++;
            throw SourceReadError("failing source", _err);
        }
        memcpy(data, _buf.data() + _pos, n);
        _pos += n;
        return n;
    }

    int failures() const { return _failures; }

private:
    Buf _buf;
    int _pos;
    int _err;
    int _failures;
};

} // namespace test
} // namespace dataid
