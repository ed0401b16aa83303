/* Copyright (C) 2016 NooBaa */
#pragma once

#include <exception>
#include <memory>

#include "../util/buf.h"
#include "../util/crypto.h"
#include "source.h"

namespace dataid
{

/**
 * GearParams is the parameter set of one chunking phase.
 *
 * Below norm_size a boundary must match mask1 and above it mask2,
 * mask2 having less bits than mask1 makes boundaries more likely past
 * norm_size and keeps chunk sizes concentrated around it.
 */
struct GearParams
{
    int norm_size;
    int min_size;
    int max_size;
    uint64_t mask1;
    uint64_t mask2;

    // throws ConfigError unless 1 <= min_size <= norm_size <= max_size <= MAX_CHUNK
    void validate(const char* phase) const;

    friend std::ostream& operator<<(std::ostream& os, const GearParams& p);
};

// upper bound on max_size, the splitter window holds two max sized sections
static constexpr int MAX_CHUNK = 1 << 28;

static constexpr GearParams GEAR_FINE = {
    40, 20, 640, 0x0000000000016118ull, 0x000000000000A0B1ull
};

static constexpr GearParams GEAR_COARSE = {
    4096, 2048, 65536, 0x0003590703530000ull, 0x0000D90003530000ull
};

struct SplitterConfig
{
    // phase used for the first fine_chunks chunks of a stream
    GearParams fine = GEAR_FINE;
    // phase used for the rest of the stream
    GearParams coarse = GEAR_COARSE;
    int fine_chunks = 100;
    // digest the whole stream with sha256 while reading it
    bool calc_sha256 = false;

    void validate() const;
};

/**
 * Returns the length of the chunk that starts at data.
 *
 * data is the buffered part of the stream, when len <= min_size the whole
 * buffer is returned which is only a valid chunk at end of stream.
 * The result depends only on the buffer bytes and the params,
 * never on the position in the stream.
 */
int chunk_length(const uint8_t* data, int len, const GearParams& params);

/**
 * Splitter is a pull based content defined chunker over a byte source.
 *
 * Each call to next() reads ahead up to the max_size of the active phase
 * and cuts one chunk. The first fine_chunks chunks use the fine phase,
 * the rest of the stream uses the coarse phase.
 *
 * Chunks are slices of the splitter window and share its allocation,
 * so they stay valid after the splitter moved on or was destroyed.
 */
class Splitter
{
public:
    explicit Splitter(std::unique_ptr<ByteSource> source, const SplitterConfig& config = SplitterConfig());

    ~Splitter();

    /**
     * Sets chunk to the next chunk of the stream and returns true,
     * or returns false once the stream is exhausted.
     * Read failures are thrown as SourceReadError and end the session,
     * later calls throw the same error again.
     */
    bool next(Buf& chunk);

    // sha256 of the stream, available once next() returned false
    Buf sha256();

    bool done() const { return _done; }
    int64_t count() const { return _count; }
    int64_t total() const { return _total; }
    const SplitterConfig& config() const { return _config; }

    const GearParams&
    params() const
    {
        return _count < _config.fine_chunks ? _config.fine : _config.coarse;
    }

private:
    Splitter(const Splitter&) = delete;
    Splitter& operator=(const Splitter&) = delete;

    void _fill(int max_size);

    const SplitterConfig _config;
    std::unique_ptr<ByteSource> _source;
    std::unique_ptr<Crypto::Hasher> _hasher;
    Buf _sha256;
    // the section is the unconsumed bytes at _window[_pos.._pos+_len]
    Buf _window;
    int _pos;
    int _len;
    int64_t _count;
    int64_t _total;
    bool _eof;
    bool _done;
    std::exception_ptr _error;
};

} // namespace dataid
