/* Copyright (C) 2016 NooBaa */
#include "splitter.h"

#include "gear.h"

namespace dataid
{

DBG_INIT_VAR(dataid_debug_level);

std::ostream&
operator<<(std::ostream& os, const GearParams& p)
{
    return os << "{norm " << p.norm_size
              << " min " << p.min_size
              << " max " << p.max_size
              << std::hex
              << " mask1 0x" << p.mask1
              << " mask2 0x" << p.mask2
              << std::dec << "}";
}

void
GearParams::validate(const char* phase) const
{
    if (min_size < 1) {
        throw ConfigError(XSTR() << phase << ": min_size should be positive " << DVAL(min_size));
    }
    if (norm_size < min_size) {
        throw ConfigError(XSTR() << phase << ": " << DVAL(norm_size) << "should not be smaller than " << DVAL(min_size));
    }
    if (max_size < norm_size) {
        throw ConfigError(XSTR() << phase << ": " << DVAL(max_size) << "should not be smaller than " << DVAL(norm_size));
    }
    if (max_size > MAX_CHUNK) {
        throw ConfigError(XSTR() << phase << ": " << DVAL(max_size) << "should not exceed " << DVAL(MAX_CHUNK));
    }
}

void
SplitterConfig::validate() const
{
    fine.validate("fine");
    coarse.validate("coarse");
    if (fine_chunks < 0) {
        throw ConfigError(XSTR() << DVAL(fine_chunks) << "should not be negative");
    }
}

int
chunk_length(const uint8_t* data, int len, const GearParams& params)
{
    if (len <= params.min_size) {
        return len;
    }

    // this code is very tight on cpu,
    // so we copy the params to the stack to keep them in registers.
    const int barrier1 = std::min(params.norm_size, len);
    const int barrier2 = std::min(params.max_size, len);
    const uint64_t mask1 = params.mask1;
    const uint64_t mask2 = params.mask2;
    uint64_t pattern = 0;
    int i = params.min_size;

    // the pattern carries over from the first scan to the second,
    // only the mask is relaxed past the normal size.
    for (; i < barrier1; ++i) {
        pattern = (pattern << 1) + GEAR_TABLE[data[i]];
        if (!(pattern & mask1)) {
            return i;
        }
    }
    for (; i < barrier2; ++i) {
        pattern = (pattern << 1) + GEAR_TABLE[data[i]];
        if (!(pattern & mask2)) {
            return i;
        }
    }

    return i;
}

Splitter::Splitter(std::unique_ptr<ByteSource> source, const SplitterConfig& config)
    : _config(config)
    , _source(std::move(source))
    , _pos(0)
    , _len(0)
    , _count(0)
    , _total(0)
    , _eof(false)
    , _done(false)
{
    _config.validate();
    if (!_source) {
        throw Exception("Splitter: missing byte source");
    }
    if (_config.calc_sha256) {
        _hasher.reset(new Crypto::Hasher("sha256"));
    }
    DBG1("Splitter: created"
        << " fine " << _config.fine
        << " coarse " << _config.coarse
        << " " << DVAL(_config.fine_chunks));
}

Splitter::~Splitter()
{
    DBG2("Splitter: destroyed " << DVAL(_count) << DVAL(_total));
}

bool
Splitter::next(Buf& chunk)
{
    if (_error) {
        std::rethrow_exception(_error);
    }
    if (_done) {
        return false;
    }

    const GearParams& phase = params();

    try {
        _fill(phase.max_size);
    } catch (...) {
        // the session is over, keep the error for any later call
        _error = std::current_exception();
        throw;
    }

    if (!_len) {
        _done = true;
        DBG1("Splitter: done " << DVAL(_count) << DVAL(_total));
        return false;
    }

    const int boundary = chunk_length(_window.data() + _pos, _len, phase);
    ASSERT(boundary > 0 && boundary <= _len, DVAL(boundary) << DVAL(_len));

    chunk = Buf(_window, _pos, boundary);
    _pos += boundary;
    _len -= boundary;
    _total += boundary;
    _count++;

    DBG4("Splitter: chunk " << DVAL(_count) << DVAL(boundary) << DVAL(_total));
    if (_count == _config.fine_chunks) {
        DBG1("Splitter: switching to coarse phase " << DVAL(_count) << DVAL(_total));
    }
    return true;
}

void
Splitter::_fill(int max_size)
{
    if (_eof || _len >= max_size) {
        return;
    }

    // the window has room for two max sized sections, so the unconsumed
    // section is moved to a new window only about once every max_size bytes.
    // the old window stays alive as long as chunks still refer to it.
    if (_pos + max_size > _window.length()) {
        Buf window(2 * max_size);
        if (_len) {
            memcpy(window.data(), _window.data() + _pos, _len);
        }
        DBG3("Splitter: new window " << DVAL(window.length()) << DVAL(_len));
        _window = window;
        _pos = 0;
    }

    while (_len < max_size) {
        uint8_t* tail = _window.data() + _pos + _len;
        const int room = _window.length() - _pos - _len;
        const int n = _source->read(tail, room);
        if (n < 0 || n > room) {
            throw SourceReadError(XSTR() << "invalid read length " << DVAL(n) << DVAL(room));
        }
        if (!n) {
            _eof = true;
            DBG2("Splitter: end of stream " << DVAL(_total + _len));
            break;
        }
        if (_hasher) {
            _hasher->update(tail, n);
        }
        _len += n;
    }
}

Buf
Splitter::sha256()
{
    if (!_config.calc_sha256) {
        throw Exception("Splitter: sha256 was not requested in the config");
    }
    if (!_done) {
        throw Exception("Splitter: sha256 is only available at end of stream");
    }
    if (_hasher) {
        _sha256 = _hasher->final();
        _hasher.reset();
    }
    return _sha256;
}

} // namespace dataid
