/* Copyright (C) 2016 NooBaa */
#pragma once

#include <stdint.h>

namespace dataid
{

extern const char B58_ENCODE[58];
extern const uint8_t B58_DECODE[256];

/**
 * Base58 for identifier digests.
 *
 * Digests are encoded in words of 1 or 8 bytes, each word as a big endian
 * number written with the minimal number of digits that can hold any value
 * of that word size (1 byte -> 2 chars, 8 bytes -> 11 chars).
 * A 9 bytes digest is a 1 byte header word followed by an 8 bytes body word.
 */

static inline int
b58_encode_len(int len)
{
    switch (len) {
    case 1:
        return 2;
    case 8:
        return 11;
    case 9:
        return 13;
    default:
        return -1;
    }
}

static inline int
b58_decode_len(int len)
{
    switch (len) {
    case 2:
        return 1;
    case 11:
        return 8;
    case 13:
        return 9;
    default:
        return -1;
    }
}

// largest value of a word of len bytes.
// using 256^len-1 instead of 256^len gives the same digit count
// because a power of 58 never divides a power of 2.
static inline uint64_t
_b58_word_max(int len)
{
    return len >= 8 ? ~uint64_t(0) : (uint64_t(1) << (8 * len)) - 1;
}

static inline int
_b58_encode_word(const uint8_t* in, int len, uint8_t* out)
{
    uint64_t value = 0;
    uint64_t numvalues = _b58_word_max(len);
    uint8_t digits[16];
    int n = 0;
    for (int i = 0; i < len; ++i) {
        value = (value << 8) | in[i];
    }
    while (numvalues > 0) {
        digits[n++] = value % 58;
        value /= 58;
        numvalues /= 58;
    }
    for (int i = 0; i < n; ++i) {
        out[i] = B58_ENCODE[digits[n - 1 - i]];
    }
    return n;
}

static inline int
_b58_decode_word(const uint8_t* in, int chars, int len, uint8_t* out)
{
    const uint64_t max = _b58_word_max(len);
    uint64_t value = 0;
    for (int i = 0; i < chars; ++i) {
        const uint8_t d = B58_DECODE[in[i]];
        if (d >= 58) return -1;
        if (value > (max - d) / 58) return -2;
        value = value * 58 + d;
    }
    for (int i = len - 1; i >= 0; --i) {
        out[i] = value & 0xff;
        value >>= 8;
    }
    return len;
}

/**
 * returns the number of chars written to out (see b58_encode_len)
 * or -1 if len is not a supported digest length.
 */
static inline int
b58_encode(const uint8_t* in, int len, uint8_t* out)
{
    switch (len) {
    case 1:
    case 8:
        return _b58_encode_word(in, len, out);
    case 9: {
        const int n = _b58_encode_word(in, 1, out);
        return n + _b58_encode_word(in + 1, 8, out + n);
    }
    default:
        return -1;
    }
}

/**
 * returns the number of bytes written to out (see b58_decode_len),
 * -1 for a char outside the alphabet, -2 for a word that overflows
 * its byte size and -3 for an unsupported length.
 */
static inline int
b58_decode(const uint8_t* in, int len, uint8_t* out)
{
    switch (len) {
    case 2:
        return _b58_decode_word(in, 2, 1, out);
    case 11:
        return _b58_decode_word(in, 11, 8, out);
    case 13: {
        const int r = _b58_decode_word(in, 2, 1, out);
        if (r < 0) return r;
        const int s = _b58_decode_word(in + 2, 11, 8, out + 1);
        if (s < 0) return s;
        return r + s;
    }
    default:
        return -3;
    }
}

} // namespace dataid
