/* Copyright (C) 2016 NooBaa */
#include "data_id.h"

#include <bitset>
#include <xxhash.h>

#include "../util/b58.h"
#include "minhash.h"

namespace dataid
{

DBG_INIT_VAR(dataid_debug_level);

uint32_t
chunk_hash(const Buf& chunk)
{
    return XXH32(chunk.data(), chunk.length(), 0);
}

Buf
lsb_digest(const std::vector<uint32_t>& sketch)
{
    const int n = static_cast<int>(sketch.size());
    Buf digest((n + 7) / 8, 0);
    for (int i = 0; i < n; ++i) {
        if (sketch[i] & 1) {
            digest[i / 8] |= 0x80 >> (i % 8);
        }
    }
    return digest;
}

std::string
encode_data_id(const Buf& digest)
{
    if (digest.length() != DATA_ID_DIGEST_LEN) {
        throw Exception(XSTR() << "encode_data_id: digest should be " << DATA_ID_DIGEST_LEN << " bytes " << DVAL(digest.length()));
    }
    uint8_t raw[DATA_ID_LEN];
    uint8_t out[DATA_ID_CHARS];
    raw[0] = DATA_ID_HEADER;
    memcpy(raw + 1, digest.data(), DATA_ID_DIGEST_LEN);
    const int r = b58_encode(raw, DATA_ID_LEN, out);
    ASSERT(r == DATA_ID_CHARS, DVAL(r));
    return std::string(reinterpret_cast<const char*>(out), r);
}

Buf
decode_data_id(const std::string& id)
{
    const int len = static_cast<int>(id.size());
    if (b58_decode_len(len) != DATA_ID_LEN) {
        throw DecodeError(XSTR() << "expected " << DATA_ID_CHARS << " chars " << DVAL(id) << DVAL(len));
    }
    Buf raw(DATA_ID_LEN);
    const int r = b58_decode(reinterpret_cast<const uint8_t*>(id.data()), len, raw.data());
    if (r != DATA_ID_LEN) {
        throw DecodeError(XSTR() << "invalid base58 " << DVAL(id) << DVAL(r));
    }
    return raw;
}

int
data_id_distance(const std::string& a, const std::string& b)
{
    const Buf ra = decode_data_id(a);
    const Buf rb = decode_data_id(b);
    if (ra[0] != DATA_ID_HEADER || rb[0] != DATA_ID_HEADER) {
        throw DecodeError(XSTR() << "not a data id header " << DVAL(a) << DVAL(b));
    }
    int distance = 0;
    for (int i = 1; i < DATA_ID_LEN; ++i) {
        distance += static_cast<int>(std::bitset<8>(ra[i] ^ rb[i]).count());
    }
    return distance;
}

DataIdResult
data_id(std::unique_ptr<ByteSource> source, const SplitterConfig& config)
{
    DataIdResult res;
    Splitter splitter(std::move(source), config);
    std::vector<uint32_t> features;
    Buf chunk;

    while (splitter.next(chunk)) {
        features.push_back(chunk_hash(chunk));
        res.chunk_lengths.push_back(chunk.length());
    }

    const std::vector<uint32_t> sketch = minimum_hash(features, MINHASH_PERMUTATIONS);
    res.id = encode_data_id(lsb_digest(sketch));
    res.chunks = splitter.count();
    res.size = splitter.total();
    if (config.calc_sha256) {
        res.sha256 = splitter.sha256();
    }

    DBG1("data_id: " << DVAL(res.id) << DVAL(res.chunks) << DVAL(res.size));
    return res;
}

std::string
data_id_file(const std::string& path)
{
    std::unique_ptr<ByteSource> source(new FileSource(path));
    return data_id(std::move(source)).id;
}

} // namespace dataid
