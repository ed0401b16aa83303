/* Copyright (C) 2016 NooBaa */
#pragma once

#include <string>
#include <vector>

#include "../chunk/splitter.h"
#include "../util/buf.h"
#include "../util/common.h"

namespace dataid
{

// component header byte of a data id
static const uint8_t DATA_ID_HEADER = 0x20;
static const int DATA_ID_DIGEST_LEN = 8;
static const int DATA_ID_LEN = 1 + DATA_ID_DIGEST_LEN;
static const int DATA_ID_CHARS = 13;

/**
 * DecodeError is thrown for strings that are not well formed data ids.
 */
class DecodeError : public Exception
{
public:
    DecodeError(std::string msg)
        : Exception(std::string("DecodeError: ") + msg) {}
};

struct DataIdResult
{
    std::string id;
    int64_t chunks = 0;
    int64_t size = 0;
    std::vector<int> chunk_lengths;
    // empty unless the config asked for calc_sha256
    Buf sha256;
};

// xxhash32 of the chunk bytes with seed 0
uint32_t chunk_hash(const Buf& chunk);

/**
 * Packs the least significant bit of every sketch value,
 * first value into the most significant bit of the first byte.
 */
Buf lsb_digest(const std::vector<uint32_t>& sketch);

// header + 8 bytes digest in base58, throws Exception for a digest of another length
std::string encode_data_id(const Buf& digest);

// returns the 9 bytes of header + digest, throws DecodeError
Buf decode_data_id(const std::string& id);

/**
 * Number of differing digest bits between two data ids, 0 to 64.
 * Lower means more similar content.
 * Throws DecodeError if either is not a data id.
 */
int data_id_distance(const std::string& a, const std::string& b);

/**
 * Chunks the source to the end and computes its data id:
 * xxhash32 per chunk -> min-hash sketch of 64 -> lsb digest -> header + base58.
 * Source errors propagate as SourceReadError.
 */
DataIdResult data_id(std::unique_ptr<ByteSource> source, const SplitterConfig& config = SplitterConfig());

// data id of a file, throws SourceOpenError or SourceReadError
std::string data_id_file(const std::string& path);

} // namespace dataid
