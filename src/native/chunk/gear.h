/* Copyright (C) 2016 NooBaa */
#pragma once

#include <stdint.h>

namespace dataid
{

/**
 * Gear hashing weights, one pseudo random 64 bit value per byte value.
 * The gear rolling hash is: hash = (hash << 1) + GEAR_TABLE[byte]
 * so a byte affects the hash for the next 64 bytes only.
 */
extern const uint64_t GEAR_TABLE[256];

} // namespace dataid
