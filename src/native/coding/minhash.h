/* Copyright (C) 2016 NooBaa */
#pragma once

#include <vector>

#include "../util/common.h"

namespace dataid
{

static const int MINHASH_PERMUTATIONS = 64;

extern const uint64_t MINHASH_A[MINHASH_PERMUTATIONS];
extern const uint64_t MINHASH_B[MINHASH_PERMUTATIONS];

/**
 * Min-hash sketch of a multiset of 32 bit features.
 *
 * Feature f is permuted n times with h_i(f) = ((a_i * f + b_i) mod (2^61 - 1)) & 0xffffffff
 * and the sketch keeps the minimum of each permutation over all the features.
 * Similar feature sets share a large part of their minimums.
 * Without features every slot stays at 0xffffffff.
 */
std::vector<uint32_t> minimum_hash(const std::vector<uint32_t>& features, int n = MINHASH_PERMUTATIONS);

} // namespace dataid
