/* Copyright (C) 2016 NooBaa */
#include "b58.h"

namespace dataid
{

#define FF 255

/* clang-format off */
const char B58_ENCODE[58] = {
    'C', '2', '3', '4', '5', '6', '7', '8', '9', 'r', 'B', '1', 'Z', 'E', 'F', 'G',
    'T', 't', 'Y', 'i', 'A', 'a', 'V', 'v', 'M', 'm', 'H', 'U', 'P', 'W', 'X', 'K',
    'D', 'N', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'L', 'j', 'k', 'S', 'n', 'o', 'p',
    'R', 'q', 's', 'J', 'u', 'Q', 'w', 'x', 'y', 'z',
};

const uint8_t B58_DECODE[256] = {
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [0  - 16]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [16 - 32]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [32 - 48]
    FF, 11, 1,  2,  3,  4,  5,  6,  7,  8,  FF, FF, FF, FF, FF, FF, // [48 - 64] 49:'1' 50:'2'-'9'
    FF, 20, 10, 0,  32, 13, 14, 15, 26, FF, 51, 31, 41, 24, 33, FF, // [64 - 80] 65:'A'
    28, 53, 48, 44, 16, 27, 22, 29, 30, 18, 12, FF, FF, FF, FF, FF, // [80 - 96]
    FF, 21, 34, 35, 36, 37, 38, 39, 40, 19, 42, 43, FF, 25, 45, 46, // [96 -112] 97:'a'
    47, 49, 9,  50, 17, 52, 23, 54, 55, 56, 57, FF, FF, FF, FF, FF, // [112-128]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [128-144]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [144-160]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [160-176]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [176-192]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [192-208]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [208-224]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [224-240]
    FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, FF, // [240-256]
};
/* clang-format on */

#undef FF

} // namespace dataid
