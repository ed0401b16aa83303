/* Copyright (C) 2016 NooBaa */
#include <gtest/gtest.h>
#include <string>

#include "../util/b58.h"
#include "../util/common.h"

using namespace dataid;

static std::string
encode(const std::vector<uint8_t>& in)
{
    uint8_t out[16];
    int r = b58_encode(in.data(), in.size(), out);
    if (r < 0) return "";
    return std::string(reinterpret_cast<char*>(out), r);
}

static int
decode(const std::string& in, std::vector<uint8_t>& out)
{
    out.assign(16, 0);
    int r = b58_decode(reinterpret_cast<const uint8_t*>(in.data()), in.size(), out.data());
    if (r >= 0) out.resize(r);
    return r;
}

TEST(B58Test, Lengths)
{
    EXPECT_EQ(b58_encode_len(1), 2);
    EXPECT_EQ(b58_encode_len(8), 11);
    EXPECT_EQ(b58_encode_len(9), 13);
    EXPECT_EQ(b58_encode_len(4), -1);
    EXPECT_EQ(b58_decode_len(2), 1);
    EXPECT_EQ(b58_decode_len(11), 8);
    EXPECT_EQ(b58_decode_len(13), 9);
    EXPECT_EQ(b58_decode_len(12), -1);
}

TEST(B58Test, HeaderWord)
{
    EXPECT_EQ(encode({ 0x20 }), "CD");
    EXPECT_EQ(encode({ 0x00 }), "CC");
    EXPECT_EQ(encode({ 0xff }), "5v");
}

TEST(B58Test, DigestWord)
{
    EXPECT_EQ(encode({ 0, 0, 0, 0, 0, 0, 0, 0 }), "CCCCCCCCCCC");
    EXPECT_EQ(encode({ 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }), "jpX1DedGfPv");
    EXPECT_EQ(encode({ 0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef }), "C131VR7c8VK");
}

TEST(B58Test, HeaderAndDigest)
{
    EXPECT_EQ(encode({ 0x20, 0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef }), "CDC131VR7c8VK");
    std::vector<uint8_t> out;
    ASSERT_EQ(decode("CDC131VR7c8VK", out), 9);
    EXPECT_EQ(out, std::vector<uint8_t>({ 0x20, 0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef }));
}

TEST(B58Test, RoundTripAllBytes)
{
    std::vector<uint8_t> out;
    for (int i = 0; i < 256; ++i) {
        std::vector<uint8_t> in(1, uint8_t(i));
        ASSERT_EQ(decode(encode(in), out), 1) << DVAL(i);
        EXPECT_EQ(out, in);
    }
}

TEST(B58Test, UnsupportedLength)
{
    uint8_t out[16];
    const uint8_t in[4] = { 1, 2, 3, 4 };
    EXPECT_EQ(b58_encode(in, 4, out), -1);
    std::vector<uint8_t> dec;
    EXPECT_EQ(decode("CDC", dec), -3);
    EXPECT_EQ(decode("", dec), -3);
}

TEST(B58Test, InvalidChars)
{
    std::vector<uint8_t> dec;
    // 0 O I l are not in the alphabet
    EXPECT_EQ(decode("C0", dec), -1);
    EXPECT_EQ(decode("OC", dec), -1);
    EXPECT_EQ(decode("CDC131VR7c8VI", dec), -1);
    EXPECT_EQ(decode("lDC131VR7c8VK", dec), -1);
}

TEST(B58Test, Overflow)
{
    std::vector<uint8_t> dec;
    // 57 * 58 + 57 does not fit a byte
    EXPECT_EQ(decode("zz", dec), -2);
    EXPECT_EQ(decode("zzzzzzzzzzz", dec), -2);
    EXPECT_EQ(decode("CDzzzzzzzzzzz", dec), -2);
}
