/* Copyright (C) 2016 NooBaa */
#include <gtest/gtest.h>
#include <set>

#include "../chunk/splitter.h"
#include "test_utils.h"

using namespace dataid;
using namespace dataid::test;

class SplitterTest : public ::testing::Test
{
protected:
    static constexpr int INPUT_LEN = 2 * 1024 * 1024;

    void
    SetUp() override
    {
        input = random_buf(INPUT_LEN, 42);
    }

    Buf input;
};

// bytes with even and odd gear weight, see GearTest.KnownValues
static const uint8_t EVEN_BYTE = 0;
static const uint8_t ODD_BYTE = 6;

TEST(ChunkLengthTest, ShortWindowIsWholeWindow)
{
    Buf zeros(64, 0);
    EXPECT_EQ(chunk_length(zeros.data(), 0, GEAR_FINE), 0);
    EXPECT_EQ(chunk_length(zeros.data(), 5, GEAR_FINE), 5);
    EXPECT_EQ(chunk_length(zeros.data(), 20, GEAR_FINE), 20);
}

TEST(ChunkLengthTest, NoMatchStopsAtWindowEnd)
{
    const GearParams never = { 40, 20, 640, ~0ull, ~0ull };
    Buf zeros(50, 0);
    EXPECT_EQ(chunk_length(zeros.data(), 50, never), 50);
}

TEST(ChunkLengthTest, NoMatchStopsAtMaxSize)
{
    const GearParams never = { 40, 20, 640, ~0ull, ~0ull };
    Buf buf = random_buf(1000, 7);
    EXPECT_EQ(chunk_length(buf.data(), 1000, never), 640);
}

TEST(ChunkLengthTest, CraftedMatchBeforeNormSize)
{
    // with mask 1 only a byte with even gear weight can match
    const GearParams params = { 40, 20, 640, 1, 1 };
    Buf buf(200, ODD_BYTE);
    buf[25] = EVEN_BYTE;
    EXPECT_EQ(chunk_length(buf.data(), 200, params), 25);
}

TEST(ChunkLengthTest, CraftedMatchAfterNormSize)
{
    const GearParams params = { 40, 20, 640, 1, 1 };
    Buf buf(200, ODD_BYTE);
    buf[150] = EVEN_BYTE;
    EXPECT_EQ(chunk_length(buf.data(), 200, params), 150);
}

TEST(ChunkLengthTest, MatchAtMinSize)
{
    const GearParams params = { 40, 20, 640, 1, 1 };
    Buf buf(200, ODD_BYTE);
    buf[20] = EVEN_BYTE;
    EXPECT_EQ(chunk_length(buf.data(), 200, params), 20);
}

TEST(ChunkLengthTest, MatchBelowMinSizeIgnored)
{
    const GearParams params = { 40, 20, 640, 1, 1 };
    Buf buf(200, ODD_BYTE);
    buf[5] = EVEN_BYTE;
    buf[19] = EVEN_BYTE;
    buf[30] = EVEN_BYTE;
    EXPECT_EQ(chunk_length(buf.data(), 200, params), 30);
}

TEST(ChunkLengthTest, SecondMaskOnlyPastNormSize)
{
    // mask1 never matches, mask2 matches any even byte
    const GearParams params = { 40, 20, 640, ~0ull, 1 };
    Buf buf(200, ODD_BYTE);
    buf[30] = EVEN_BYTE;
    buf[60] = EVEN_BYTE;
    EXPECT_EQ(chunk_length(buf.data(), 200, params), 60);
}

TEST_F(SplitterTest, Coverage)
{
    auto chunks = split_all(input);
    ASSERT_FALSE(chunks.empty());
    int64_t pos = 0;
    for (const Buf& c : chunks) {
        ASSERT_GT(c.length(), 0);
        ASSERT_LE(pos + c.length(), INPUT_LEN);
        ASSERT_EQ(memcmp(c.data(), input.data() + pos, c.length()), 0) << DVAL(pos);
        pos += c.length();
    }
    EXPECT_EQ(pos, INPUT_LEN);
}

TEST_F(SplitterTest, Bounds)
{
    const SplitterConfig config;
    auto chunks = split_all(input, config);
    const int count = chunks.size();
    for (int i = 0; i < count; ++i) {
        const GearParams& p = i < config.fine_chunks ? config.fine : config.coarse;
        EXPECT_LE(chunks[i].length(), p.max_size) << DVAL(i);
        if (i + 1 < count) {
            EXPECT_GE(chunks[i].length(), p.min_size) << DVAL(i);
        }
    }
}

TEST_F(SplitterTest, PhaseSwitch)
{
    auto chunks = split_all(input);
    ASSERT_GT(chunks.size(), 101u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_LE(chunks[i].length(), GEAR_FINE.max_size) << DVAL(i);
    }
    // coarse chunks are longer than any fine chunk
    for (size_t i = 100; i + 1 < chunks.size(); ++i) {
        EXPECT_GE(chunks[i].length(), GEAR_COARSE.min_size) << DVAL(i);
    }
}

TEST_F(SplitterTest, CoarseFromStart)
{
    SplitterConfig config;
    config.fine_chunks = 0;
    auto chunks = split_all(input, config);
    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_GE(chunks[i].length(), GEAR_COARSE.min_size) << DVAL(i);
    }
}

TEST_F(SplitterTest, Deterministic)
{
    auto a = chunk_lengths(split_all(input));
    auto b = chunk_lengths(split_all(input));
    EXPECT_EQ(a, b);
}

TEST_F(SplitterTest, ShortReadsGiveSameChunks)
{
    auto expected = chunk_lengths(split_all(input));
    auto trickle = chunk_lengths(split_all(std::unique_ptr<ByteSource>(new TrickleSource(input))));
    EXPECT_EQ(trickle, expected);
}

TEST_F(SplitterTest, LocalityUnderEdit)
{
    const int edit_pos = INPUT_LEN / 2;
    Buf edited(input.data(), input.length());
    for (int i = 0; i < 16; ++i) {
        edited[edit_pos + i] ^= 0x5a;
    }

    auto ends_a = chunk_ends(split_all(input));
    auto ends_b = chunk_ends(split_all(edited));

    // chunks that end before the edit never saw it
    for (size_t i = 0; i < ends_a.size() && ends_a[i] < edit_pos; ++i) {
        ASSERT_LT(i, ends_b.size());
        EXPECT_EQ(ends_a[i], ends_b[i]) << DVAL(i);
    }

    // and boundaries resynchronize shortly after it
    std::set<int64_t> set_b(ends_b.begin(), ends_b.end());
    const int64_t resync_pos = edit_pos + 4 * GEAR_COARSE.max_size;
    int after = 0;
    int shared = 0;
    for (int64_t end : ends_a) {
        if (end < resync_pos) continue;
        after++;
        if (set_b.count(end)) shared++;
    }
    ASSERT_GT(after, 0);
    EXPECT_GE(shared * 10, after * 9) << DVAL(shared) << DVAL(after);
}

TEST_F(SplitterTest, ChunksOutliveSplitter)
{
    std::vector<Buf> chunks;
    {
        Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(input)));
        Buf chunk;
        while (splitter.next(chunk)) {
            chunks.push_back(chunk);
        }
    }
    int64_t pos = 0;
    for (const Buf& c : chunks) {
        ASSERT_EQ(memcmp(c.data(), input.data() + pos, c.length()), 0) << DVAL(pos);
        pos += c.length();
    }
    EXPECT_EQ(pos, INPUT_LEN);
}

TEST_F(SplitterTest, Sha256)
{
    SplitterConfig config;
    config.calc_sha256 = true;
    Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(input)), config);
    Buf chunk;
    EXPECT_THROW(splitter.sha256(), Exception);
    while (splitter.next(chunk)) {
    }
    EXPECT_TRUE(splitter.done());
    EXPECT_EQ(splitter.total(), INPUT_LEN);
    Buf expected = Crypto::digest(input, "sha256");
    Buf sha = splitter.sha256();
    EXPECT_EQ(sha.length(), 32);
    EXPECT_TRUE(sha.same(expected)) << sha.hex() << " " << expected.hex();
    // cached
    EXPECT_TRUE(splitter.sha256().same(expected));
}

TEST(SplitterEdgeTest, Sha256NotRequested)
{
    Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(Buf(100, 1))));
    Buf chunk;
    while (splitter.next(chunk)) {
    }
    EXPECT_THROW(splitter.sha256(), Exception);
}

TEST(SplitterEdgeTest, EmptySource)
{
    Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(Buf())));
    Buf chunk;
    EXPECT_FALSE(splitter.next(chunk));
    EXPECT_TRUE(splitter.done());
    EXPECT_EQ(splitter.count(), 0);
    EXPECT_EQ(splitter.total(), 0);
    // stays done
    EXPECT_FALSE(splitter.next(chunk));
}

TEST(SplitterEdgeTest, ShortStreamIsOneChunk)
{
    auto chunks = split_all(Buf(15, 3));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].length(), 15);
}

TEST(SplitterEdgeTest, ExactMultipleOfMaxSize)
{
    SplitterConfig config;
    config.fine = GearParams{ 40, 20, 640, ~0ull, ~0ull };
    config.fine_chunks = 1000;
    config.calc_sha256 = true;
    Buf data = random_buf(3 * 640, 21);

    for (int trickle = 0; trickle < 2; ++trickle) {
        std::unique_ptr<ByteSource> source;
        if (trickle) {
            source.reset(new TrickleSource(data));
        } else {
            source.reset(new MemorySource(data));
        }
        Splitter splitter(std::move(source), config);
        Buf chunk;
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(splitter.next(chunk)) << DVAL(trickle) << DVAL(i);
            EXPECT_EQ(chunk.length(), 640) << DVAL(trickle) << DVAL(i);
            EXPECT_TRUE(chunk.same(Buf(data, i * 640, 640))) << DVAL(trickle) << DVAL(i);
        }
        EXPECT_FALSE(splitter.next(chunk)) << DVAL(trickle);
        EXPECT_FALSE(splitter.next(chunk)) << DVAL(trickle);
        EXPECT_EQ(splitter.count(), 3);
        EXPECT_EQ(splitter.total(), 3 * 640);
        EXPECT_TRUE(splitter.sha256().same(Crypto::digest(data, "sha256")));
    }
}

TEST(SplitterEdgeTest, ReadErrorPropagates)
{
    Buf data = random_buf(40000, 9);
    Buf head(data, 0, 10000);
    auto expected = chunk_lengths(split_all(data));

    FailingSource* failing = new FailingSource(head, EIO);
    Splitter splitter((std::unique_ptr<ByteSource>(failing)));
    std::vector<int> lengths;
    Buf chunk;
    bool thrown = false;
    try {
        while (splitter.next(chunk)) {
            lengths.push_back(chunk.length());
        }
    } catch (const SourceReadError& e) {
        thrown = true;
        EXPECT_EQ(e.err(), EIO);
    }
    ASSERT_TRUE(thrown);

    // every chunk handed out is a chunk of the full stream, none is cut short
    ASSERT_LE(lengths.size(), expected.size());
    int64_t total = 0;
    for (size_t i = 0; i < lengths.size(); ++i) {
        EXPECT_EQ(lengths[i], expected[i]) << DVAL(i);
        total += lengths[i];
    }
    EXPECT_LE(total, 10000);
    EXPECT_FALSE(splitter.done());

    // the session is over, the error is rethrown without reading again
    EXPECT_THROW(splitter.next(chunk), SourceReadError);
    EXPECT_EQ(failing->failures(), 1);
}

TEST(SplitterConfigTest, DefaultsAreValid)
{
    SplitterConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.fine_chunks, 100);
    EXPECT_EQ(config.fine.min_size, 20);
    EXPECT_EQ(config.coarse.max_size, 65536);
}

TEST(SplitterConfigTest, InvalidConfigsRejected)
{
    SplitterConfig config;
    config.fine.min_size = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = SplitterConfig();
    config.fine.norm_size = 10;
    EXPECT_THROW(config.validate(), ConfigError);

    config = SplitterConfig();
    config.coarse.max_size = 1000;
    EXPECT_THROW(config.validate(), ConfigError);

    config = SplitterConfig();
    config.coarse.max_size = MAX_CHUNK + 1;
    EXPECT_THROW(config.validate(), ConfigError);

    config = SplitterConfig();
    config.fine_chunks = -1;
    EXPECT_THROW(config.validate(), ConfigError);

    config = SplitterConfig();
    config.fine.min_size = 0;
    EXPECT_THROW(
        {
            Splitter splitter(std::unique_ptr<ByteSource>(new MemorySource(Buf(10, 0))), config);
        },
        ConfigError);
}

TEST(SplitterConfigTest, MissingSource)
{
    EXPECT_THROW({ Splitter splitter(nullptr); }, Exception);
}
