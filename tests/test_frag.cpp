// tests/test_frag.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <vector>

#include "proto/frag.hpp"

using namespace frag;

static std::vector<std::uint8_t> gen_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i & 0xFF);
    return v;
}

static std::vector<Chunk> chunks_of(const Bytes &msg)
{
    std::vector<Chunk> out;
    EXPECT_EQ(make_chunks(msg, out), proto::Error::None);
    return out;
}

TEST(Frag, SerializeParse_Layout)
{
    Chunk c{};
    c.hdr.total = 4;
    c.hdr.index = 2;
    c.data      = std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o'};

    auto frame = serialize(c);
    ASSERT_EQ(frame.size(), 7u);
    EXPECT_EQ(frame[0], 4);
    EXPECT_EQ(frame[1], 2);
    EXPECT_EQ(frame[2], 'h');

    auto parsed = parse(frame);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->hdr.total, 4u);
    EXPECT_EQ(parsed->hdr.index, 2u);
    EXPECT_EQ(parsed->data, c.data);
}

TEST(Frag, Parse_RejectsBadFrames)
{
    EXPECT_FALSE(parse({}).has_value());
    EXPECT_FALSE(parse({1}).has_value());
    EXPECT_FALSE(parse({0, 0, 'x'}).has_value());  // total 0 (looks like an ack)
    EXPECT_FALSE(parse({3, 3, 'x'}).has_value());  // index out of range

    Bytes too_long(2 + constants::DATA_LEN + 1, 'a');
    too_long[0] = 1;
    too_long[1] = 0;
    EXPECT_FALSE(parse(too_long).has_value());
}

TEST(Frag, Serialize_RejectsInvalidChunk)
{
    Chunk c{};
    c.hdr.total = 2;
    c.hdr.index = 2;
    EXPECT_TRUE(serialize(c).empty());

    c.hdr.index = 0;
    c.data      = gen_bytes(constants::DATA_LEN + 1);
    EXPECT_TRUE(serialize(c).empty());
}

TEST(Frag, MakeChunks_EmptyMessage)
{
    auto chunks = chunks_of({});
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].hdr.total, 1u);
    EXPECT_EQ(chunks[0].hdr.index, 0u);
    EXPECT_TRUE(chunks[0].data.empty());
}

TEST(Frag, MakeChunks_ExactMultiple)
{
    auto bytes  = gen_bytes(90);
    auto chunks = chunks_of(bytes);
    ASSERT_EQ(chunks.size(), 3u);
    for (std::size_t i = 0; i < chunks.size(); ++i)
    {
        EXPECT_EQ(chunks[i].hdr.index, i);
        EXPECT_EQ(chunks[i].hdr.total, 3u);
        EXPECT_EQ(chunks[i].data.size(), 30u);
    }
    std::vector<std::uint8_t> merged;
    for (auto &c : chunks)
        merged.insert(merged.end(), c.data.begin(), c.data.end());
    EXPECT_EQ(merged, bytes);
}

TEST(Frag, MakeChunks_CountAndLastLength)
{
    for (std::size_t n : {1u, 29u, 30u, 31u, 103u, 7649u, 7650u})
    {
        auto              chunks = chunks_of(gen_bytes(n));
        const std::size_t total  = (n + 29) / 30;
        ASSERT_EQ(chunks.size(), total) << "n=" << n;
        EXPECT_EQ(chunks.back().data.size(), n - 30 * (total - 1)) << "n=" << n;
        for (auto &c : chunks)
            EXPECT_LE(serialize(c).size(), constants::PACKET_MAX);
    }
}

TEST(Frag, MakeChunks_TooLarge)
{
    std::vector<Chunk> out;
    EXPECT_EQ(make_chunks(gen_bytes(255 * 30 + 1), out), proto::Error::MessageTooLarge);
    EXPECT_TRUE(out.empty());
}

TEST(Frag, Reassembler_OutOfOrder_WithDup)
{
    auto bytes  = gen_bytes(80);
    auto chunks = chunks_of(bytes);
    ASSERT_EQ(chunks.size(), 3u);

    Reassembler r;

    // feed 0, 0 again (starts over), then 2, then 1; only the last completes
    EXPECT_FALSE(r.feed(chunks[0]).has_value());
    EXPECT_EQ(r.state(), RxState::Receiving);
    EXPECT_FALSE(r.feed(chunks[0]).has_value());
    EXPECT_EQ(r.restarts(), 1u);
    EXPECT_FALSE(r.feed(chunks[2]).has_value());
    auto done = r.feed(chunks[1]);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, bytes);
    // complete buffers go straight back to Idle
    EXPECT_EQ(r.state(), RxState::Idle);
}

TEST(Frag, Reassembler_AnyOrderAfterFirstSameResult)
{
    auto        bytes  = gen_bytes(200);
    auto        chunks = chunks_of(bytes);
    std::mt19937 rng(1234);

    for (int round = 0; round < 20; ++round)
    {
        // index 0 opens the message, the rest may come in any order
        std::shuffle(chunks.begin() + 1, chunks.end(), rng);
        Reassembler          r;
        std::optional<Bytes> done;
        for (auto &c : chunks)
        {
            ASSERT_FALSE(done.has_value());
            done = r.feed(c);
        }
        ASSERT_TRUE(done.has_value());
        EXPECT_EQ(*done, bytes);
    }
}

TEST(Frag, Reassembler_MissingIndices)
{
    auto chunks = chunks_of(gen_bytes(100));
    ASSERT_EQ(chunks.size(), 4u);

    Reassembler r;
    r.feed(chunks[0]);
    r.feed(chunks[2]);
    r.feed(chunks[3]);
    EXPECT_EQ(r.missing(), std::vector<std::uint8_t>({1}));
    EXPECT_EQ(r.total(), 4u);
    EXPECT_EQ(r.received(), 3u);
}

TEST(Frag, Reassembler_MissingCapped)
{
    auto chunks = chunks_of(gen_bytes(100 * 30));
    ASSERT_EQ(chunks.size(), 100u);

    Reassembler r;
    r.feed(chunks[99]);
    auto missing = r.missing(30);
    ASSERT_EQ(missing.size(), 30u);
    EXPECT_EQ(missing.front(), 0u);
    EXPECT_EQ(missing.back(), 29u);
    EXPECT_EQ(r.missing().size(), 99u);
}

TEST(Frag, Reassembler_DuplicateIsIdempotent)
{
    auto chunks = chunks_of(gen_bytes(100));
    Reassembler r;
    r.feed(chunks[1]);
    r.feed(chunks[3]);
    const auto before = r.missing();

    EXPECT_FALSE(r.feed(chunks[3]).has_value());
    EXPECT_EQ(r.missing(), before);
    EXPECT_EQ(r.received(), 2u);
    EXPECT_EQ(r.state(), RxState::Receiving);
}

TEST(Frag, Reassembler_FirstPacketNeedNotBeIndexZero)
{
    auto bytes  = gen_bytes(60);
    auto chunks = chunks_of(bytes);
    Reassembler r;
    EXPECT_FALSE(r.feed(chunks[1]).has_value());
    EXPECT_EQ(r.state(), RxState::Receiving);
    EXPECT_EQ(r.total(), 2u);
    EXPECT_EQ(r.missing(), std::vector<std::uint8_t>({0}));

    // index 0 asked for again fills the hole
    auto done = r.feed(chunks[0], true);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, bytes);
    EXPECT_EQ(r.restarts(), 0u);
}

TEST(Frag, Reassembler_UnrequestedIndexZeroNeverSplices)
{
    auto a = chunks_of(Bytes(100, 'A'));
    auto b = chunks_of(Bytes(100, 'B'));
    ASSERT_EQ(a.size(), 4u);
    ASSERT_EQ(b.size(), 4u);

    // first chunk of A lost, the rest buffered
    Reassembler r;
    for (std::size_t i = 1; i < a.size(); ++i)
        EXPECT_FALSE(r.feed(a[i]).has_value());

    // same total, but B's index 0 starts B
    EXPECT_FALSE(r.feed(b[0]).has_value());
    EXPECT_EQ(r.restarts(), 1u);
    EXPECT_EQ(r.received(), 1u);

    std::optional<Bytes> done;
    for (std::size_t i = 1; i < b.size(); ++i)
        done = r.feed(b[i]);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, Bytes(100, 'B'));
}

TEST(Frag, Reassembler_RequestedIndexZeroOfOtherSizeRestarts)
{
    auto a = chunks_of(Bytes(100, 'A'));
    auto b = chunks_of(Bytes(50, 'B'));

    Reassembler r;
    r.feed(a[1]);
    r.feed(b[0], true);
    EXPECT_EQ(r.restarts(), 1u);
    EXPECT_EQ(r.total(), 2u);

    // a resend of index 0 we already hold starts over as well
    r.feed(b[0], true);
    EXPECT_EQ(r.restarts(), 2u);
    auto done = r.feed(b[1]);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, Bytes(50, 'B'));
}

TEST(Frag, Reassembler_NewFirstChunkRestarts)
{
    auto first  = chunks_of(gen_bytes(100));
    auto second = chunks_of(Bytes(50, 0xAB));

    Reassembler r;
    r.feed(first[0]);
    r.feed(first[1]);

    // different total: new message, old buffer discarded
    EXPECT_FALSE(r.feed(second[0]).has_value());
    EXPECT_EQ(r.restarts(), 1u);
    EXPECT_EQ(r.total(), 2u);

    // stray chunk of the old message is ignored
    EXPECT_FALSE(r.feed(first[2]).has_value());
    EXPECT_EQ(r.received(), 1u);

    auto done = r.feed(second[1]);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, Bytes(50, 0xAB));
}

TEST(Frag, Reassembler_SameTotalDifferentFirstChunkRestarts)
{
    auto a = chunks_of(Bytes(45, 'a'));
    auto b = chunks_of(Bytes(45, 'b'));

    Reassembler r;
    r.feed(a[0]);
    r.feed(b[0]);
    EXPECT_EQ(r.restarts(), 1u);
    auto done = r.feed(b[1]);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(*done, Bytes(45, 'b'));
}

TEST(Frag, Reassembler_AbandonThenNextMessage)
{
    auto chunks = chunks_of(gen_bytes(100));
    Reassembler r;
    r.feed(chunks[0]);
    r.abandon();
    EXPECT_EQ(r.state(), RxState::Abandoned);
    EXPECT_TRUE(r.missing().empty());

    for (std::size_t i = 0; i + 1 < chunks.size(); ++i)
        EXPECT_FALSE(r.feed(chunks[i]).has_value());
    EXPECT_TRUE(r.feed(chunks.back()).has_value());
}
