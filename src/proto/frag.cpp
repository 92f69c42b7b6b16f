#include <algorithm>
#include <cstdint>
#include <cstring>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

using constants::DATA_LEN;
using constants::HDR_SIZE;
using constants::MAX_CHUNKS;

proto::Error make_chunks(const Bytes &message, std::vector<Chunk> &out)
{
    out.clear();
    if (message.empty())
    {
        Chunk c;
        c.hdr.total = 1;
        c.hdr.index = 0;
        out.push_back(std::move(c));
        return proto::Error::None;
    }

    const std::size_t num_chunks = (message.size() + DATA_LEN - 1) / DATA_LEN;
    if (num_chunks > MAX_CHUNKS)
    {
        LOG_ERROR("make_chunks: message too large (%zu bytes, needs %zu chunks)", message.size(),
                  num_chunks);
        return proto::Error::MessageTooLarge;
    }

    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        std::size_t start = i * DATA_LEN;
        std::size_t take  = std::min(DATA_LEN, message.size() - start);
        Chunk       c;
        c.hdr.total = static_cast<std::uint8_t>(num_chunks);
        c.hdr.index = static_cast<std::uint8_t>(i);
        c.data.assign(message.begin() + start, message.begin() + start + take);
        out.push_back(std::move(c));
    }
    return proto::Error::None;
}

Bytes serialize(const Chunk &c)
{
    if (c.hdr.total == 0 || c.hdr.index >= c.hdr.total || c.data.size() > DATA_LEN)
    {
        LOG_ERROR("serialize: invalid chunk (total=%u index=%u len=%zu)", (unsigned)c.hdr.total,
                  (unsigned)c.hdr.index, c.data.size());
        return {};
    }

    Bytes out(HDR_SIZE + c.data.size());
    out[0] = c.hdr.total;
    out[1] = c.hdr.index;
    if (!c.data.empty())
        std::memcpy(out.data() + HDR_SIZE, c.data.data(), c.data.size());
    return out;
}

std::optional<Chunk> parse(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE)
    {
        LOG_WARN("parse: frame too short! (%zu)", frame.size());
        return std::nullopt;
    }
    if (frame.size() > HDR_SIZE + DATA_LEN)
    {
        LOG_WARN("parse: frame too long (%zu)", frame.size());
        return std::nullopt;
    }
    Chunk c;
    c.hdr.total = frame[0];
    c.hdr.index = frame[1];
    if (c.hdr.total == 0 || c.hdr.index >= c.hdr.total)
    {
        LOG_WARN("parse: invalid header (total=%u index=%u)", (unsigned)c.hdr.total,
                 (unsigned)c.hdr.index);
        return std::nullopt;
    }
    c.data.assign(frame.begin() + HDR_SIZE, frame.end());
    return c;
}

const char *state_name(RxState s)
{
    switch (s)
    {
        case RxState::Idle:
            return "Idle";
        case RxState::Receiving:
            return "Receiving";
        case RxState::Complete:
            return "Complete";
        case RxState::Abandoned:
            return "Abandoned";
    }
    return "?";
}

void Reassembler::begin(std::uint8_t total)
{
    state_    = RxState::Receiving;
    total_    = total;
    received_ = 0;
    bytes_    = 0;
    parts_.assign(total, {});
    have_.assign(total, false);
}

std::optional<Bytes> Reassembler::feed(const Chunk &c, bool first_requested)
{
    // make sure this is a valid chunk
    if (c.hdr.total == 0 || c.hdr.index >= c.hdr.total || c.data.size() > DATA_LEN)
    {
        LOG_ERROR("Reassembler::feed: invalid chunk");
        return std::nullopt;
    }

    if (state_ != RxState::Receiving)
    {
        begin(c.hdr.total);
    }
    else if (c.hdr.index == 0)
    {
        // index 0 opens a new message unless this buffer asked for it again
        const bool resend = first_requested && c.hdr.total == total_ && !have_[0];
        if (!resend)
        {
            LOG_WARN("Reassembler::feed: new message while %zu/%u chunks pending, restarting",
                     received_, (unsigned)total_);
            restarts_++;
            begin(c.hdr.total);
        }
    }
    else if (c.hdr.total != total_)
    {
        LOG_WARN("Reassembler::feed: chunk %u claims total %u, expected %u; dropped",
                 (unsigned)c.hdr.index, (unsigned)c.hdr.total, (unsigned)total_);
        return std::nullopt;
    }

    const std::uint8_t idx = c.hdr.index;
    if (!have_[idx])
    {
        parts_[idx] = c.data;
        have_[idx]  = true;
        received_++;
        bytes_ += c.data.size();
    }
    else
    {
        // overwrite in place, the index set does not change
        bytes_ = bytes_ - parts_[idx].size() + c.data.size();
        parts_[idx] = c.data;
        LOG_DEBUG("Reassembler::feed: duplicate chunk %u/%u", (unsigned)idx, (unsigned)total_);
    }

    if (received_ < total_)
        return std::nullopt;  // not done yet

    // reassemble by index, arrival order does not matter
    state_ = RxState::Complete;
    Bytes out;
    out.reserve(bytes_);
    for (const auto &part : parts_)
        out.insert(out.end(), part.begin(), part.end());

    LOG_DEBUG("Reassembler::feed: complete, %u chunks, %zu bytes", (unsigned)total_, out.size());
    reset();
    return out;
}

std::vector<std::uint8_t> Reassembler::missing(std::size_t limit) const
{
    std::vector<std::uint8_t> out;
    if (state_ != RxState::Receiving)
        return out;
    for (std::size_t i = 0; i < total_ && out.size() < limit; i++)
    {
        if (!have_[i])
            out.push_back(static_cast<std::uint8_t>(i));
    }
    return out;
}

void Reassembler::abandon()
{
    if (state_ == RxState::Receiving)
    {
        LOG_WARN("Reassembler::abandon: dropping message with %zu/%u chunks", received_,
                 (unsigned)total_);
    }
    reset();
    state_ = RxState::Abandoned;
}

void Reassembler::reset()
{
    state_    = RxState::Idle;
    total_    = 0;
    received_ = 0;
    bytes_    = 0;
    parts_.clear();
    have_.clear();
}

}  // namespace frag
