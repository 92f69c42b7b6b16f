#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "proto/error.hpp"
#include "util/constants.hpp"

/*
TX:
messenger.send_*(...)
  -> framer::encode(kind, payload)           // [kind]['|'][payload]
     -> make_chunks(framed, chunks)          // ceil(n / 30) chunks, index from 0
        -> for each Chunk {hdr, data}:
             serialize(Chunk)                // [total][index][data <= 30B]
               -> transport.send(frame_bytes)

RX:
transport receiver(frame_bytes)
  -> parse(frame_bytes)                      // validate and extract Chunk
      -> ok? reassembler.feed(Chunk)
            -> Complete ? framer::decode(...) -> router
*/

namespace frag
{

using Bytes = std::vector<std::uint8_t>;

// On-wire chunk header
struct Header
{
    std::uint8_t total{0};  // 1B, 1..255
    std::uint8_t index{0};  // 1B, 0..total-1
};

struct Chunk
{
    Header hdr;
    Bytes  data;  // <= DATA_LEN
};

// TX
proto::Error make_chunks(const Bytes &message, std::vector<Chunk> &out);
Bytes        serialize(const Chunk &c);
// RX
std::optional<Chunk> parse(const Bytes &frame);

enum class RxState
{
    Idle,
    Receiving,
    Complete,
    Abandoned
};

const char *state_name(RxState s);

// Reassembly buffer for the single in-flight message.
class Reassembler
{
  public:
    // Feed one chunk, return complete message if done. A completed buffer is
    // reset to Idle before returning.
    // Index 0 always starts a new message, except when `first_requested` says
    // the receiver asked for index 0 of the current one and it is still missing.
    std::optional<Bytes> feed(const Chunk &c, bool first_requested = false);

    // Missing indices in increasing order, at most `limit` of them.
    std::vector<std::uint8_t> missing(std::size_t limit = std::numeric_limits<std::size_t>::max()) const;

    void abandon();
    void reset();

    RxState      state() const { return state_; }
    std::uint8_t total() const { return total_; }
    std::size_t  received() const { return received_; }
    bool         has(std::uint8_t index) const { return index < total_ && have_[index]; }
    // how many times an incomplete buffer was discarded for a new message
    std::size_t  restarts() const { return restarts_; }

  private:
    void begin(std::uint8_t total);

    RxState            state_{RxState::Idle};
    std::uint8_t       total_{0};
    std::size_t        received_{0};
    std::size_t        bytes_{0};
    std::vector<Bytes> parts_;  // size == total
    std::vector<bool>  have_;   // size == total
    std::size_t        restarts_{0};
};

}  // namespace frag
