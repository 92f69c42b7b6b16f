#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "proto/error.hpp"
#include "proto/frag.hpp"
#include "transport/itransport.hpp"

/*
Confirmed mode, one message:

  sender                                   receiver
  ------                                   --------
  attach ack listener (Sending)            attach packet listener (Receiving)
  send chunk 0..n-1      ───────────────▶  feed reassembler
  wait <= ack_wait                         last index seen, or attempt timeout:
                         ◀───────────────    ack [missing...] (<= 30 indices)
  resend listed chunks   ───────────────▶  feed reassembler
  wait <= ack_wait                         complete:
                         ◀───────────────    ack [] , deliver message
  done (confirmed)

No ack within a round means the sender gives up waiting and reports the
message as sent but unconfirmed. Brave mode skips every ack step.
*/

namespace app
{

struct ChannelOptions
{
    bool                      confirmed{true};
    std::chrono::milliseconds ack_wait{10000};         // sender, per round
    std::chrono::milliseconds attempt_timeout{7500};   // receiver, per ack attempt
    std::chrono::milliseconds receive_timeout{300000}; // receiver, whole message
    std::chrono::milliseconds send_timeout{300000};    // sender, all rounds
    std::chrono::milliseconds idle_timeout{0};         // receiver, before a first packet; 0 = none
};

struct SendReport
{
    std::size_t packets{0};  // chunks in the message
    std::size_t rounds{0};
    std::size_t resent{0};   // chunks sent again on request
    bool        confirmed{false};
};

struct ReceiveReport
{
    std::size_t packets{0};
    std::size_t decode_failures{0};
    std::size_t acks_sent{0};
};

enum class Session
{
    Idle,
    Receiving,
    Sending
};

// Reliability layer over one transport. Owns the transport's receiver slot
// while a send or receive is running; one session at a time.
class ReliableChannel
{
  public:
    ReliableChannel(transport::ITransport &t, ChannelOptions opts);
    ~ReliableChannel() = default;
    ReliableChannel(const ReliableChannel &)            = delete;
    ReliableChannel &operator=(const ReliableChannel &) = delete;

    // Blocks until the message is sent (and confirmed, in confirmed mode).
    proto::Error send(const frag::Bytes &framed);
    // Blocks until one whole message is reassembled into `out`.
    proto::Error receive(frag::Bytes &out);

    // Wakes any blocked send/receive, which returns Cancelled. Sticky: later
    // operations return Cancelled too.
    void cancel();
    bool cancelled() const;

    Session               session() const;
    const ChannelOptions &options() const { return opts_; }
    const SendReport     &last_send() const { return send_report_; }
    const ReceiveReport  &last_receive() const { return recv_report_; }

  private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    class SessionGuard;

    proto::Error acquire(Session s);
    void         release();
    void         on_event(const transport::RxEvent &ev);
    proto::Error wait_events(std::deque<transport::RxEvent> &out,
                             std::optional<TimePoint>        deadline);
    void         drop_events();

    proto::Error await_ack(TimePoint                  deadline,
                           std::uint8_t               total,
                           std::vector<std::uint8_t> &missing,
                           bool                      &got_ack);
    bool         send_ack(const std::vector<std::uint8_t> &missing);

    transport::ITransport &tx_;
    ChannelOptions         opts_;
    frag::Reassembler      rx_;

    mutable std::mutex             mu_;
    std::condition_variable        cv_;
    std::deque<transport::RxEvent> events_;
    Session                        session_{Session::Idle};
    bool                           cancel_{false};

    SendReport    send_report_{};
    ReceiveReport recv_report_{};
};

}  // namespace app
