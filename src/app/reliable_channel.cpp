#include <algorithm>
#include <utility>

#include "app/reliable_channel.hpp"
#include "proto/ack.hpp"
#include "util/log.hpp"

namespace app
{

// Attaches the channel's listener for one session and detaches it on every
// exit path.
class ReliableChannel::SessionGuard
{
  public:
    SessionGuard(ReliableChannel &ch, Session s) : ch_(ch), err_(ch.acquire(s)) {}
    ~SessionGuard()
    {
        if (err_ == proto::Error::None)
            ch_.release();
    }
    SessionGuard(const SessionGuard &)            = delete;
    SessionGuard &operator=(const SessionGuard &) = delete;

    proto::Error error() const { return err_; }

  private:
    ReliableChannel &ch_;
    proto::Error     err_;
};

static long long to_ms(std::chrono::milliseconds d)
{
    return static_cast<long long>(d.count());
}

ReliableChannel::ReliableChannel(transport::ITransport &t, ChannelOptions opts)
    : tx_(t), opts_(opts)
{
}

proto::Error ReliableChannel::acquire(Session s)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancel_)
            return proto::Error::Cancelled;
        if (session_ != Session::Idle)
        {
            LOG_WARN("acquire: transport already owned by another session");
            return proto::Error::Busy;
        }
        session_ = s;
        events_.clear();
    }
    tx_.set_receiver([this](const transport::RxEvent &ev) { on_event(ev); });
    return proto::Error::None;
}

void ReliableChannel::release()
{
    tx_.clear_receiver();
    std::lock_guard<std::mutex> lk(mu_);
    session_ = Session::Idle;
    events_.clear();
}

void ReliableChannel::on_event(const transport::RxEvent &ev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_ == Session::Idle)
            return;
        events_.push_back(ev);
    }
    cv_.notify_all();
}

proto::Error ReliableChannel::wait_events(std::deque<transport::RxEvent> &out,
                                          std::optional<TimePoint>        deadline)
{
    std::unique_lock<std::mutex> lk(mu_);
    auto ready = [this] { return cancel_ || !events_.empty(); };
    if (deadline)
        cv_.wait_until(lk, *deadline, ready);
    else
        cv_.wait(lk, ready);
    if (cancel_)
        return proto::Error::Cancelled;
    out.swap(events_);
    events_.clear();
    return proto::Error::None;
}

void ReliableChannel::drop_events()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!events_.empty())
        LOG_DEBUG("dropping %zu stale events", events_.size());
    events_.clear();
}

void ReliableChannel::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancel_ = true;
    }
    cv_.notify_all();
}

bool ReliableChannel::cancelled() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return cancel_;
}

Session ReliableChannel::session() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_;
}

// ---------------------------------------------------------------- sender

proto::Error ReliableChannel::send(const frag::Bytes &framed)
{
    // size errors surface before the transport is touched
    std::vector<frag::Chunk> chunks;
    proto::Error             err = frag::make_chunks(framed, chunks);
    if (err != proto::Error::None)
        return err;

    std::vector<frag::Bytes> frames;
    frames.reserve(chunks.size());
    for (const auto &c : chunks)
        frames.push_back(frag::serialize(c));

    SessionGuard guard(*this, Session::Sending);
    if (guard.error() != proto::Error::None)
        return guard.error();

    send_report_         = SendReport{};
    send_report_.packets = chunks.size();
    const auto total     = static_cast<std::uint8_t>(chunks.size());
    const auto give_up   = Clock::now() + opts_.send_timeout;

    std::vector<std::uint8_t> pending(chunks.size());
    for (std::size_t i = 0; i < pending.size(); i++)
        pending[i] = static_cast<std::uint8_t>(i);

    LOG_INFO("sending %zu bytes in %u packets (%s mode)", framed.size(), (unsigned)total,
             opts_.confirmed ? "confirmed" : "brave");

    while (true)
    {
        send_report_.rounds++;
        drop_events();
        for (std::uint8_t idx : pending)
        {
            if (cancelled())
                return proto::Error::Cancelled;
            if (!tx_.send(frames[idx]))
            {
                LOG_ERROR("send: transport refused packet %u/%u", (unsigned)idx, (unsigned)total);
                return proto::Error::TransportFailure;
            }
            LOG_DEBUG("sent packet %u/%u", (unsigned)idx + 1, (unsigned)total);
        }
        if (send_report_.rounds > 1)
            send_report_.resent += pending.size();

        if (!opts_.confirmed)
            return proto::Error::None;

        std::vector<std::uint8_t> missing;
        bool                      got_ack = false;
        err = await_ack(Clock::now() + opts_.ack_wait, total, missing, got_ack);
        if (err != proto::Error::None)
            return err;

        if (!got_ack)
        {
            // one wait per round: favour forward progress over certainty
            LOG_WARN("no ack within %lld ms, assuming the message arrived",
                     to_ms(opts_.ack_wait));
            return proto::Error::None;
        }
        if (missing.empty())
        {
            send_report_.confirmed = true;
            LOG_INFO("receiver confirmed all %u packets after %zu round(s)", (unsigned)total,
                     send_report_.rounds);
            return proto::Error::None;
        }
        if (Clock::now() >= give_up)
        {
            LOG_ERROR("send: still %zu packets missing after %lld ms, giving up", missing.size(),
                      to_ms(opts_.send_timeout));
            return proto::Error::SendTimeout;
        }
        LOG_INFO("receiver is missing %zu packet(s), resending", missing.size());
        pending = std::move(missing);
    }
}

proto::Error ReliableChannel::await_ack(TimePoint                  deadline,
                                        std::uint8_t               total,
                                        std::vector<std::uint8_t> &missing,
                                        bool                      &got_ack)
{
    got_ack = false;
    std::deque<transport::RxEvent> batch;
    while (Clock::now() < deadline)
    {
        proto::Error err = wait_events(batch, deadline);
        if (err != proto::Error::None)
            return err;

        for (const auto &ev : batch)
        {
            if (!ev.ok)
            {
                // keep waiting, the receiver repeats its ack after an attempt timeout
                LOG_WARN("await_ack: %s while waiting for ack",
                         proto::error_name(proto::Error::PacketDecodeFailure));
                continue;
            }
            if (ack::parse_ack(ev.frame, missing) != proto::Error::None)
            {
                LOG_ERROR("await_ack: ack marker 0x%02x, expected 0x00",
                          ev.frame.empty() ? 0u : (unsigned)ev.frame[0]);
                return proto::Error::AckCorrupted;
            }
            for (std::uint8_t idx : missing)
            {
                if (idx >= total)
                {
                    LOG_ERROR("await_ack: ack requests packet %u of %u", (unsigned)idx,
                              (unsigned)total);
                    return proto::Error::AckCorrupted;
                }
            }
            std::sort(missing.begin(), missing.end());
            missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
            got_ack = true;
            return proto::Error::None;
        }
        batch.clear();
    }
    return proto::Error::None;
}

// -------------------------------------------------------------- receiver

bool ReliableChannel::send_ack(const std::vector<std::uint8_t> &missing)
{
    recv_report_.acks_sent++;
    if (!tx_.send(ack::encode_ack(missing)))
    {
        LOG_WARN("send_ack: transport refused ack");
        return false;
    }
    if (missing.empty())
        LOG_DEBUG("ack sent: nothing missing");
    else
        LOG_INFO("ack sent: requesting %zu packet(s), first %u", missing.size(),
                 (unsigned)missing.front());
    return true;
}

proto::Error ReliableChannel::receive(frag::Bytes &out)
{
    SessionGuard guard(*this, Session::Receiving);
    if (guard.error() != proto::Error::None)
        return guard.error();

    recv_report_ = ReceiveReport{};
    rx_.reset();

    std::optional<TimePoint> overall;  // armed by the first packet of a message
    std::optional<TimePoint> attempt;  // confirmed mode: next unprompted ack
    std::optional<TimePoint> idle;
    if (opts_.idle_timeout.count() > 0)
        idle = Clock::now() + opts_.idle_timeout;

    // highest index the sender is expected to transmit in the current round
    std::uint8_t round_last = 0;
    bool         ack_due    = false;
    // an outstanding ack asked for index 0, so the next index 0 is a resend
    bool first_requested = false;

    std::deque<transport::RxEvent> batch;
    while (true)
    {
        std::optional<TimePoint> deadline = overall ? overall : idle;
        if (opts_.confirmed && attempt && (!deadline || *attempt < *deadline))
            deadline = attempt;

        proto::Error err = wait_events(batch, deadline);
        if (err != proto::Error::None)
        {
            rx_.abandon();
            return err;
        }

        const auto now = Clock::now();
        for (const auto &ev : batch)
        {
            std::optional<frag::Chunk> c;
            if (ev.ok)
                c = frag::parse(ev.frame);
            if (!c)
            {
                recv_report_.decode_failures++;
                LOG_WARN("receive: %s%s", proto::error_name(proto::Error::PacketDecodeFailure),
                         opts_.confirmed ? "" : " (brave mode, this packet is lost for good)");
                continue;
            }
            recv_report_.packets++;

            const bool        fresh    = rx_.state() != frag::RxState::Receiving;
            const std::size_t restarts = rx_.restarts();
            auto              full     = rx_.feed(*c, first_requested);
            if (fresh || rx_.restarts() != restarts)
            {
                overall    = now + opts_.receive_timeout;
                round_last = static_cast<std::uint8_t>(c->hdr.total - 1);
                attempt.reset();
                ack_due         = false;
                first_requested = false;
                LOG_INFO("receiving a message of %u packet(s)", (unsigned)c->hdr.total);
            }
            if (full)
            {
                if (opts_.confirmed)
                    send_ack({});
                out = std::move(*full);
                LOG_INFO("message complete, %zu bytes", out.size());
                return proto::Error::None;
            }
            if (rx_.has(0))
                first_requested = false;
            // only chunks the buffer took count as progress
            if (rx_.state() == frag::RxState::Receiving && rx_.total() == c->hdr.total)
            {
                attempt = now + opts_.attempt_timeout;
                if (c->hdr.index == round_last)
                    ack_due = true;
            }
        }
        batch.clear();

        if (rx_.state() != frag::RxState::Receiving)
        {
            if (idle && now >= *idle)
            {
                LOG_WARN("receive: nothing arrived within %lld ms", to_ms(opts_.idle_timeout));
                return proto::Error::ReceiveTimeout;
            }
            continue;
        }

        if (overall && now >= *overall)
        {
            LOG_ERROR("receive: %zu of %u packets after %lld ms, abandoning message",
                      rx_.received(), (unsigned)rx_.total(), to_ms(opts_.receive_timeout));
            rx_.abandon();
            return proto::Error::ReceiveTimeout;
        }

        if (opts_.confirmed && (ack_due || (attempt && now >= *attempt)))
        {
            auto missing = rx_.missing(ack::MAX_MISSING);
            if (!missing.empty())
            {
                send_ack(missing);
                round_last = missing.back();
                if (missing.front() == 0)
                    first_requested = true;
            }
            ack_due = false;
            attempt = now + opts_.attempt_timeout;
        }
    }
}

}  // namespace app
