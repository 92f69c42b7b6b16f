#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "app/messenger.hpp"
#include "clip/clipboard.hpp"
#include "proto/error.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::atomic<app::Messenger *> g_messenger{nullptr};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  whistle listen [--forever] [--brave]\n"
                 "  whistle text <text...> [--brave]\n"
                 "  whistle (clip|clipboard) [--brave]\n"
                 "  whistle file <path> [--brave]\n"
                 "  whistle (-h | --help)\n"
                 "\n"
                 "Options:\n"
                 "  --brave    Do not wait for or send acks. A lost packet loses the whole\n"
                 "             message; the listener gives up after WHISTLE_RECV_TIMEOUT_MS.\n"
                 "  --forever  Keep listening after the first message.\n"
                 "\n"
                 "Environment: WHISTLE_UDP_BIND, WHISTLE_UDP_PEER, WHISTLE_PACKET_MS,\n"
                 "  WHISTLE_ACK_WAIT_MS, WHISTLE_ATTEMPT_MS, WHISTLE_RECV_TIMEOUT_MS,\n"
                 "  WHISTLE_SEND_TIMEOUT_MS, WHISTLE_OUT_DIR, WHISTLE_LOG_LEVEL\n");
}

static int exit_code_for(proto::Error err)
{
    switch (err)
    {
        case proto::Error::None:
            return exitc::ok;
        case proto::Error::MessageTooLarge:
            return exitc::too_large;
        case proto::Error::ReceiveTimeout:
        case proto::Error::SendTimeout:
            return exitc::timeout;
        case proto::Error::AckCorrupted:
        case proto::Error::UnknownMessageKind:
        case proto::Error::MalformedFilePayload:
        case proto::Error::PacketDecodeFailure:
            return exitc::protocol;
        case proto::Error::Cancelled:
            return exitc::cancelled;
        case proto::Error::InvalidFileName:
            return exitc::bad_args;
        case proto::Error::TransportFailure:
        case proto::Error::Busy:
        case proto::Error::IoError:
            return exitc::io_error;
    }
    return exitc::io_error;
}

// SIGINT / SIGTERM are blocked everywhere and picked up here, so cancel()
// runs in a normal thread context.
static void start_signal_thread(sigset_t set)
{
    std::thread([set] {
        int sig = 0;
        if (sigwait(&set, &sig) != 0)
            return;
        LOG_DEBUG("signal %d, cancelling", sig);
        if (auto *m = g_messenger.load())
            m->cancel();
    }).detach();
}

struct Invocation
{
    std::string              cmd;
    std::vector<std::string> args;
    bool                     brave   = false;
    bool                     forever = false;
};

static int run(const Invocation &inv)
{
    const auto  role = inv.cmd == "listen" ? config::Role::Listen : config::Role::Send;
    const auto  cfg  = config::from_env(role);
    if (cfg.transport != "udp")
    {
        std::fprintf(stderr, "error: unknown transport '%s' (only udp is available)\n",
                     cfg.transport.c_str());
        return exitc::bad_args;
    }

    app::ChannelOptions opts;
    opts.confirmed       = !inv.brave;
    opts.ack_wait        = config::effective_ack_wait(cfg);
    opts.attempt_timeout = config::effective_attempt_timeout(cfg);
    opts.receive_timeout = cfg.receive_timeout;
    opts.send_timeout    = cfg.send_timeout;

    transport::Settings s{};
    s.role      = role == config::Role::Listen ? "listen" : "send";
    s.bind_addr = cfg.bind_addr;
    s.peer_addr = cfg.peer_addr;

    transport::UdpTransport tx;
    clip::KlipperClipboard  clipboard;
    app::Messenger          messenger(tx, clipboard, opts, cfg.out_dir);
    if (!messenger.start(s))
    {
        std::fprintf(stderr, "error: transport failed to start\n");
        return exitc::io_error;
    }
    g_messenger.store(&messenger);

    std::unordered_map<std::string, std::function<proto::Error()>> cmd_map = {
        {"listen",
         [&]() -> proto::Error {
             LOG_SYSTEM("Listening%s...", inv.forever ? " (until interrupted)" : "");
             return messenger.listen(inv.forever);
         }},
        {"text",
         [&]() -> proto::Error {
             std::string text;
             for (size_t i = 0; i < inv.args.size(); ++i)
             {
                 if (i > 0)
                     text.push_back(' ');
                 text += inv.args[i];
             }
             return messenger.send_text(text);
         }},
        {"clip", [&]() -> proto::Error { return messenger.send_clipboard(); }},
        {"clipboard", [&]() -> proto::Error { return messenger.send_clipboard(); }},
        {"file", [&]() -> proto::Error { return messenger.send_file(inv.args[0]); }},
    };

    LOG_DEBUG("Running command: %s", inv.cmd.c_str());
    proto::Error err = cmd_map.at(inv.cmd)();
    g_messenger.store(nullptr);
    messenger.stop();

    if (err == proto::Error::Cancelled)
        std::fprintf(stderr, "Whistle was stopped.\n");
    else if (err != proto::Error::None)
        std::fprintf(stderr, "error: %s (%s)\n", proto::error_text(err), proto::error_name(err));
    else if (role == config::Role::Send && inv.brave)
        std::fprintf(stderr, "Sent (brave mode, delivery not confirmed).\n");
    else if (role == config::Role::Send)
        std::fprintf(stderr, messenger.channel().last_send().confirmed
                                 ? "Sent, receiver confirmed.\n"
                                 : "Sent, no confirmation from the receiver.\n");
    return exit_code_for(err);
}

}  // namespace

int main(int argc, char **argv)
{
    // log level from env var
    if (const char *log_level = std::getenv("WHISTLE_LOG_LEVEL"))
        whistle::set_log_level_by_name(log_level);

    Invocation inv;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--brave")
            inv.brave = true;
        else if (a == "--forever")
            inv.forever = true;
        else if (inv.cmd.empty())
            inv.cmd = std::move(a);
        else
            inv.args.push_back(std::move(a));
    }

    const bool ok_args = (inv.cmd == "listen" && inv.args.empty()) ||
                         (inv.cmd == "text" && !inv.args.empty()) ||
                         ((inv.cmd == "clip" || inv.cmd == "clipboard") && inv.args.empty()) ||
                         (inv.cmd == "file" && inv.args.size() == 1);
    if (!ok_args)
    {
        if (!inv.cmd.empty() && inv.cmd != "listen" && inv.cmd != "text" && inv.cmd != "clip" &&
            inv.cmd != "clipboard" && inv.cmd != "file")
            std::fprintf(stderr, "Unknown command: %s\n", inv.cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    if (inv.forever && inv.cmd != "listen")
    {
        std::fprintf(stderr, "error: --forever only applies to listen\n");
        return exitc::bad_args;
    }

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    start_signal_thread(set);

    return run(inv);
}
