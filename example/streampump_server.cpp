#include "streampump/core/unique_fd.hpp"
#include "streampump/nonblocking/tcp.hpp"
#include "streampump/runtime/event_loop.hpp"
#include "streampump/runtime/io_ops.hpp"
#include "streampump/runtime/worker_pool.hpp"
#include "streampump/services/chat.hpp"
#include "streampump/services/detection.hpp"
#include "streampump/services/server_options.hpp"
#include "streampump/services/session_manager.hpp"

#include <sys/signalfd.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace {

namespace sp = streampump;

streampump::unique_fd open_signal_fd() {
    sigset_t mask;
    ::sigemptyset(&mask);
    ::sigaddset(&mask, SIGINT);
    ::sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) != 0) {
        return {};
    }
    return streampump::unique_fd{
        ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC)};
}

sp::runtime::task<void> watch_signals(int signal_fd,
                                      sp::services::session_manager& sessions,
                                      sp::runtime::cancel_token token) {
    const auto ready = co_await sp::runtime::wait_readable(signal_fd, token);
    if (ready.has_value()) {
        signalfd_siginfo info{};
        if (::read(signal_fd, &info, sizeof(info)) == sizeof(info)) {
            std::cerr << "signal " << info.ssi_signo << ", shutting down\n";
        }
        sessions.shutdown();
    }
}

sp::runtime::task<void> run_server(sp::services::session_manager& sessions,
                                   sp::nonblocking::tcp_listener& listener,
                                   const sp::runtime::cancel_source& watcher,
                                   int& exit_code) {
    const auto served = co_await sessions.serve(listener);
    if (!served.has_value()) {
        std::cerr << "accept failed: " << served.error().message() << '\n';
        exit_code = 1;
        sessions.shutdown();
    }
    watcher.request_stop();
}

void print_report(const sp::pipeline::pump_report& report) {
    std::cerr << "session " << report.connection_id << ' ' << report.endpoint
              << " ended: " << sp::pipeline::to_string(report.reason)
              << " received=" << report.stats.frames_received
              << " dropped=" << report.stats.frames_dropped
              << " processed=" << report.stats.frames_processed
              << " sent=" << report.stats.results_sent
              << " events=" << report.stats.events_forwarded;
    if (report.failure.has_value()) {
        std::cerr << " error=\"" << report.failure->message() << '"';
    }
    if (report.close_error.has_value()) {
        std::cerr << " close_error=\"" << report.close_error->message() << '"';
    }
    std::cerr << '\n';
}

} // namespace

int main(int argc, char** argv) {
    const auto parsed = sp::services::parse_server_options(argc, argv);
    if (!parsed.has_value()) {
        std::cerr << parsed.error() << '\n'
                  << sp::services::usage("streampump_server");
        return 2;
    }
    const auto& options = parsed.value();
    if (options.show_help) {
        std::cout << sp::services::usage("streampump_server");
        return 0;
    }

    auto listener_result = sp::nonblocking::tcp_listener::bind(
        sp::nonblocking::endpoint{options.host, options.port}, options.backlog);
    if (!listener_result.has_value()) {
        std::cerr << "bind failed: " << listener_result.error().message()
                  << '\n';
        return 1;
    }
    auto listener = std::move(listener_result.value());

    auto signal_fd = open_signal_fd();
    if (!signal_fd.valid()) {
        std::cerr << "signal setup failed\n";
        return 1;
    }

    // Session frames left in the loop reference the services, and pool jobs
    // resume into the loop: services outlive the loop, the loop outlives the pool.
    sp::services::probe_detector model{options.inference_latency};
    sp::services::detection_predictor detection{model, options.score_threshold};
    sp::services::broadcast_hub hub{options.chat_inbox_capacity};

    sp::runtime::event_loop loop;
    if (!loop.valid()) {
        std::cerr << "event loop init failed\n";
        return 1;
    }

    sp::runtime::worker_pool pool{options.worker_threads};

    sp::services::session_manager sessions{
        loop, options, sp::services::service_set{&detection, &pool, &hub}};
    sessions.on_report(print_report);

    const auto port = listener.local_port();
    std::cerr << "listening on " << options.host << ':'
              << (port.has_value() ? port.value() : options.port) << '\n';

    int exit_code = 0;
    sp::runtime::cancel_source watcher;
    loop.spawn(watch_signals(signal_fd.get(), sessions, watcher.token()));
    loop.spawn(run_server(sessions, listener, watcher, exit_code));

    const auto run_status = loop.run();
    if (!run_status.has_value()) {
        std::cerr << "runtime failed: " << run_status.error().message() << '\n';
        return 1;
    }

    const auto& totals = sessions.stats();
    std::cerr << "sessions=" << totals.sessions_opened
              << " failed=" << totals.sessions_failed
              << " rejected=" << totals.handshakes_rejected
              << " frames=" << totals.frames_received
              << " dropped=" << totals.frames_dropped << '\n';
    return exit_code;
}
