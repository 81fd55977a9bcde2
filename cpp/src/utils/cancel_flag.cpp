#include "cancel_flag.hpp"

#include <atomic>
#include <csignal>

namespace lyricvid {
namespace utils {

namespace {
std::atomic<bool> g_cancel_requested{false};
std::atomic<int> g_cancel_signal{0};
bool g_handlers_installed = false;

void handle_signal(int signum) {
    g_cancel_signal.store(signum, std::memory_order_relaxed);
    g_cancel_requested.store(true, std::memory_order_relaxed);
    // Next delivery of the same signal uses the default action
    std::signal(signum, SIG_DFL);
}
} // namespace

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    g_handlers_installed = true;
}

bool is_cancel_requested() {
    return g_cancel_requested.load(std::memory_order_relaxed);
}

void request_cancel() {
    g_cancel_requested.store(true, std::memory_order_relaxed);
}

int cancel_signal() {
    return g_cancel_signal.load(std::memory_order_relaxed);
}

void reset_cancel() {
    g_cancel_requested.store(false, std::memory_order_relaxed);
    g_cancel_signal.store(0, std::memory_order_relaxed);
    if (g_handlers_installed) {
        install_signal_handlers();
    }
}

} // namespace utils
} // namespace lyricvid
