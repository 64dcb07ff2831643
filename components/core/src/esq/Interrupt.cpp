#include "Interrupt.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

#include <signal.h>

namespace esq {
namespace {
constexpr std::chrono::milliseconds cSleepSlice{100};

volatile std::sig_atomic_t g_interrupted = 0;

void interrupt_handler(int /*signal*/) {
    g_interrupted = 1;
}
}  // namespace

void install_interrupt_handlers() {
    struct sigaction action {};
    action.sa_handler = interrupt_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

auto is_interrupted() -> bool {
    return 0 != g_interrupted;
}

void set_interrupted(bool interrupted) {
    g_interrupted = interrupted ? 1 : 0;
}

auto sleep_unless_interrupted(std::chrono::milliseconds duration) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + duration;
    while (false == is_interrupted()) {
        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto const remaining
                = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, cSleepSlice));
    }
    return false;
}
}  // namespace esq
