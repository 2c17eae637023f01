#include "reconkit/cli/interrupt_guard.hpp"

#include <atomic>

namespace reconkit::cli {

namespace {

std::atomic<std::atomic<bool>*> g_cancel_flag{nullptr};
std::atomic<bool> g_triggered{false};

static_assert(std::atomic<std::atomic<bool>*>::is_always_lock_free,
              "signal bridge pointer must be lock-free");

void HandleInterrupt(int /*signum*/) {
  std::atomic<bool>* flag = g_cancel_flag.load();
  if (flag != nullptr) {
    flag->store(true);
  }
  g_triggered.store(true);
}

} // namespace

InterruptGuard::InterruptGuard(core::CancellationToken& token) {
  std::atomic<bool>* expected = nullptr;
  if (!g_cancel_flag.compare_exchange_strong(expected, token.flag())) {
    // Nested guard: the outer one already routes signals to a live token.
    return;
  }
  g_triggered.store(false);

  struct sigaction action {};
  action.sa_handler = HandleInterrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, &previous_int_) != 0) {
    g_cancel_flag.store(nullptr);
    return;
  }
  if (sigaction(SIGTERM, &action, &previous_term_) != 0) {
    (void)sigaction(SIGINT, &previous_int_, nullptr);
    g_cancel_flag.store(nullptr);
    return;
  }
  installed_ = true;
}

InterruptGuard::~InterruptGuard() {
  if (!installed_) {
    return;
  }
  (void)sigaction(SIGINT, &previous_int_, nullptr);
  (void)sigaction(SIGTERM, &previous_term_, nullptr);
  g_cancel_flag.store(nullptr);
}

bool InterruptGuard::Triggered() {
  return g_triggered.load();
}

} // namespace reconkit::cli
