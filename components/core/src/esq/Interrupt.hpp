#ifndef ESQ_INTERRUPT_HPP
#define ESQ_INTERRUPT_HPP

#include <chrono>

namespace esq {
/**
 * Installs SIGINT and SIGTERM handlers that only raise the interrupt flag, so that long-running
 * commands can unwind through their normal exit path.
 */
void install_interrupt_handlers();

[[nodiscard]] auto is_interrupted() -> bool;

void set_interrupted(bool interrupted);

/**
 * Sleeps for the given duration in short slices, waking up early if an interrupt arrives.
 * @param duration
 * @return false if the sleep was cut short by an interrupt, true otherwise
 */
auto sleep_unless_interrupted(std::chrono::milliseconds duration) -> bool;
}  // namespace esq

#endif  // ESQ_INTERRUPT_HPP
