#pragma once
/** @file  PeriodicTask.hpp
 *  @brief Cooperative fixed-interval tick with a one-way running flag.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <functional>

namespace dcbench::core {

  /**
 * @class PeriodicTask
 * @brief Fires a callback at most once per interval when its owner polls it.
 *
 *  * Non-blocking: `poll()` is called periodically by the owner's loop.
 *  * Checks the running flag on every poll; `stop()` is permanent, a stopped
 *    task never fires again even if `start()` is called afterwards.
 *  * Missed intervals are not replayed.
 */
  class PeriodicTask {
  public:
    using Callback = std::function<void(std::chrono::milliseconds now)>;

    PeriodicTask(std::chrono::milliseconds interval, Callback cb);

    /// Arm the task; the first tick is due at \p now.
    void start(std::chrono::milliseconds now);

    /** @returns true if the callback ran. */
    bool poll(std::chrono::milliseconds now);

    void stop() {
      running_ = false;
      stopped_ = true;
    }

    bool running() const { return running_; }
    std::size_t ticks() const { return ticks_; }
    std::chrono::milliseconds interval() const { return interval_; }

  private:
    std::chrono::milliseconds interval_;
    Callback cb_;
    std::chrono::milliseconds due_{ 0 };
    std::size_t ticks_{ 0 };
    bool running_{ false };
    bool stopped_{ false };
  };

} // namespace dcbench::core
