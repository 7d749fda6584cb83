/* @file PeriodicTask.cpp
 * @brief cancellable redraw tick
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <stdexcept>

#include "core/PeriodicTask.hpp"

using namespace dcbench::core;

PeriodicTask::PeriodicTask(std::chrono::milliseconds interval, Callback cb)
    : interval_(interval), cb_(std::move(cb)) {
  if (interval_.count() <= 0)
    throw std::invalid_argument("[PeriodicTask] interval must be positive");
}

void PeriodicTask::start(std::chrono::milliseconds now) {
  if (stopped_)
    return;
  running_ = true;
  due_ = now;
}

bool PeriodicTask::poll(std::chrono::milliseconds now) {
  if (!running_ || now < due_)
    return false;

  due_ = now + interval_;
  ++ticks_;
  if (cb_)
    cb_(now);
  return true;
}
