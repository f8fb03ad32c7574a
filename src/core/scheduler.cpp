#include "tidewater/core/scheduler.h"

#include <algorithm>
#include <cmath>

#include "tidewater/core/errors.h"
#include "tidewater/util/log.h"
#include "tidewater/util/strings.h"

namespace tidewater {

namespace {

// Accumulated float steps may overshoot `until` by a few ulps (3 * 0.1h).
bool within_horizon(double wake_time, double until) {
  const double tolerance = 1e-9 * std::max(1.0, std::fabs(until));
  return wake_time <= until + tolerance;
}

} // namespace

void Scheduler::start(std::unique_ptr<Process> p) {
  std::size_t slot = 0;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
    slots_[slot] = std::move(p);
  } else {
    slot = slots_.size();
    slots_.push_back(std::move(p));
  }
  enqueue(now_, slot);
}

void Scheduler::enqueue(double wake_time, std::size_t slot) {
  Entry e;
  e.wake_time = wake_time;
  e.seq = next_seq_++;
  e.slot = slot;
  queue_.push(e);
}

void Scheduler::retire(std::size_t slot) {
  slots_[slot].reset();
  free_slots_.push_back(slot);
}

void Scheduler::run_until(SimContext& ctx, double until) {
  while (!queue_.empty()) {
    const Entry next = queue_.top();
    if (!within_horizon(next.wake_time, until)) break;
    queue_.pop();
    now_ = std::min(next.wake_time, until);

    Process& p = *slots_[next.slot];
    std::optional<double> wait;
    try {
      ++steps_run_;
      wait = p.step(ctx);
      if (wait && !(std::isfinite(*wait) && *wait >= 0.0)) {
        throw ProcessError(std::string(p.kind()) + " process requested an invalid wait of " +
                           format_number(*wait) + "h");
      }
    } catch (const ProcessError& e) {
      log::error(std::string(p.kind()) + " process failed at t=" + format_number(now_) + ": " + e.what());
      if (on_failure_) on_failure_(p, e);
      retire(next.slot);
      continue;
    }

    if (!wait) {
      retire(next.slot);
      continue;
    }
    enqueue(now_ + *wait, next.slot);
  }

  if (until > now_) now_ = until;
}

void Scheduler::discard_pending() {
  while (!queue_.empty()) {
    retire(queue_.top().slot);
    queue_.pop();
  }
}

} // namespace tidewater
