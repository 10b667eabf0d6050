/***
 * Name: pyjudge::obs::Metrics
 * Purpose: Collect per-stage timings and counters of a validation run.
 * Inputs:
 *   - Calls to start/stop timers (or StageTimer scopes) for named stages.
 *   - Counter and gauge updates from the validator and the driver.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Durations accumulate
 *   per stage name in microseconds, so a stage entered once per test case
 *   reports its total. All members are guarded by one mutex; concurrent
 *   validations may share a sink. Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pyjudge::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);
  void addDuration(const std::string& name, std::chrono::microseconds elapsed);

  void incCounter(const std::string& key, uint64_t delta = 1);
  void setCounter(const std::string& key, uint64_t value);
  void setGauge(const std::string& key, uint64_t value);

  // Snapshots; a missing key reads as 0.
  uint64_t counter(const std::string& key) const;
  uint64_t gauge(const std::string& key) const;
  std::map<std::string, uint64_t> durationsUs() const;

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::vector<std::string> hintsLocked() const;

  mutable std::mutex mutex_;
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// Adds the lifetime of the scope to a stage; a null sink makes it a no-op.
class StageTimer {
 public:
  StageTimer(Metrics* sink, std::string stage) : sink_(sink), stage_(std::move(stage)), started_(Metrics::Clock::now()) {}
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;
  ~StageTimer() {
    if (sink_ != nullptr) {
      sink_->addDuration(stage_, std::chrono::duration_cast<std::chrono::microseconds>(Metrics::Clock::now() - started_));
    }
  }

 private:
  Metrics* sink_;
  std::string stage_;
  Metrics::Clock::time_point started_;
};

} // namespace pyjudge::obs
