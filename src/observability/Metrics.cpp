/***
 * Name: pyjudge::obs::Metrics (impl)
 * Purpose: Timing accumulation and the text/JSON summaries.
 */
#include "observability/Metrics.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace pyjudge::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr uint64_t kSlowRunUs = 2000000U;

// Counter that, when non-zero, raises the paired hint.
constexpr std::array<std::pair<const char*, const char*>, 3> kCounterHints{{
    {"screen.rejected", "submission_rejected"},
    {"runs.timeout", "timeouts_present"},
    {"runs.truncated", "output_truncated"},
}};

uint64_t lookup(const std::map<std::string, uint64_t>& values, const std::string& key) {
  const auto it = values.find(key);
  return it == values.end() ? 0U : it->second;
}

std::string lowered(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return text;
}
} // namespace

void Metrics::start(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mutex_);
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  const auto now = Clock::now();
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto node = active_.extract(name);
  if (node.empty()) { return; }
  durations_us_[name] += static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(now - node.mapped()).count());
}

void Metrics::addDuration(const std::string& name, std::chrono::microseconds elapsed) {
  const std::lock_guard<std::mutex> lock(mutex_);
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
}

void Metrics::incCounter(const std::string& key, uint64_t delta) {
  const std::lock_guard<std::mutex> lock(mutex_);
  counters_[key] += delta;
}

void Metrics::setCounter(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mutex_);
  counters_[key] = value;
}

void Metrics::setGauge(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mutex_);
  gauges_[key] = value;
}

uint64_t Metrics::counter(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return lookup(counters_, key);
}

uint64_t Metrics::gauge(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return lookup(gauges_, key);
}

std::map<std::string, uint64_t> Metrics::durationsUs() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return durations_us_;
}

std::string Metrics::summaryText() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;
  oss << "== Metrics ==\n" << std::fixed << std::setprecision(3);
  for (const auto& [stage, micros] : durations_us_) {
    oss << "  " << stage << ": " << static_cast<double>(micros) / kUsPerMs << " ms\n";
  }
  for (const auto* values : {&counters_, &gauges_}) {
    for (const auto& [key, value] : *values) { oss << "  " << key << " = " << value << "\n"; }
  }
  return oss.str();
}

// Stage keys are lowercased in JSON ("run", "validate") so consumers can rely
// on them; counters and gauges keep their dotted names.
std::string Metrics::summaryJson() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::ordered_json doc;
  doc["durations_ms"] = nlohmann::ordered_json::object();
  for (const auto& [stage, micros] : durations_us_) {
    doc["durations_ms"][lowered(stage)] = static_cast<double>(micros) / kUsPerMs;
  }
  if (!counters_.empty()) { doc["counters"] = counters_; }
  if (!gauges_.empty()) { doc["gauges"] = gauges_; }
  if (auto hs = hintsLocked(); !hs.empty()) { doc["hints"] = std::move(hs); }
  return doc.dump(2) + "\n";
}

std::vector<std::string> Metrics::hints() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return hintsLocked();
}

std::vector<std::string> Metrics::hintsLocked() const {
  std::vector<std::string> out;
  for (const auto& [key, hint] : kCounterHints) {
    if (lookup(counters_, key) > 0) { out.emplace_back(hint); }
  }
  const uint64_t runs = lookup(counters_, "runs.total");
  if (runs > 0 && lookup(durations_us_, "Run") / runs > kSlowRunUs) { out.emplace_back("slow_runs"); }
  return out;
}

} // namespace pyjudge::obs
