/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANQ_MONITOR_HPP
#define PLANQ_MONITOR_HPP

#include "planq/PlanqData.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Spacegame {

struct PlanqText {
  std::string text;
  bool operator==(const PlanqText &) const = default;
};
struct PlanqInteger {
  int32_t value{0};
  bool operator==(const PlanqInteger &) const = default;
};
struct PlanqPercent {
  uint32_t value{0};
  bool operator==(const PlanqPercent &) const = default;
};
struct PlanqDecimal {
  int32_t numer{0};
  int32_t denom{1};
  bool operator==(const PlanqDecimal &) const = default;
};
struct PlanqSeries {
  std::deque<uint64_t> values;
  bool operator==(const PlanqSeries &) const = default;
};

using PlanqDataType = std::variant<std::monostate, PlanqText, PlanqInteger, PlanqPercent,
                                   PlanqDecimal, PlanqSeries>;

// Resamples one data source at a fixed interval
struct DataSampleTimer {
  PlanqTimer timer{1.0f, true};
  std::string source;
};

// One rendered status line; gauge is set for percent-style sources
struct PlanqStatusLine {
  std::string text;
  int gauge{-1}; // 0-100, or -1 for a plain text line
};

/**
 * The PLANQ's status bars: which sources are shown, their latest values
 * and the timers that decide when each one is sampled.
 */
class PlanqMonitor {
public:
  static constexpr size_t SPARKLINE_MAX = 30;

  PlanqMonitor();

  const std::vector<std::string> &getStatusBars() const { return m_statusBars; }
  // Adds a status bar and starts sampling it
  void watch(const std::string &source);
  // Returns true if the source was shown
  bool remove(const std::string &source);

  const std::unordered_map<std::string, PlanqDataType> &rawData() const { return m_rawData; }
  std::unordered_map<std::string, PlanqDataType> &rawData() { return m_rawData; }
  const PlanqDataType *get(const std::string &source) const;
  void set(const std::string &source, PlanqDataType value) { m_rawData[source] = std::move(value); }

  std::vector<DataSampleTimer> &sampleTimers() { return m_timers; }
  const std::vector<DataSampleTimer> &sampleTimers() const { return m_timers; }

  // Appends a sample to a Series source, dropping the oldest past SPARKLINE_MAX
  void pushSample(const std::string &source, uint64_t value);

  // One line per status bar that has data, fitted to width columns
  std::vector<PlanqStatusLine> formatLines(int width) const;
  PlanqStatusLine formatLine(const std::string &source, int width) const;

  static std::string rightAlign(const std::string &input, size_t width);
  // Seconds to HH:MM:SS, wrapping at 24 hours
  static std::string formatClock(double seconds);

  void clear();

private:
  std::vector<std::string> m_statusBars;
  std::unordered_map<std::string, PlanqDataType> m_rawData;
  std::vector<DataSampleTimer> m_timers;
};

} // namespace Spacegame

#endif // PLANQ_MONITOR_HPP
