/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planq/PlanqMonitor.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <initializer_list>

namespace Spacegame {

namespace {

constexpr const char *SPARK_GLYPHS[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

std::string textPrefix(const std::string &source) {
  if (source == "planq_mode")
    return "MODE: ";
  if (source == "player_location")
    return "LOCN: ";
  if (source == "current_time")
    return "TIME: ";
  return "";
}

size_t remainderWidth(int width, size_t prefixLen) {
  const int remainder = width - static_cast<int>(prefixLen) - 2;
  return remainder > 0 ? static_cast<size_t>(remainder) : 0;
}

} // namespace

PlanqMonitor::PlanqMonitor() {
  for (const char *source : {"planq_battery", "planq_mode", "current_time", "player_location"})
    watch(source);
}

void PlanqMonitor::watch(const std::string &source) {
  m_statusBars.push_back(source);
  if (m_rawData.find(source) == m_rawData.end()) {
    if (source == "test_sparkline")
      m_rawData[source] = PlanqSeries{};
    else if (source == "test_gauge" || source == "planq_battery")
      m_rawData[source] = PlanqPercent{0};
    else if (source == "test_line")
      m_rawData[source] = PlanqDecimal{0, 100};
    else
      m_rawData[source] = PlanqText{"Initializing..."};
  }
  m_timers.push_back(DataSampleTimer{PlanqTimer{1.0f, true}, source});
}

bool PlanqMonitor::remove(const std::string &source) {
  auto it = std::find(m_statusBars.begin(), m_statusBars.end(), source);
  if (it == m_statusBars.end())
    return false;
  m_statusBars.erase(it);
  std::erase_if(m_timers, [&source](const DataSampleTimer &t) { return t.source == source; });
  return true;
}

const PlanqDataType *PlanqMonitor::get(const std::string &source) const {
  auto it = m_rawData.find(source);
  return it == m_rawData.end() ? nullptr : &it->second;
}

void PlanqMonitor::pushSample(const std::string &source, uint64_t value) {
  auto &entry = m_rawData[source];
  if (!std::holds_alternative<PlanqSeries>(entry))
    entry = PlanqSeries{};
  auto &values = std::get<PlanqSeries>(entry).values;
  values.push_back(value);
  while (values.size() > SPARKLINE_MAX)
    values.pop_front();
}

std::string PlanqMonitor::rightAlign(const std::string &input, size_t width) {
  if (input.size() >= width)
    return input;
  return std::string(width - input.size(), ' ') + input;
}

std::string PlanqMonitor::formatClock(double seconds) {
  const auto total = static_cast<long long>(std::floor(seconds));
  const long long hours = (total / 3600) % 24;
  const long long minutes = (total / 60) % 60;
  const long long secs = total % 60;
  return std::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

PlanqStatusLine PlanqMonitor::formatLine(const std::string &source, int width) const {
  PlanqStatusLine line;
  const PlanqDataType *data = get(source);
  if (!data)
    return line;

  if (const auto *text = std::get_if<PlanqText>(data)) {
    const std::string prefix = textPrefix(source);
    line.text = prefix + rightAlign(text->text, remainderWidth(width, prefix.size()));
  } else if (const auto *integer = std::get_if<PlanqInteger>(data)) {
    line.text = std::to_string(integer->value);
  } else if (const auto *pct = std::get_if<PlanqPercent>(data)) {
    line.gauge = static_cast<int>(std::min<uint32_t>(pct->value, 100));
    if (source == "planq_battery") {
      const std::string prefix = "BATT: ";
      line.text = prefix + rightAlign(std::to_string(pct->value) + "%",
                                      remainderWidth(width, prefix.size()));
    }
  } else if (const auto *dec = std::get_if<PlanqDecimal>(data)) {
    const double ratio = dec->denom != 0 ? static_cast<double>(dec->numer) / dec->denom : 0.0;
    line.gauge = std::clamp(static_cast<int>(ratio * 100.0), 0, 100);
  } else if (const auto *series = std::get_if<PlanqSeries>(data)) {
    uint64_t peak = 0;
    for (uint64_t v : series->values)
      peak = std::max(peak, v);
    for (uint64_t v : series->values) {
      const size_t level = peak == 0 ? 0 : static_cast<size_t>(v * 7 / peak);
      line.text += SPARK_GLYPHS[level];
    }
  }
  return line;
}

std::vector<PlanqStatusLine> PlanqMonitor::formatLines(int width) const {
  std::vector<PlanqStatusLine> lines;
  for (const auto &source : m_statusBars) {
    const PlanqDataType *data = get(source);
    if (!data || std::holds_alternative<std::monostate>(*data))
      continue;
    lines.push_back(formatLine(source, width));
  }
  return lines;
}

void PlanqMonitor::clear() {
  m_statusBars.clear();
  m_rawData.clear();
  m_timers.clear();
}

} // namespace Spacegame
