#include "utilities/metrics.h"

#include <algorithm>
#include <sstream>
#include <vector>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const MetricsRegistry::Labels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

static void splitKey(const std::string &key, std::string &name,
                     std::string &labels) {
  auto nameEnd = key.find('{');
  name = key.substr(0, nameEnd);
  labels = nameEnd == std::string::npos ? "" : key.substr(nameEnd);
}

// Label values come from tenant ids, so quotes and backslashes are escaped.
static std::string escapeLabelValue(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

unsigned long MetricsRegistry::observationCount(const std::string &name,
                                                const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = histograms_.find(makeKey(name, labels));
  return it == histograms_.end() ? 0 : it->second.count;
}

std::string MetricsRegistry::labelsToString(const Labels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << escapeLabelValue(kv.second) << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  // Sorted output keeps the exposition stable between scrapes.
  std::vector<std::string> lines;
  std::string name;
  std::string labels;
  for (const auto &kv : gauges_) {
    splitKey(kv.first, name, labels);
    std::ostringstream oss;
    oss << name << labels << ' ' << kv.second;
    lines.push_back(oss.str());
  }
  for (const auto &kv : counters_) {
    splitKey(kv.first, name, labels);
    std::ostringstream oss;
    oss << name << labels << ' ' << kv.second;
    lines.push_back(oss.str());
  }
  for (const auto &kv : histograms_) {
    splitKey(kv.first, name, labels);
    std::ostringstream sum;
    sum << name << "_sum" << labels << ' ' << kv.second.sum;
    lines.push_back(sum.str());
    std::ostringstream count;
    count << name << "_count" << labels << ' ' << kv.second.count;
    lines.push_back(count.str());
  }
  std::sort(lines.begin(), lines.end());
  std::ostringstream out;
  for (const auto &line : lines)
    out << line << '\n';
  return out.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}
