#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Process-wide metrics registry that exports Prometheus text format.
 *
 * Upload operations record counters and histograms here; the ctl binary
 * prints the exposition with `chunkvault_ctl metrics`.
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;

  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const Labels &labels = {});

  void incrementCounter(const std::string &name, double value = 1.0,
                        const Labels &labels = {});

  void observe(const std::string &name, double value,
               const Labels &labels = {});

  /** Current counter value, 0 when the series was never touched. */
  double counterValue(const std::string &name,
                      const Labels &labels = {}) const;

  /** Current gauge value, 0 when the series was never set. */
  double gaugeValue(const std::string &name, const Labels &labels = {}) const;

  /** Number of observations recorded for a histogram series. */
  unsigned long observationCount(const std::string &name,
                                 const Labels &labels = {}) const;

  std::string toPrometheus() const;

  /** Clear all series. Used by unit tests. */
  void reset();

  static std::string labelsToString(const Labels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};
