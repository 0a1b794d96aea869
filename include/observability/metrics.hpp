#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

using Labels = std::map<std::string, std::string>;

/**
 * In-process metrics with Prometheus text export.
 * Counters, gauges and histograms are keyed by name plus an optional label set.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, const Labels& labels = {}, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value, const Labels& labels = {});
  void incrementGauge(const std::string& name, double value = 1.0, const Labels& labels = {});
  void decrementGauge(const std::string& name, double value = 1.0, const Labels& labels = {});

  // Histogram: distribution of values (seconds)
  void observeHistogram(const std::string& name, double value, const Labels& labels = {});

  double counterValue(const std::string& name, const Labels& labels = {}) const;
  double gaugeValue(const std::string& name, const Labels& labels = {}) const;
  size_t histogramCount(const std::string& name, const Labels& labels = {}) const;

  /**
   * Observes the elapsed time of its own lifetime into a histogram.
   */
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name, Labels labels = {});
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    Labels labels_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  void reset();

 private:
  struct SeriesKey {
    std::string name;
    Labels labels;

    bool operator<(const SeriesKey& other) const {
      if (name != other.name) return name < other.name;
      return labels < other.labels;
    }
  };

  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  static std::string formatSeries(const std::string& name, const Labels& labels);

  mutable std::mutex mutex_;
  std::map<SeriesKey, double> counters_;
  std::map<SeriesKey, double> gauges_;
  std::map<SeriesKey, Histogram> histograms_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // METRICS_HPP_
