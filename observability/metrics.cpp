#include "observability/metrics.hpp"

#include <limits>
#include <set>
#include <sstream>

namespace ledger {
namespace observability {

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::incrementCounter(const std::string& name, const Labels& labels,
                                        double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[SeriesKey{name, labels}] += value;
}

void MetricsCollector::setGauge(const std::string& name, double value, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[SeriesKey{name, labels}] = value;
}

void MetricsCollector::incrementGauge(const std::string& name, double value,
                                      const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[SeriesKey{name, labels}] += value;
}

void MetricsCollector::decrementGauge(const std::string& name, double value,
                                      const Labels& labels) {
  incrementGauge(name, -value, labels);
}

void MetricsCollector::observeHistogram(const std::string& name, double value,
                                        const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& hist = histograms_[SeriesKey{name, labels}];

  if (hist.buckets.empty()) {
    for (double bound : defaultBuckets()) {
      hist.buckets.push_back({bound, 0});
    }
    hist.buckets.push_back({std::numeric_limits<double>::infinity(), 0});
  }

  hist.count += 1;
  hist.sum += value;

  // Buckets are counted non-cumulatively; export accumulates them.
  for (auto& bucket : hist.buckets) {
    if (value <= bucket.upper_bound) {
      bucket.count += 1;
      break;
    }
  }
}

double MetricsCollector::counterValue(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(SeriesKey{name, labels});
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsCollector::gaugeValue(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find(SeriesKey{name, labels});
  return it == gauges_.end() ? 0.0 : it->second;
}

size_t MetricsCollector::histogramCount(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(SeriesKey{name, labels});
  return it == histograms_.end() ? 0 : it->second.count;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name,
                               Labels labels)
    : collector_(collector), name_(name), labels_(std::move(labels)),
      start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  auto end = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  collector_.observeHistogram(name_, duration.count() / 1000000.0, labels_);
}

std::string MetricsCollector::formatSeries(const std::string& name, const Labels& labels) {
  if (labels.empty()) return name;
  std::stringstream ss;
  ss << name << "{";
  bool first = true;
  for (const auto& [key, value] : labels) {
    if (!first) ss << ",";
    ss << key << "=\"" << value << "\"";
    first = false;
  }
  ss << "}";
  return ss.str();
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;
  std::set<std::string> typed;

  for (const auto& [key, value] : counters_) {
    if (typed.insert(key.name).second) {
      ss << "# TYPE " << key.name << " counter\n";
    }
    ss << formatSeries(key.name, key.labels) << " " << value << "\n";
  }

  for (const auto& [key, value] : gauges_) {
    if (typed.insert(key.name).second) {
      ss << "# TYPE " << key.name << " gauge\n";
    }
    ss << formatSeries(key.name, key.labels) << " " << value << "\n";
  }

  for (const auto& [key, hist] : histograms_) {
    if (typed.insert(key.name).second) {
      ss << "# TYPE " << key.name << " histogram\n";
    }

    size_t cumulative_count = 0;
    for (const auto& bucket : hist.buckets) {
      cumulative_count += bucket.count;
      Labels bucket_labels = key.labels;
      if (bucket.upper_bound == std::numeric_limits<double>::infinity()) {
        bucket_labels["le"] = "+Inf";
      } else {
        std::stringstream bound;
        bound << bucket.upper_bound;
        bucket_labels["le"] = bound.str();
      }
      ss << formatSeries(key.name + "_bucket", bucket_labels) << " " << cumulative_count << "\n";
    }

    ss << formatSeries(key.name + "_count", key.labels) << " " << hist.count << "\n";
    ss << formatSeries(key.name + "_sum", key.labels) << " " << hist.sum << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);

  counters_.clear();
  gauges_.clear();
  histograms_.clear();
}

std::vector<double> MetricsCollector::defaultBuckets() {
  return {0.0005, 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0};
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector instance;
  return instance;
}

}  // namespace observability
}  // namespace ledger
