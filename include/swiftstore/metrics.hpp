#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace swiftstore {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// RAII in-flight marker for a gauge.
class ScopedInFlight {
public:
    explicit ScopedInFlight(prometheus::Gauge& gauge) : gauge_(gauge) { gauge_.Increment(); }
    ~ScopedInFlight() { gauge_.Decrement(); }

    ScopedInFlight(const ScopedInFlight&) = delete;
    ScopedInFlight& operator=(const ScopedInFlight&) = delete;

private:
    prometheus::Gauge& gauge_;
};

/// Transfer metrics for one client process.
///
/// Owns a prometheus::Registry with all metric families. When a .prom path is
/// given, a background writer thread periodically serializes the registry to
/// it (node_exporter textfile collector) using atomic temp+rename.
class TransferMetrics {
public:
    /// @param prom_file_path  Path to the .prom output file (empty = no file).
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    TransferMetrics(const std::filesystem::path& prom_file_path = {},
                    std::chrono::seconds write_interval = std::chrono::seconds(15),
                    const std::map<std::string, std::string>& labels = {});
    ~TransferMetrics();

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    /// Start the background writer thread. No-op without a file path.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Registry contents in the Prometheus text exposition format.
    std::string serialize() const;

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& parts_uploaded() { return *parts_uploaded_; }
    prometheus::Counter& hash_mismatches() { return *hash_mismatches_; }
    prometheus::Counter& object_pages() { return *object_pages_; }
    prometheus::Counter& container_pages() { return *container_pages_; }

    // --- Gauge accessors ---
    prometheus::Gauge& transfers_in_flight() { return *transfers_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* parts_uploaded_;
    prometheus::Counter* hash_mismatches_;
    prometheus::Counter* object_pages_;
    prometheus::Counter* container_pages_;

    // --- Gauges ---
    prometheus::Gauge* transfers_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace swiftstore
