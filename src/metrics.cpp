#include "swiftstore/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace swiftstore {

TransferMetrics::TransferMetrics(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("swiftstore_uploads_total")
        .Help("Total object uploads completed")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("swiftstore_upload_bytes_total")
        .Help("Total bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("swiftstore_downloads_total")
        .Help("Total object downloads completed")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("swiftstore_download_bytes_total")
        .Help("Total bytes downloaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    parts_uploaded_ = &prometheus::BuildCounter()
        .Name("swiftstore_parts_uploaded_total")
        .Help("Total multipart segments uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    hash_mismatches_ = &prometheus::BuildCounter()
        .Name("swiftstore_hash_mismatches_total")
        .Help("Uploads whose server ETag did not match the local digest")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& pages_family = prometheus::BuildCounter()
        .Name("swiftstore_listing_pages_total")
        .Help("Total listing pages fetched")
        .Labels(labels)
        .Register(*registry_);
    object_pages_ = &pages_family.Add({{"kind", "objects"}});
    container_pages_ = &pages_family.Add({{"kind", "containers"}});

    // --- Gauges ---

    transfers_in_flight_ = &prometheus::BuildGauge()
        .Name("swiftstore_transfers_in_flight")
        .Help("Uploads and downloads currently running")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("swiftstore_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("swiftstore_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

TransferMetrics::~TransferMetrics() {
    stop();
}

void TransferMetrics::start() {
    if (prom_file_path_.empty()) return;
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&TransferMetrics::writer_loop, this);
}

void TransferMetrics::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

std::string TransferMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void TransferMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void TransferMetrics::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace swiftstore
