#include "result_writer.h"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Occbench {

ResultWriter::ResultWriter(const RunSettings& settings)
    : variant_(VariantName(settings.machine.variant)),
      backoff_policy_(settings.machine.backoff_policy == BackoffPolicy::kFixed ? "fixed" : "full_jitter"),
      threads_(settings.threads),
      id_pool_size_(settings.id_pool_size),
      retry_count_(settings.machine.retry_count),
      backoff_max_(settings.machine.backoff_max),
      target_rps_(settings.target_rps),
      record_result_(settings.record_results) {

    result_path_ = settings.data_dir + "conflict/" + variant_ + "/";
    if (!record_result_) {
        result_path_ += "result.csv";
        return;
    }

    // Create output directory if it doesn't exist
    try {
        fs::create_directories(result_path_);
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create result directory: " << e.what();
    }

    result_path_ += "result.csv";

    std::error_code ec;
    bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;

    if (headers_needed) {
        std::ofstream header_file(result_path_);
        if (!header_file.is_open()) {
            LOG(ERROR) << "Failed to create result file: " << result_path_ << ": " << strerror(errno);
            return;
        }

        header_file << "timestamp,"
                    << "variant,"
                    << "threads,"
                    << "id_pool_size,"
                    << "retry_count,"
                    << "backoff_max,"
                    << "backoff_policy,"
                    << "target_rps,"
                    << "elapsed_seconds,"
                    << "executed,"
                    << "backoff,"
                    << "suppressed,"
                    << "fallback,"
                    << "conflicts,"
                    << "successful_retries,"
                    << "exhausted_retries,"
                    << "error_rate_percent,"
                    << "p50_us,"
                    << "p99_us,"
                    << "consistent\n";
        LOG(INFO) << "Created new result file with headers: " << result_path_;
    }
}

ResultWriter::~ResultWriter() {
    if (!record_result_ || !has_summary_) {
        return;
    }

    std::ofstream file(result_path_, std::ios::app);
    if (!file.is_open()) {
        LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
        return;
    }

    auto formatFloat = [](double value) -> std::string {
        if (value == 0.0) return "0";
        std::stringstream ss;
        ss << std::fixed << std::setprecision(4) << value;
        return ss.str();
    };

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    const RequestCounters& c = summary_.counters;
    file << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << ","
         << variant_ << ","
         << threads_ << ","
         << id_pool_size_ << ","
         << retry_count_ << ","
         << backoff_max_ << ","
         << backoff_policy_ << ","
         << target_rps_ << ","
         << formatFloat(elapsed_seconds_) << ","
         << c.executed << ","
         << c.backoff << ","
         << c.suppressed << ","
         << c.fallback << ","
         << summary_.retry.conflicts << ","
         << summary_.retry.successful_retries << ","
         << summary_.retry.exhausted_retries << ","
         << formatFloat(summary_.error_rate_percent) << ","
         << formatFloat(summary_.latency.p50_us) << ","
         << formatFloat(summary_.latency.p99_us) << ","
         << (summary_.consistent ? "true" : "false") << "\n";

    if (!file) {
        LOG(ERROR) << "Failed writing result row to " << result_path_;
        return;
    }
    LOG(INFO) << "Results written to: " << result_path_;
}

void ResultWriter::SetSummary(const RunSummary& summary, double elapsed_seconds) {
    summary_ = summary;
    elapsed_seconds_ = elapsed_seconds;
    has_summary_ = true;
}

} // namespace Occbench
