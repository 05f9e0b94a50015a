#pragma once

#include <string>

#include "result_aggregator.h"
#include "run_settings.h"

namespace Occbench {

/**
 * Appends one CSV row per run to {data_dir}conflict/{variant}/result.csv
 */
class ResultWriter {
public:
    /**
     * Constructor. Creates the result directory and writes the CSV header
     * when the file is new. Does nothing unless settings.record_results.
     * @param settings Resolved run settings
     */
    explicit ResultWriter(const RunSettings& settings);

    /**
     * Destructor - writes the row if a summary was set
     */
    ~ResultWriter();

    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    /**
     * Sets the run outcome to record
     * @param summary Aggregated run summary
     * @param elapsed_seconds Wall-clock duration of the load phase
     */
    void SetSummary(const RunSummary& summary, double elapsed_seconds);

    const std::string& result_path() const { return result_path_; }

private:
    std::string variant_;
    std::string backoff_policy_;
    int64_t threads_;
    int64_t id_pool_size_;
    int retry_count_;
    int64_t backoff_max_;
    int target_rps_;
    bool record_result_;

    std::string result_path_;
    bool has_summary_ = false;
    RunSummary summary_;
    double elapsed_seconds_ = 0;
};

} // namespace Occbench
