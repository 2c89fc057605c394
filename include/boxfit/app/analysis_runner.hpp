#pragma once

#include <boxfit/core/analysis.hpp>
#include <boxfit/core/analysis_result.hpp>
#include <boxfit/core/classifier.hpp>
#include <boxfit/core/error.hpp>
#include <boxfit/core/normalizer.hpp>
#include <boxfit/core/table.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace boxfit::app {

/// One dataset to analyze. The job owns its table and its copy of the
/// constraints, so jobs share no state.
struct AnalysisJob {
  std::string name;  // e.g. input file path; used for logging and callbacks
  boxfit::core::Table table;
  boxfit::core::ColumnSelection selection;
  boxfit::core::PackagingConstraints constraints;
};

using JobOutcome =
    std::expected<boxfit::core::AnalysisResult, boxfit::core::AnalysisError>;

/// Callback for each finished job, successful or not; may be invoked from
/// worker threads. Must be thread-safe if using run_analysis_batch_parallel.
using JobCallback =
    std::function<void(const AnalysisJob& job, const JobOutcome& outcome)>;

/// Runs one job. No threading; direct call.
[[nodiscard]] JobOutcome run_analysis(const AnalysisJob& job);

/// Runs jobs sequentially in order; calls callback for each outcome.
void run_analysis_batch(const std::vector<AnalysisJob>& jobs,
                        const JobCallback& callback);

/// Runs jobs in parallel using a thread pool. Callback may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_analysis_batch_parallel(const std::vector<AnalysisJob>& jobs,
                                 JobCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace boxfit::app
