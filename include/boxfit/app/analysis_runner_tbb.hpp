#pragma once

#include <boxfit/app/analysis_runner.hpp>
#include <vector>

#ifdef BOXFIT_HAS_TBB

namespace boxfit::app {

/// Runs jobs in parallel using TBB.
///
/// Every job is analyzed independently in a TBB task; the callback receives
/// (job, outcome) for each job, successful or not, from TBB worker threads
/// and must be thread-safe. Jobs are read only; not modified.
void run_analysis_batch_tbb(const std::vector<AnalysisJob>& jobs,
                            const JobCallback& callback);

}  // namespace boxfit::app

#endif  // BOXFIT_HAS_TBB
