#include <boxfit/app/analysis_runner_tbb.hpp>

#ifdef BOXFIT_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace boxfit::app {

void run_analysis_batch_tbb(const std::vector<AnalysisJob>& jobs,
                            const JobCallback& callback) {
  if (jobs.empty() || !callback) return;

  const std::size_t n = jobs.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&jobs, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const auto outcome = run_analysis(jobs[i]);
          callback(jobs[i], outcome);
        }
      });
}

}  // namespace boxfit::app

#endif  // BOXFIT_HAS_TBB
