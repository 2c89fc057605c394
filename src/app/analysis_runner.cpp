#include <boxfit/app/analysis_runner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace boxfit::app {

JobOutcome run_analysis(const AnalysisJob& job) {
  auto outcome = boxfit::core::analyze(job.table, job.selection, job.constraints);
  if (outcome) {
    spdlog::info("{}: total={} ok={} ({:.2f}%) no_ok={} ({:.2f}%)", job.name,
                 outcome->summary.total, outcome->summary.ok_count,
                 outcome->summary.ok_pct, outcome->summary.no_ok_count,
                 outcome->summary.no_ok_pct);
  } else {
    spdlog::error("{}: analysis failed: {}", job.name,
                  boxfit::core::to_string(outcome.error()));
  }
  return outcome;
}

void run_analysis_batch(const std::vector<AnalysisJob>& jobs,
                        const JobCallback& callback) {
  for (const auto& job : jobs) {
    auto outcome = run_analysis(job);
    if (callback) callback(job, outcome);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_analysis_batch_parallel(const std::vector<AnalysisJob>& jobs,
                                 JobCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = jobs.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_analysis_batch(jobs, callback);
    return;
  }

  // Workers claim job indices until the counter runs past the end.
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t idx = next.fetch_add(1); idx < n; idx = next.fetch_add(1)) {
      const auto outcome = run_analysis(jobs[idx]);
      callback(jobs[idx], outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace boxfit::app
