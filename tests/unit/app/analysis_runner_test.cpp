#include <boxfit/app/analysis_runner.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace ba = boxfit::app;
namespace bc = boxfit::core;

namespace {

ba::AnalysisJob make_job(const std::string& name, std::size_t rows, double height) {
  std::vector<bc::Row> data;
  for (std::size_t i = 0; i < rows; ++i) {
    data.push_back({bc::Cell{static_cast<double>(i)}, bc::Cell{height},
                    bc::Cell{10.0}, bc::Cell{10.0}});
  }
  return {name,
          bc::Table({"id", "h", "w", "l"}, std::move(data)),
          {"id", "h", "w", "l"},
          bc::PackagingConstraints{}};
}

}  // namespace

TEST(AnalysisRunner, SingleJob) {
  auto outcome = ba::run_analysis(make_job("a", 4, 5.0));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->summary.total, 4u);
  EXPECT_EQ(outcome->summary.ok_count, 4u);
}

TEST(AnalysisRunner, BatchInOrderAndReportsFailures) {
  std::vector<ba::AnalysisJob> jobs;
  jobs.push_back(make_job("ok", 2, 5.0));
  auto bad = make_job("bad", 2, 5.0);
  bad.selection.width = "missing";
  jobs.push_back(std::move(bad));
  jobs.push_back(make_job("too_tall", 3, 50.0));

  std::vector<std::string> names;
  std::vector<bool> succeeded;
  ba::run_analysis_batch(jobs, [&](const ba::AnalysisJob& job, const ba::JobOutcome& o) {
    names.push_back(job.name);
    succeeded.push_back(o.has_value());
    if (job.name == "bad") {
      EXPECT_EQ(o.error(), bc::AnalysisError::MissingColumn);
    }
    if (job.name == "too_tall") {
      EXPECT_EQ(o->summary.no_ok_count, 3u);
    }
  });
  EXPECT_EQ(names, (std::vector<std::string>{"ok", "bad", "too_tall"}));
  EXPECT_EQ(succeeded, (std::vector<bool>{true, false, true}));
}

TEST(AnalysisRunner, BatchParallelVisitsEveryJob) {
  std::vector<ba::AnalysisJob> jobs;
  for (int i = 0; i < 8; ++i) {
    jobs.push_back(make_job("job" + std::to_string(i), static_cast<std::size_t>(i), 5.0));
  }

  std::mutex m;
  std::vector<std::string> names;
  std::size_t total_rows = 0;
  ba::run_analysis_batch_parallel(
      jobs,
      [&](const ba::AnalysisJob& job, const ba::JobOutcome& o) {
        std::lock_guard lock(m);
        names.push_back(job.name);
        if (o) total_rows += o->summary.total;
      },
      3);

  EXPECT_EQ(names.size(), 8u);
  EXPECT_EQ(total_rows, 0u + 1 + 2 + 3 + 4 + 5 + 6 + 7);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names.front(), "job0");
  EXPECT_EQ(names.back(), "job7");
}

TEST(AnalysisRunner, BatchParallelEmptyOrNoCallback) {
  std::size_t calls = 0;
  ba::run_analysis_batch_parallel({}, [&](const ba::AnalysisJob&, const ba::JobOutcome&) {
    ++calls;
  });
  EXPECT_EQ(calls, 0u);

  std::vector<ba::AnalysisJob> jobs;
  jobs.push_back(make_job("a", 1, 1.0));
  ba::run_analysis_batch_parallel(jobs, nullptr, 2);
  SUCCEED();
}

TEST(AnalysisRunner, BatchParallelRunsEachJobOnce) {
  std::vector<ba::AnalysisJob> jobs;
  for (int i = 0; i < 5; ++i) {
    jobs.push_back(make_job("job" + std::to_string(i), 2, 5.0));
  }

  std::mutex m;
  std::vector<std::string> names;
  ba::run_analysis_batch_parallel(
      jobs,
      [&](const ba::AnalysisJob& job, const ba::JobOutcome&) {
        std::lock_guard lock(m);
        names.push_back(job.name);
      },
      16);

  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"job0", "job1", "job2", "job3", "job4"}));
}
