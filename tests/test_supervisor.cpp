#include "slide_ingest/core/job_supervisor.hpp"

#include <atomic>
#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace slide_ingest;

TEST_CASE("supervisor_records_failing_jobs_and_runs_the_rest") {
  core::JobSupervisor supervisor;
  std::atomic<int> ran{0};

  supervisor.launch("ok", [&ran]() { ++ran; });
  supervisor.launch("broken", []() { throw std::runtime_error("disk gone"); });
  supervisor.launch("ok-again", [&ran]() { ++ran; });
  supervisor.join_all();

  REQUIRE(ran == 2);
  REQUIRE(supervisor.running() == 0);
  const auto failures = supervisor.failures();
  REQUIRE(failures.size() == 1);
  REQUIRE(failures[0].job == "broken");
  REQUIRE(failures[0].message == "disk gone");
  REQUIRE_FALSE(failures[0].timestamp.empty());
}

TEST_CASE("supervisor_keeps_only_recent_failures") {
  core::JobSupervisor supervisor;
  const int total = static_cast<int>(core::kMaxRecordedFailures) + 10;
  for (int i = 0; i < total; ++i) {
    supervisor.launch("job_" + std::to_string(i), []() { throw std::runtime_error("fail"); });
    // one at a time so failures are recorded in launch order
    supervisor.join_all();
  }

  const auto failures = supervisor.failures();
  REQUIRE(failures.size() == core::kMaxRecordedFailures);
  REQUIRE(failures.front().job == "job_10");
  REQUIRE(failures.back().job == "job_" + std::to_string(total - 1));
}
