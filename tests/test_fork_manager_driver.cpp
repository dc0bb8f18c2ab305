#include "fork_manager_driver.hpp"
#include "test_utils.hpp"

#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace forklift;
using namespace std::chrono_literals;

namespace {
auto MakeDriver(int64_t max_workers, double wait_sleep = TEST_WAIT_SLEEP)
    -> std::unique_ptr<ForkManagerDriver>
{
    auto driver = ForkManagerDriver::Create(ForkManagerParameters(max_workers, wait_sleep));
    if (not driver.has_value()) {
        ADD_FAILURE() << driver.error().error_message;
        return nullptr;
    }
    return std::move(*driver);
}

auto Collect(std::vector<JobResult>& results) -> ResultCallback
{
    return [&results](JobResult const& result) { results.push_back(result); };
}

auto ReturnPid() -> JobFunction
{
    return []() -> std::expected<std::string, std::string> { return std::to_string(getpid()); };
}
}

TEST(WorkerIdGenerator, CountsFromOne)
{
    WorkerIdGenerator generator;
    EXPECT_EQ(generator.Next(), "worker-1");
    EXPECT_EQ(generator.Next(), "worker-2");
    EXPECT_EQ(generator.Next(), "worker-3");
}

TEST(WorkerIdGenerator, WrapsAround)
{
    WorkerIdGenerator generator { 2 };
    EXPECT_EQ(generator.Next(), "worker-1");
    EXPECT_EQ(generator.Next(), "worker-2");
    EXPECT_EQ(generator.Next(), "worker-1");
}

TEST(ForkManagerDriver, RejectsInvalidParameters)
{
    auto driver = ForkManagerDriver::Create(ForkManagerParameters(-1));
    ASSERT_FALSE(driver.has_value());
    EXPECT_EQ(driver.error().error_type, ForkliftErrorType::ConfigError);
    driver = ForkManagerDriver::Create(ForkManagerParameters(1, -1.0));
    ASSERT_FALSE(driver.has_value());
    EXPECT_EQ(driver.error().error_type, ForkliftErrorType::ConfigError);
}

TEST(ForkManagerDriver, Defaults)
{
    auto driver = ForkManagerDriver::Create(DriverParameters {});
    ASSERT_TRUE(driver.has_value()) << driver.error().error_message;
    EXPECT_EQ((*driver)->GetMaxWorkers(), 10);
    EXPECT_DOUBLE_EQ((*driver)->GetWaitSleep(), 1.0);
    EXPECT_FALSE((*driver)->IsBusy());
    EXPECT_FALSE((*driver)->IsSaturated());
    EXPECT_FALSE((*driver)->InJob());
}

TEST(ForkManagerDriver, BatchRunsInOneChildInOrder)
{
    auto driver = MakeDriver(2);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    for (JobId id = 1; id <= 3; ++id) {
        jobs.emplace_back(id, ReturnPid(), Collect(results));
    }
    auto result = driver->RunJobs(std::move(jobs));
    ASSERT_TRUE(result.has_value()) << result.error().error_message;
    EXPECT_TRUE(driver->IsBusy());
    EXPECT_EQ(driver->PendingWorkerCount(), 1);

    result = driver->WaitAll();
    ASSERT_TRUE(result.has_value()) << result.error().error_message;
    EXPECT_FALSE(driver->IsBusy());
    EXPECT_EQ(driver->PendingWorkerCount(), 0);

    ASSERT_EQ(results.size(), 3);
    for (std::size_t index = 0; index < results.size(); ++index) {
        EXPECT_EQ(results[index].job_id, index + 1);
        EXPECT_TRUE(results[index].success) << results[index].error;
        EXPECT_EQ(results[index].data, results[0].data);
    }
    EXPECT_NE(results[0].data, std::to_string(getpid()));
}

TEST(ForkManagerDriver, FailuresAreReported)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(
        1,
        []() -> std::expected<std::string, std::string> { return std::unexpected("bad input"); },
        Collect(results));
    jobs.emplace_back(
        2,
        []() -> std::expected<std::string, std::string> { throw std::runtime_error("thrown"); },
        Collect(results));
    jobs.emplace_back(
        3, []() -> std::expected<std::string, std::string> { return "fine"; }, Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    ASSERT_TRUE(driver->WaitAll().has_value());

    ASSERT_EQ(results.size(), 3);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, "bad input");
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error, "thrown");
    EXPECT_TRUE(results[2].success);
    EXPECT_EQ(results[2].data, "fine");
}

TEST(ForkManagerDriver, CrashedWorkerFailsEveryJob)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(1, ReturnPid(), Collect(results));
    jobs.emplace_back(
        2,
        []() -> std::expected<std::string, std::string> {
            raise(SIGKILL);
            return "unreachable";
        },
        Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    ASSERT_TRUE(driver->WaitAll().has_value());

    ASSERT_EQ(results.size(), 2);
    for (JobId id = 1; id <= 2; ++id) {
        auto const& result = results[id - 1];
        EXPECT_EQ(result.job_id, id);
        EXPECT_FALSE(result.success);
        EXPECT_NE(result.error.find("signal"), std::string::npos) << result.error;
    }
}

TEST(ForkManagerDriver, EarlyExitFailsEveryJob)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(
        1,
        []() -> std::expected<std::string, std::string> {
            _exit(9);
        },
        Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    ASSERT_TRUE(driver->WaitAll().has_value());
    ASSERT_EQ(results.size(), 1);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].error.find("code 9"), std::string::npos) << results[0].error;
}

TEST(ForkManagerDriver, InJobInsideWorker)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    auto* driver_pointer = driver.get();
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(
        1,
        [driver_pointer]() -> std::expected<std::string, std::string> {
            return driver_pointer->InJob() ? "in job" : "not in job";
        },
        Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    EXPECT_FALSE(driver->InJob());
    ASSERT_TRUE(driver->WaitAll().has_value());
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].data, "in job");
}

TEST(ForkManagerDriver, NestedRunJobsFails)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    auto* driver_pointer = driver.get();
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(
        1,
        [driver_pointer]() -> std::expected<std::string, std::string> {
            std::vector<Job> nested;
            nested.emplace_back(99, ReturnPid());
            auto result = driver_pointer->RunJobs(std::move(nested));
            if (result.has_value()) {
                return "nested batch started";
            }
            return std::unexpected(result.error().error_message);
        },
        Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    ASSERT_TRUE(driver->WaitAll().has_value());
    ASSERT_EQ(results.size(), 1);
    EXPECT_FALSE(results[0].success);
}

TEST(ForkManagerDriver, Saturation)
{
    auto driver = MakeDriver(2);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    auto sleeper = []() -> std::expected<std::string, std::string> {
        std::this_thread::sleep_for(200ms);
        return "slept";
    };
    for (JobId id = 1; id <= 2; ++id) {
        std::vector<Job> jobs;
        jobs.emplace_back(id, sleeper, Collect(results));
        ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    }
    EXPECT_TRUE(driver->IsSaturated());

    ASSERT_TRUE(driver->WaitSaturated().has_value());
    EXPECT_FALSE(driver->IsSaturated());
    EXPECT_GE(results.size(), 1);

    ASSERT_TRUE(driver->WaitAll().has_value());
    EXPECT_EQ(results.size(), 2);
    // Nothing to wait for
    ASSERT_TRUE(driver->WaitSaturated().has_value());
    ASSERT_TRUE(driver->WaitOne().has_value());
}

TEST(ForkManagerDriver, WaitOne)
{
    auto driver = MakeDriver(3);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    for (JobId id = 1; id <= 3; ++id) {
        std::vector<Job> jobs;
        jobs.emplace_back(
            id,
            [id]() -> std::expected<std::string, std::string> {
                std::this_thread::sleep_for(std::chrono::milliseconds(100 * id));
                return std::to_string(id);
            },
            Collect(results));
        ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    }
    ASSERT_TRUE(driver->WaitOne().has_value());
    EXPECT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].job_id, 1);
    ASSERT_TRUE(driver->WaitAll().has_value());
    EXPECT_EQ(results.size(), 3);
}

TEST(ForkManagerDriver, YieldDeliversFinishedWorkers)
{
    auto driver = MakeDriver(2);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(1, ReturnPid(), Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    for (int attempt = 0; attempt < 1000 && results.empty(); ++attempt) {
        ASSERT_TRUE(driver->Yield().has_value());
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_EQ(results.size(), 1);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(driver->IsBusy());
}

TEST(ForkManagerDriver, ZeroWorkersRunInProcess)
{
    auto driver = MakeDriver(0);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(1, ReturnPid(), Collect(results));
    jobs.emplace_back(2, ReturnPid(), Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    // Results arrive before RunJobs returns
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].data, std::to_string(getpid()));
    EXPECT_EQ(results[1].job_id, 2);
    EXPECT_FALSE(driver->IsBusy());
    EXPECT_FALSE(driver->IsSaturated());
    ASSERT_TRUE(driver->WaitSaturated().has_value());
}

TEST(ForkManagerDriver, BlockingWaitSleep)
{
    auto driver = MakeDriver(2, 0);
    ASSERT_NE(driver, nullptr);
    std::vector<JobResult> results;
    for (JobId id = 1; id <= 4; ++id) {
        std::vector<Job> jobs;
        jobs.emplace_back(id, ReturnPid(), Collect(results));
        ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    }
    ASSERT_TRUE(driver->WaitAll().has_value());
    EXPECT_EQ(results.size(), 4);
}

TEST(ForkManagerDriver, DestructorWaitsForWorkers)
{
    std::vector<JobResult> results;
    {
        auto driver = MakeDriver(2);
        ASSERT_NE(driver, nullptr);
        std::vector<Job> jobs;
        jobs.emplace_back(1, ReturnPid(), Collect(results));
        ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    }
    EXPECT_EQ(results.size(), 1);
}

TEST(ForkManagerDriver, EmptyBatch)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    ASSERT_TRUE(driver->RunJobs({}).has_value());
    EXPECT_FALSE(driver->IsBusy());
}

TEST(ForkManagerDriver, NonStandardExceptionIsReported)
{
    for (int64_t max_workers : { 0, 1 }) {
        auto driver = MakeDriver(max_workers);
        ASSERT_NE(driver, nullptr);
        std::vector<JobResult> results;
        std::vector<Job> jobs;
        jobs.emplace_back(
            1, []() -> std::expected<std::string, std::string> { throw 42; }, Collect(results));
        jobs.emplace_back(
            2, []() -> std::expected<std::string, std::string> { return "after"; },
            Collect(results));
        ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
        ASSERT_TRUE(driver->WaitAll().has_value());
        EXPECT_EQ(driver->PendingWorkerCount(), 0);

        ASSERT_EQ(results.size(), 2) << "max_workers " << max_workers;
        EXPECT_FALSE(results[0].success);
        EXPECT_EQ(results[0].error, "unknown exception");
        EXPECT_TRUE(results[1].success) << results[1].error;
        EXPECT_EQ(results[1].data, "after");
    }
}

TEST(ForkManagerDriver, BatchThatCannotStartFailsEveryJob)
{
    auto driver = MakeDriver(1);
    ASSERT_NE(driver, nullptr);
    auto* driver_pointer = driver.get();
    std::vector<JobResult> results;
    std::vector<Job> jobs;
    jobs.emplace_back(
        1,
        [driver_pointer]() -> std::expected<std::string, std::string> {
            std::vector<JobResult> nested_results;
            std::vector<Job> nested;
            nested.emplace_back(98, ReturnPid(), Collect(nested_results));
            nested.emplace_back(99, ReturnPid(), Collect(nested_results));
            if (driver_pointer->RunJobs(std::move(nested)).has_value()) {
                return std::unexpected("nested batch started");
            }
            if (nested_results.size() != 2 || nested_results[0].job_id != 98
                || nested_results[1].job_id != 99) {
                return std::unexpected(
                    std::to_string(nested_results.size()) + " nested results delivered");
            }
            if (nested_results[0].success || nested_results[1].success) {
                return std::unexpected("nested job reported success");
            }
            return nested_results[1].error;
        },
        Collect(results));
    ASSERT_TRUE(driver->RunJobs(std::move(jobs)).has_value());
    ASSERT_TRUE(driver->WaitAll().has_value());
    ASSERT_EQ(results.size(), 1);
    ASSERT_TRUE(results[0].success) << results[0].error;
    EXPECT_NE(results[0].data.find("could not start"), std::string::npos) << results[0].data;
}

// Two blocking drivers in one process reap each other's workers
TEST(ForkManagerDriver, BlockingDriversShareTheProcess)
{
    auto quick_driver = MakeDriver(2, 0);
    auto slow_driver = MakeDriver(2, 0);
    ASSERT_NE(quick_driver, nullptr);
    ASSERT_NE(slow_driver, nullptr);

    std::vector<JobResult> quick_results;
    std::vector<JobResult> slow_results;
    std::vector<Job> quick_jobs;
    quick_jobs.emplace_back(
        1, []() -> std::expected<std::string, std::string> { return "quick"; },
        Collect(quick_results));
    ASSERT_TRUE(quick_driver->RunJobs(std::move(quick_jobs)).has_value());

    std::vector<Job> slow_jobs;
    slow_jobs.emplace_back(
        1,
        []() -> std::expected<std::string, std::string> {
            std::this_thread::sleep_for(300ms);
            return "slow";
        },
        Collect(slow_results));
    ASSERT_TRUE(slow_driver->RunJobs(std::move(slow_jobs)).has_value());

    ASSERT_TRUE(slow_driver->WaitAll().has_value());
    ASSERT_TRUE(quick_driver->WaitAll().has_value());

    ASSERT_EQ(slow_results.size(), 1);
    EXPECT_TRUE(slow_results[0].success) << slow_results[0].error;
    EXPECT_EQ(slow_results[0].data, "slow");
    ASSERT_EQ(quick_results.size(), 1);
    EXPECT_TRUE(quick_results[0].success) << quick_results[0].error;
    EXPECT_EQ(quick_results[0].data, "quick");
}
