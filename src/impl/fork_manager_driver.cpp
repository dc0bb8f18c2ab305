// MIT License

// Copyright (c) 2023 Kevin Joseph

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#include "fork_manager_driver.hpp"

#include "error.hpp"
#include "fork_pool.hpp"
#include "result_codec.hpp"

#include <fmt/core.h>

namespace forklift {

namespace {
    // Worker ids are unique across every driver of the process
    auto nextWorkerId() -> std::string
    {
        static WorkerIdGenerator generator;
        return generator.Next();
    }

    auto describeMissingResults(FinishedChild const& child) -> std::string
    {
        if (child.signal != 0) {
            return fmt::format("{} (pid {}) was killed by signal {}{}", child.identifier,
                child.pid, child.signal, child.core_dump ? " (core dumped)" : "");
        }
        return fmt::format("{} (pid {}) exited with code {} without sending results",
            child.identifier, child.pid, child.exit_code);
    }
} // namespace

auto WorkerIdGenerator::Next() -> std::string
{
    ++m_last_id;
    if (m_last_id > m_max_id) {
        m_last_id = 1;
    }
    return fmt::format("worker-{}", m_last_id);
}

auto ForkManagerDriver::Create(DriverParameters const& parameters)
    -> std::expected<std::unique_ptr<ForkManagerDriver>, ForkliftError>
{
    auto validation = Validate(parameters);
    if (not validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return std::unique_ptr<ForkManagerDriver>(new ForkManagerDriver(
        static_cast<uint64_t>(parameters.max_workers), parameters.wait_sleep));
}

ForkManagerDriver::ForkManagerDriver(uint64_t max_workers, double wait_sleep)
    : m_pool(max_workers, wait_sleep)
{
    m_pool.SetOnFinish([this](FinishedChild const& child) { onFinish(child); });
}

ForkManagerDriver::~ForkManagerDriver()
{
    if (InJob()) {
        return;
    }
    auto result = WaitAll();
    if (not result.has_value()) {
        fmt::print(stderr, "ForkManagerDriver::~ForkManagerDriver wait failed with error {}\n",
            result.error().error_message);
    }
}

auto ForkManagerDriver::IsBusy() const -> bool { return m_pool.RunningProcs() > 0; }

auto ForkManagerDriver::IsSaturated() const -> bool
{
    // Without worker slots every batch runs in-process, nothing to wait for
    return m_pool.MaxProcs() > 0 && m_pool.RunningProcs() >= m_pool.MaxProcs();
}

auto ForkManagerDriver::InJob() const -> bool { return m_pool.IsChild(); }

auto ForkManagerDriver::RunJobs(std::vector<Job> jobs) -> std::expected<void, ForkliftError>
{
    if (jobs.empty()) {
        return {};
    }
    auto worker_id = nextWorkerId();
    // try_emplace leaves the jobs untouched when the id is taken
    if (not m_worker_jobs.try_emplace(worker_id, std::move(jobs)).second) {
        auto error = ForkliftError { .error_type = ForkliftErrorType::DriverError,
            .error_message = fmt::format("{} is still running", worker_id) };
        for (auto const& job : jobs) {
            job.Fail(error.error_message);
        }
        return std::unexpected(error);
    }

    auto result = m_pool.Start(worker_id, [this, worker_id]() -> ChildOutput {
        std::vector<JobOutcome> outcomes;
        for (auto const& job : m_worker_jobs.at(worker_id)) {
            outcomes.push_back(job.Run());
        }
        return ChildOutput { .exit_code = 0, .data = EncodeJobOutcomes(outcomes) };
    });
    if (not result.has_value()) {
        // Do() already handed out these ids, so every job still gets a result
        auto node = m_worker_jobs.extract(worker_id);
        if (not node.empty()) {
            for (auto const& job : node.mapped()) {
                job.Fail(fmt::format("{} could not start: {}", worker_id,
                    result.error().error_message));
            }
        }
        return std::unexpected(result.error());
    }
    return {};
}

auto ForkManagerDriver::onFinish(FinishedChild const& child) -> void
{
    auto node = m_worker_jobs.extract(child.identifier);
    if (node.empty()) {
        fmt::print(stderr, "ForkManagerDriver: no jobs stashed under worker id \"{}\" (pid {})\n",
            child.identifier, child.pid);
        return;
    }
    auto jobs = std::move(node.mapped());

    std::vector<JobOutcome> outcomes;
    std::string failure;
    if (child.data.has_value()) {
        auto decoded = DecodeJobOutcomes(*child.data);
        if (decoded.has_value()) {
            outcomes = std::move(*decoded);
        } else {
            failure = fmt::format("{} (pid {}) sent unreadable results: {}", child.identifier,
                child.pid, decoded.error().error_message);
        }
    } else {
        failure = describeMissingResults(child);
    }

    for (std::size_t index = 0; index < jobs.size(); ++index) {
        auto const& job = jobs[index];
        if (index < outcomes.size()) {
            job.RunCallback(JobResult::FromOutcome(std::move(outcomes[index]), job.Id()));
            continue;
        }
        auto error = failure.empty()
            ? fmt::format("{} (pid {}) sent no result for job {}", child.identifier, child.pid,
                  job.Id())
            : failure;
        job.RunCallback(JobResult { .job_id = job.Id(), .success = false, .error = error });
    }
}

auto ForkManagerDriver::Yield() -> std::expected<void, ForkliftError>
{
    auto result = m_pool.ReapFinishedChildren();
    if (not result.has_value()) {
        return std::unexpected(result.error());
    }
    return {};
}

auto ForkManagerDriver::WaitOne() -> std::expected<void, ForkliftError>
{
    auto running_procs = m_pool.RunningProcs();
    if (running_procs == 0) {
        return {};
    }
    auto available_procs = m_pool.MaxProcs() - running_procs;
    return m_pool.WaitForAvailableProcs(available_procs + 1);
}

auto ForkManagerDriver::WaitAll() -> std::expected<void, ForkliftError>
{
    if (not IsBusy()) {
        return {};
    }
    return m_pool.WaitAllChildren();
}

auto ForkManagerDriver::WaitSaturated() -> std::expected<void, ForkliftError>
{
    if (not IsSaturated()) {
        return {};
    }
    return m_pool.WaitForAvailableProcs(1);
}

} // namespace forklift
