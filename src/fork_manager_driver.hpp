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

#ifndef FORKLIFT_FORK_MANAGER_DRIVER_HPP
#define FORKLIFT_FORK_MANAGER_DRIVER_HPP

#include "driver.hpp"
#include "fork_pool.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace forklift {

static constexpr uint64_t MAX_WORKER_ID = 4'000'000'000;

// Produces "worker-1", "worker-2", ... and starts over at 1 past max_id
class WorkerIdGenerator {
public:
    explicit WorkerIdGenerator(uint64_t max_id = MAX_WORKER_ID)
        : m_max_id(max_id)
    {
    }
    auto Next() -> std::string;

private:
    uint64_t m_last_id = 0;
    uint64_t m_max_id = MAX_WORKER_ID;
};

// Runs each batch of jobs in a forked child of a ForkPool. The child runs the
// jobs one after the other and sends their outcomes back as its finish data.
class ForkManagerDriver : public Driver {
public:
    [[nodiscard]] static auto Create(DriverParameters const& parameters)
        -> std::expected<std::unique_ptr<ForkManagerDriver>, ForkliftError>;

    ForkManagerDriver(ForkManagerDriver const&) = delete;
    ForkManagerDriver(ForkManagerDriver&&) = delete;
    // Waits for all workers unless called from inside a job
    ~ForkManagerDriver() override;

    [[nodiscard]] auto IsBusy() const -> bool override;
    [[nodiscard]] auto IsSaturated() const -> bool override;
    [[nodiscard]] auto InJob() const -> bool override;

    [[nodiscard]] auto RunJobs(std::vector<Job> jobs) -> std::expected<void, ForkliftError> override;
    [[nodiscard]] auto Yield() -> std::expected<void, ForkliftError> override;
    [[nodiscard]] auto WaitOne() -> std::expected<void, ForkliftError> override;
    [[nodiscard]] auto WaitAll() -> std::expected<void, ForkliftError> override;
    [[nodiscard]] auto WaitSaturated() -> std::expected<void, ForkliftError> override;

    [[nodiscard]] auto GetMaxWorkers() const -> uint64_t { return m_pool.MaxProcs(); }
    [[nodiscard]] auto GetWaitSleep() const -> double { return m_pool.GetWaitpidBlockingSleep(); }
    [[nodiscard]] auto PendingWorkerCount() const -> uint64_t { return m_worker_jobs.size(); }

private:
    ForkManagerDriver(uint64_t max_workers, double wait_sleep);
    auto onFinish(FinishedChild const& child) -> void;

    ForkPool m_pool;
    std::unordered_map<std::string, std::vector<Job>> m_worker_jobs;
};

} // namespace forklift

#endif
