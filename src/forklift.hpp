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

#ifndef FORKLIFT_FORKLIFT_HPP
#define FORKLIFT_FORKLIFT_HPP

#include "driver.hpp"
#include "error.hpp"
#include "job.hpp"
#include "parameters.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

namespace forklift {

// Job queue. Jobs are grouped into batches of batch_size and each batch is
// handed to the configured driver. Results come back through the callback
// given to Do(), always in the calling process.
class Forklift {
public:
    [[nodiscard]] static auto Create(ForkliftParameters const& parameters)
        -> std::expected<Forklift, ForkliftError>;

    Forklift(Forklift const&) = delete;
    Forklift(Forklift&&) = default;
    Forklift& operator=(Forklift&&) = delete;
    // Waits for every queued job unless called from inside a job
    ~Forklift();

    // Queues a job, sending the current batch to the driver once it is full
    [[nodiscard]] auto Do(JobFunction function, ResultCallback callback = {})
        -> std::expected<JobId, ForkliftError>;
    // Sends a partial batch to the driver
    [[nodiscard]] auto Flush() -> std::expected<void, ForkliftError>;

    [[nodiscard]] auto Yield() -> std::expected<void, ForkliftError>;
    [[nodiscard]] auto WaitOne() -> std::expected<void, ForkliftError>;
    // Returns once every queued job has delivered its result, including jobs
    // queued by result callbacks while waiting
    [[nodiscard]] auto WaitAll() -> std::expected<void, ForkliftError>;
    [[nodiscard]] auto WaitSaturated() -> std::expected<void, ForkliftError>;

    [[nodiscard]] auto IsBusy() const -> bool;
    [[nodiscard]] auto IsSaturated() const -> bool { return m_driver->IsSaturated(); }
    [[nodiscard]] auto InJob() const -> bool { return m_driver->InJob(); }
    [[nodiscard]] auto PendingJobCount() const -> uint64_t { return m_pending_jobs.size(); }

    [[nodiscard]] auto GetDriver() -> Driver& { return *m_driver; }
    [[nodiscard]] auto GetParameters() const -> ForkliftParameters const& { return m_parameters; }

private:
    Forklift(ForkliftParameters parameters, std::unique_ptr<Driver> driver)
        : m_parameters(std::move(parameters))
        , m_driver(std::move(driver))
    {
    }

    ForkliftParameters m_parameters;
    std::unique_ptr<Driver> m_driver;
    std::vector<Job> m_pending_jobs;
    JobId m_last_job_id = 0;
};

} // namespace forklift

#endif
