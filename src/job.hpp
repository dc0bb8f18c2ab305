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

#ifndef FORKLIFT_JOB_HPP
#define FORKLIFT_JOB_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <utility>

namespace forklift {

using JobId = uint64_t;

// What a job produced, as carried from a worker back to the parent
struct JobOutcome {
    bool success = false;
    std::string error;
    std::string data;
};

// Outcome tagged with the id of the job that produced it
struct JobResult {
    JobId job_id {};
    bool success = false;
    std::string error;
    std::string data;

    [[nodiscard]] static auto FromOutcome(JobOutcome outcome, JobId job_id) -> JobResult
    {
        return JobResult { .job_id = job_id,
            .success = outcome.success,
            .error = std::move(outcome.error),
            .data = std::move(outcome.data) };
    }
};

// A job either returns its data or an error message. Throwing counts as an
// error too.
using JobFunction = std::function<std::expected<std::string, std::string>()>;
using ResultCallback = std::function<void(JobResult const&)>;

class Job {
public:
    Job(JobId id, JobFunction function, ResultCallback callback = {})
        : m_id(id)
        , m_function(std::move(function))
        , m_callback(std::move(callback))
    {
    }

    [[nodiscard]] auto Id() const -> JobId { return m_id; }

    // Runs the job function, never throws
    auto Run() const -> JobOutcome;

    auto RunCallback(JobResult const& result) const -> void;
    // Reports a job that never got to run
    auto Fail(std::string error) const -> void;

private:
    JobId m_id {};
    JobFunction m_function;
    ResultCallback m_callback;
};

} // namespace forklift

#endif
