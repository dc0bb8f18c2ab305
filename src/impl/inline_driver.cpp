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
#include "inline_driver.hpp"

#include "utils.hpp"

#include <fmt/core.h>

namespace forklift {

auto InlineDriver::RunJobs(std::vector<Job> jobs) -> std::expected<void, ForkliftError>
{
    if (m_in_job) {
        auto error = ForkliftError { .error_type = ForkliftErrorType::DriverError,
            .error_message = fmt::format("Cannot run {} jobs from inside a job", jobs.size()) };
        for (auto const& job : jobs) {
            job.Fail(error.error_message);
        }
        return std::unexpected(error);
    }

    std::vector<JobOutcome> outcomes;
    outcomes.reserve(jobs.size());
    {
        m_in_job = true;
        Defer defer([this]() { m_in_job = false; });
        for (auto const& job : jobs) {
            outcomes.push_back(job.Run());
        }
    }

    for (std::size_t index = 0; index < jobs.size(); ++index) {
        jobs[index].RunCallback(JobResult::FromOutcome(std::move(outcomes[index]), jobs[index].Id()));
    }
    return {};
}

} // namespace forklift
