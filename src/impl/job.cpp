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
#include "job.hpp"

#include <exception>
#include <fmt/core.h>

namespace forklift {

auto Job::Run() const -> JobOutcome
{
    if (not m_function) {
        return JobOutcome { .success = false,
            .error = fmt::format("job {} has no function to run", m_id) };
    }
    try {
        auto result = m_function();
        if (not result.has_value()) {
            return JobOutcome { .success = false, .error = std::move(result.error()) };
        }
        return JobOutcome { .success = true, .data = std::move(*result) };
    } catch (std::exception const& exception) {
        return JobOutcome { .success = false, .error = exception.what() };
    } catch (...) {
        return JobOutcome { .success = false, .error = "unknown exception" };
    }
}

auto Job::RunCallback(JobResult const& result) const -> void
{
    if (m_callback) {
        m_callback(result);
    }
}

auto Job::Fail(std::string error) const -> void
{
    RunCallback(JobResult { .job_id = m_id, .success = false, .error = std::move(error) });
}

} // namespace forklift
