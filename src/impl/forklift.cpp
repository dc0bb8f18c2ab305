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
#include "forklift.hpp"

#include <fmt/core.h>

namespace forklift {

auto Forklift::Create(ForkliftParameters const& parameters)
    -> std::expected<Forklift, ForkliftError>
{
    auto validation = Validate(parameters);
    if (not validation.has_value()) {
        return std::unexpected(validation.error());
    }
    auto driver = CreateDriver(parameters.driver);
    if (not driver.has_value()) {
        return std::unexpected(driver.error());
    }
    return Forklift { parameters, std::move(*driver) };
}

Forklift::~Forklift()
{
    if (m_driver == nullptr || m_driver->InJob()) {
        return;
    }
    auto result = WaitAll();
    if (not result.has_value()) {
        fmt::print(stderr, "Forklift::~Forklift wait failed with {}: {} ({} jobs still queued)\n",
            ::ToString(result.error().error_type), result.error().error_message,
            m_pending_jobs.size());
    }
}

auto Forklift::Do(JobFunction function, ResultCallback callback)
    -> std::expected<JobId, ForkliftError>
{
    auto job_id = ++m_last_job_id;
    m_pending_jobs.emplace_back(job_id, std::move(function), std::move(callback));
    if (m_pending_jobs.size() >= m_parameters.batch_size) {
        auto result = Flush();
        if (not result.has_value()) {
            return std::unexpected(result.error());
        }
    }
    return job_id;
}

auto Forklift::Flush() -> std::expected<void, ForkliftError>
{
    if (m_pending_jobs.empty()) {
        return {};
    }
    // Result callbacks may queue new jobs while the driver runs this batch
    auto batch = std::move(m_pending_jobs);
    m_pending_jobs.clear();
    return m_driver->RunJobs(std::move(batch));
}

auto Forklift::Yield() -> std::expected<void, ForkliftError> { return m_driver->Yield(); }

auto Forklift::WaitOne() -> std::expected<void, ForkliftError>
{
    auto result = Flush();
    if (not result.has_value()) {
        return std::unexpected(result.error());
    }
    return m_driver->WaitOne();
}

auto Forklift::WaitAll() -> std::expected<void, ForkliftError>
{
    while (IsBusy()) {
        auto result = Flush();
        if (not result.has_value()) {
            return std::unexpected(result.error());
        }
        result = m_driver->WaitAll();
        if (not result.has_value()) {
            return std::unexpected(result.error());
        }
    }
    return {};
}

auto Forklift::WaitSaturated() -> std::expected<void, ForkliftError>
{
    auto result = Flush();
    if (not result.has_value()) {
        return std::unexpected(result.error());
    }
    return m_driver->WaitSaturated();
}

auto Forklift::IsBusy() const -> bool { return not m_pending_jobs.empty() || m_driver->IsBusy(); }

} // namespace forklift
