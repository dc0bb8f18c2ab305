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

#ifndef FORKLIFT_DRIVER_HPP
#define FORKLIFT_DRIVER_HPP

#include "error.hpp"
#include "job.hpp"
#include "parameters.hpp"

#include <expected>
#include <memory>
#include <vector>

namespace forklift {

// Backend strategy that runs batches of jobs for a Forklift queue
struct Driver {
    virtual ~Driver() = default;

    // At least one worker is running
    [[nodiscard]] virtual auto IsBusy() const -> bool = 0;
    // No worker slot is free
    [[nodiscard]] virtual auto IsSaturated() const -> bool = 0;
    // Called from inside a worker that is running jobs
    [[nodiscard]] virtual auto InJob() const -> bool = 0;

    // Runs the jobs together in one worker, blocks while saturated
    [[nodiscard]] virtual auto RunJobs(std::vector<Job> jobs) -> std::expected<void, ForkliftError>
        = 0;
    // Delivers results of finished workers without blocking
    [[nodiscard]] virtual auto Yield() -> std::expected<void, ForkliftError> = 0;
    // Waits for one less active worker than when the wait started
    [[nodiscard]] virtual auto WaitOne() -> std::expected<void, ForkliftError> = 0;
    [[nodiscard]] virtual auto WaitAll() -> std::expected<void, ForkliftError> = 0;
    // Waits for at least one free worker slot
    [[nodiscard]] virtual auto WaitSaturated() -> std::expected<void, ForkliftError> = 0;
};

[[nodiscard]] auto CreateDriver(DriverParameters const& parameters)
    -> std::expected<std::unique_ptr<Driver>, ForkliftError>;

} // namespace forklift

#endif
