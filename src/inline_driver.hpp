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

#ifndef FORKLIFT_INLINE_DRIVER_HPP
#define FORKLIFT_INLINE_DRIVER_HPP

#include "driver.hpp"

namespace forklift {

// Runs every batch in the calling process and delivers results right away
class InlineDriver : public Driver {
public:
    [[nodiscard]] auto IsBusy() const -> bool override { return false; }
    [[nodiscard]] auto IsSaturated() const -> bool override { return false; }
    [[nodiscard]] auto InJob() const -> bool override { return m_in_job; }

    [[nodiscard]] auto RunJobs(std::vector<Job> jobs) -> std::expected<void, ForkliftError> override;
    [[nodiscard]] auto Yield() -> std::expected<void, ForkliftError> override { return {}; }
    [[nodiscard]] auto WaitOne() -> std::expected<void, ForkliftError> override { return {}; }
    [[nodiscard]] auto WaitAll() -> std::expected<void, ForkliftError> override { return {}; }
    [[nodiscard]] auto WaitSaturated() -> std::expected<void, ForkliftError> override { return {}; }

private:
    bool m_in_job = false;
};

} // namespace forklift

#endif
