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

#ifndef FORKLIFT_PARAMETERS_HPP
#define FORKLIFT_PARAMETERS_HPP

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace forklift {

enum class DriverType { ForkManager, Inline };

struct DriverParameters {
    DriverType driver_type = DriverType::ForkManager;
    // Upper bound on forked workers, 0 runs every batch in the calling process
    int64_t max_workers = 10;
    // Seconds between non-blocking reaps while waiting, 0 blocks in waitpid
    double wait_sleep = 1.0;
};

struct ForkliftParameters {
    DriverParameters driver;
    // Jobs handed to a single worker
    uint64_t batch_size = 1;
};

[[nodiscard]] auto ParseDriverType(std::string_view name) -> std::expected<DriverType, ForkliftError>;
[[nodiscard]] auto ToString(DriverType driver_type) -> char const*;

[[nodiscard]] auto Validate(DriverParameters const& parameters) -> std::expected<void, ForkliftError>;
[[nodiscard]] auto Validate(ForkliftParameters const& parameters)
    -> std::expected<void, ForkliftError>;

// Keys: class, max_workers, wait_sleep, batch_size. Missing keys keep their defaults.
[[nodiscard]] auto ParseForkliftParameters(std::map<std::string, std::string> const& options)
    -> std::expected<ForkliftParameters, ForkliftError>;

} // namespace forklift

#endif
