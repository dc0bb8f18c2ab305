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
#include "parameters.hpp"

#include "error.hpp"
#include "utils.hpp"

#include <cmath>
#include <fmt/core.h>

namespace forklift {

namespace {
    auto configError(std::string message) -> std::unexpected<ForkliftError>
    {
        return std::unexpected(ForkliftError {
            .error_type = ForkliftErrorType::ConfigError, .error_message = std::move(message) });
    }
} // namespace

auto ParseDriverType(std::string_view name) -> std::expected<DriverType, ForkliftError>
{
    if (name == "ForkManager" || name == "::Parallel::ForkManager" || name == "fork_manager") {
        return DriverType::ForkManager;
    }
    if (name == "Inline" || name == "inline") {
        return DriverType::Inline;
    }
    return configError(fmt::format("Unknown driver class \"{}\"", name));
}

auto ToString(DriverType driver_type) -> char const*
{
    switch (driver_type) {
    case DriverType::ForkManager:
        return "ForkManager";
    case DriverType::Inline:
        return "Inline";
    }
    return "Unknown";
}

auto Validate(DriverParameters const& parameters) -> std::expected<void, ForkliftError>
{
    if (parameters.max_workers < 0) {
        return configError(
            fmt::format("max_workers must be zero or positive, got {}", parameters.max_workers));
    }
    if (not std::isfinite(parameters.wait_sleep) || parameters.wait_sleep < 0) {
        return configError(
            fmt::format("wait_sleep must be zero or positive, got {}", parameters.wait_sleep));
    }
    return {};
}

auto Validate(ForkliftParameters const& parameters) -> std::expected<void, ForkliftError>
{
    if (parameters.batch_size == 0) {
        return configError("batch_size must be positive");
    }
    return Validate(parameters.driver);
}

auto ParseForkliftParameters(std::map<std::string, std::string> const& options)
    -> std::expected<ForkliftParameters, ForkliftError>
{
    ForkliftParameters parameters;
    for (auto const& [key, value] : options) {
        if (key == "class") {
            auto driver_type = ParseDriverType(value);
            if (not driver_type.has_value()) {
                return std::unexpected(driver_type.error());
            }
            parameters.driver.driver_type = *driver_type;
        } else if (key == "max_workers") {
            auto max_workers = ParseNumber<int64_t>(value);
            if (not max_workers.has_value()) {
                return configError(fmt::format("max_workers is not an integer: \"{}\"", value));
            }
            parameters.driver.max_workers = *max_workers;
        } else if (key == "wait_sleep") {
            auto wait_sleep = ParseNumber<double>(value);
            if (not wait_sleep.has_value()) {
                return configError(fmt::format("wait_sleep is not a number: \"{}\"", value));
            }
            parameters.driver.wait_sleep = *wait_sleep;
        } else if (key == "batch_size") {
            auto batch_size = ParseNumber<uint64_t>(value);
            if (not batch_size.has_value()) {
                return configError(
                    fmt::format("batch_size is not a positive integer: \"{}\"", value));
            }
            parameters.batch_size = *batch_size;
        } else {
            return configError(fmt::format("Unknown option \"{}\"", key));
        }
    }
    auto result = Validate(parameters);
    if (not result.has_value()) {
        return std::unexpected(result.error());
    }
    return parameters;
}

} // namespace forklift
