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
#include "driver.hpp"

#include "error.hpp"
#include "fork_manager_driver.hpp"
#include "inline_driver.hpp"

namespace forklift {

auto CreateDriver(DriverParameters const& parameters)
    -> std::expected<std::unique_ptr<Driver>, ForkliftError>
{
    auto validation = Validate(parameters);
    if (not validation.has_value()) {
        return std::unexpected(validation.error());
    }
    switch (parameters.driver_type) {
    case DriverType::ForkManager: {
        auto driver = ForkManagerDriver::Create(parameters);
        if (not driver.has_value()) {
            return std::unexpected(driver.error());
        }
        return std::unique_ptr<Driver>(std::move(*driver));
    }
    case DriverType::Inline:
        return std::unique_ptr<Driver>(new InlineDriver());
    }
    return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ConfigError,
        .error_message = "Unknown driver type" });
}

} // namespace forklift
