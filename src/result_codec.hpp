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

#ifndef FORKLIFT_RESULT_CODEC_HPP
#define FORKLIFT_RESULT_CODEC_HPP

#include "error.hpp"
#include "job.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace forklift {

// 'FKR1'
static constexpr uint32_t RESULT_CODEC_MAGIC = 0x31524b46;

// Layout, host byte order:
//   u32 magic | u64 count | count x (u8 success | u64 len | error | u64 len | data)
[[nodiscard]] auto EncodeJobOutcomes(std::vector<JobOutcome> const& outcomes) -> std::string;

[[nodiscard]] auto DecodeJobOutcomes(std::string_view bytes)
    -> std::expected<std::vector<JobOutcome>, ForkliftError>;

} // namespace forklift

#endif
