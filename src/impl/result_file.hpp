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
#ifndef FORKLIFT_RESULT_FILE_HPP
#define FORKLIFT_RESULT_FILE_HPP

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// Anonymous in-memory file shared between a parent and the child it forks.
// The child writes its serialized results, the parent reads them back after
// the child has been reaped.
class ResultFile {
public:
    ResultFile() = default;
    ResultFile(ResultFile const&) = delete;
    ResultFile(ResultFile&&);
    auto operator=(ResultFile&&) -> ResultFile&;
    ~ResultFile();

    [[nodiscard]] static auto Create(std::string const& identifier)
        -> std::expected<ResultFile, ForkliftError>;

    [[nodiscard]] auto Write(std::string_view bytes) -> std::expected<void, ForkliftError>;

    // An empty file means the writer never finished and yields std::nullopt
    [[nodiscard]] auto Read() const
        -> std::expected<std::optional<std::string>, ForkliftError>;

    [[nodiscard]] auto IsValid() const -> bool { return m_fd != -1; }

private:
    auto release() -> void;
    std::string m_identifier;
    int32_t m_fd = -1;
};

#endif
