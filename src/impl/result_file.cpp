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
#include "result_file.hpp"

// Local includes
#include "error.hpp"
// System includes
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <sys/mman.h>
#include <sys/stat.h> /* For mode constants */
#include <unistd.h>
#include <utility>

auto ResultFile::Create(std::string const& identifier) -> std::expected<ResultFile, ForkliftError>
{
    auto fd = memfd_create(identifier.c_str(), MFD_CLOEXEC);
    if (fd == -1) {
        auto error_message = strerror(errno);
        errno = 0;
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ResultFileError,
            .error_message = fmt::format("memfd_create({}) error: {}", identifier, error_message) });
    }
    ResultFile result_file;
    result_file.m_identifier = identifier;
    result_file.m_fd = fd;
    return result_file;
}

auto ResultFile::Write(std::string_view bytes) -> std::expected<void, ForkliftError>
{
    FORKLIFT_ASSERT(m_fd != -1);
    while (not bytes.empty()) {
        auto written = write(m_fd, bytes.data(), bytes.size());
        if (written == -1) {
            if (errno == EINTR) {
                errno = 0;
                continue;
            }
            auto error_message = strerror(errno);
            errno = 0;
            return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ResultFileError,
                .error_message = fmt::format("write({}) error: {}", m_identifier, error_message) });
        }
        bytes.remove_prefix(static_cast<std::size_t>(written));
    }
    return {};
}

auto ResultFile::Read() const -> std::expected<std::optional<std::string>, ForkliftError>
{
    FORKLIFT_ASSERT(m_fd != -1);
    struct stat stat { };
    if (fstat(m_fd, &stat) != 0) {
        auto error_message = strerror(errno);
        errno = 0;
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ResultFileError,
            .error_message = fmt::format("fstat({}) error: {}", m_identifier, error_message) });
    }
    if (stat.st_size == 0) {
        return std::nullopt;
    }

    std::string bytes(static_cast<std::size_t>(stat.st_size), '\0');
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        auto count = pread(m_fd, bytes.data() + offset, bytes.size() - offset,
            static_cast<off_t>(offset));
        if (count == -1) {
            if (errno == EINTR) {
                errno = 0;
                continue;
            }
            auto error_message = strerror(errno);
            errno = 0;
            return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ResultFileError,
                .error_message = fmt::format("pread({}) error: {}", m_identifier, error_message) });
        }
        if (count == 0) {
            return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ResultFileError,
                .error_message = fmt::format("pread({}) hit end of file after {} of {} bytes",
                    m_identifier, offset, bytes.size()) });
        }
        offset += static_cast<std::size_t>(count);
    }
    return bytes;
}

auto ResultFile::release() -> void
{
    if (m_fd != -1) {
        if (close(m_fd) != 0) {
            auto error_message = strerror(errno);
            errno = 0;
            fmt::print(stderr, "close({}) failed with error:{}\n", m_identifier, error_message);
        }
        m_fd = -1;
    }
    m_identifier.clear();
}

ResultFile::~ResultFile() { release(); }

ResultFile::ResultFile(ResultFile&& other)
    : m_identifier(std::move(other.m_identifier))
    , m_fd(std::exchange(other.m_fd, -1))
{
}

auto ResultFile::operator=(ResultFile&& other) -> ResultFile&
{
    if (this != &other) {
        release();
        m_identifier = std::move(other.m_identifier);
        m_fd = std::exchange(other.m_fd, -1);
    }
    return *this;
}
