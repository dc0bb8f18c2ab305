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

#ifndef FORKLIFT_PROCESS_FORK_HPP
#define FORKLIFT_PROCESS_FORK_HPP

// Local includes
#include "error.hpp"
// System includes
#include <cerrno>
#include <concepts>
#include <cstring>
#include <exception>
#include <expected>
#include <fmt/core.h>
#include <optional>
#include <sys/types.h>
#include <unistd.h>

enum ChildProcessState { SUCCESS = 0, FAIL = 1 };

// Exit code used when the child function lets an exception escape
static constexpr int CHILD_EXCEPTION_EXIT_CODE = 255;

template <typename F>
concept ChildProcessFunction = requires(F f) {
    {
        f()
    } -> std::convertible_to<int>;
};

struct ExitStatus {
    int exit_code = 0;
    int signal = 0;
    bool core_dump = false;
};

[[nodiscard]] auto DecodeWaitStatus(int status) -> ExitStatus;

struct ChildProcessHandle {
    template <ChildProcessFunction F>
    static auto RunChildFunction(F child_process_function)
        -> std::expected<ChildProcessHandle, ForkliftError>
    {
        auto status = fork();
        if (status == 0) {
            // Child process, never returns to the caller's stack
            int exit_code = CHILD_EXCEPTION_EXIT_CODE;
            try {
                exit_code = static_cast<int>(child_process_function());
            } catch (std::exception const& exception) {
                fmt::print(stderr, "Child process {} terminated by exception: {}\n", getpid(),
                    exception.what());
            }
            _exit(exit_code);
        } else if (status == -1) {
            auto error_message = strerror(errno);
            errno = 0;
            return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ForkError,
                .error_message = fmt::format("fork failed with error:{}", error_message) });
        }
        ChildProcessHandle child_process_handle;
        child_process_handle.m_child_process_id = static_cast<pid_t>(status);
        return child_process_handle;
    }

    // Blocks until the child terminates
    auto WaitForChildProcess() -> std::expected<ExitStatus, ForkliftError>;
    // std::nullopt while the child is still running
    auto PollChildProcess() -> std::expected<std::optional<ExitStatus>, ForkliftError>;

    [[nodiscard]] auto GetPid() const -> pid_t { return m_child_process_id; }

private:
    pid_t m_child_process_id {};
};

#endif
