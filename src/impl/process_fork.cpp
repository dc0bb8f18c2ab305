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

#include "process_fork.hpp"
#include "error.hpp"
#include "fmt/core.h"

#include <sys/wait.h>

auto DecodeWaitStatus(int status) -> ExitStatus
{
    ExitStatus exit_status {};
    if (WIFEXITED(status)) {
        exit_status.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status.signal = WTERMSIG(status);
#ifdef WCOREDUMP
        exit_status.core_dump = WCOREDUMP(status);
#endif
    }
    return exit_status;
}

auto ChildProcessHandle::WaitForChildProcess() -> std::expected<ExitStatus, ForkliftError>
{
    int status {};
    do {
        auto return_code = waitpid(m_child_process_id, &status, 0);
        if (return_code == -1) {
            if (errno == EINTR) {
                errno = 0;
                continue;
            }
            auto error_message = strerror(errno);
            errno = 0;
            return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::WaitError,
                .error_message = fmt::format(
                    "waitpid({}) failed with error:{}", m_child_process_id, error_message) });
        }
    } while (!WIFEXITED(status) && !WIFSIGNALED(status));
    return DecodeWaitStatus(status);
}

auto ChildProcessHandle::PollChildProcess()
    -> std::expected<std::optional<ExitStatus>, ForkliftError>
{
    int status {};
    auto return_code = waitpid(m_child_process_id, &status, WNOHANG);
    if (return_code == -1) {
        if (errno == EINTR) {
            errno = 0;
            return std::nullopt;
        }
        auto error_message = strerror(errno);
        errno = 0;
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::WaitError,
            .error_message = fmt::format(
                "waitpid({}) failed with error:{}", m_child_process_id, error_message) });
    }
    if (return_code == 0 || (!WIFEXITED(status) && !WIFSIGNALED(status))) {
        return std::nullopt;
    }
    return DecodeWaitStatus(status);
}
