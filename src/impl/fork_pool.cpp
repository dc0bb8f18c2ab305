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
#include "fork_pool.hpp"

#include "error.hpp"
#include "process_fork.hpp"
#include "result_file.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fmt/core.h>
#include <exception>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

auto ForkPool::Start(std::string identifier, ChildFunction const& child_function)
    -> std::expected<void, ForkliftError>
{
    if (m_is_child) {
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::ForkError,
            .error_message = fmt::format(
                "Cannot start \"{}\" while running inside a child process", identifier) });
    }
    if (m_max_procs == 0) {
        runInline(std::move(identifier), child_function);
        return {};
    }

    auto wait_result = WaitForAvailableProcs(1);
    if (not wait_result.has_value()) {
        return std::unexpected(wait_result.error());
    }

    auto result_file = ResultFile::Create("forklift-" + identifier);
    if (not result_file.has_value()) {
        return std::unexpected(result_file.error());
    }

    auto handle = ChildProcessHandle::RunChildFunction([&]() -> int {
        // Siblings belong to the parent
        m_is_child = true;
        m_running.clear();
        auto output = child_function();
        if (output.data.has_value()) {
            auto write_result = result_file->Write(*output.data);
            if (not write_result.has_value()) {
                fmt::print(stderr, "Child \"{}\" could not store its data: {}\n", identifier,
                    write_result.error().error_message);
                return CHILD_EXCEPTION_EXIT_CODE;
            }
        }
        return output.exit_code;
    });
    if (not handle.has_value()) {
        return std::unexpected(handle.error());
    }

    auto pid = handle->GetPid();
    m_running.emplace(pid,
        RunningChild { .handle = *handle,
            .identifier = std::move(identifier),
            .result_file = std::move(*result_file) });
    return {};
}

auto ForkPool::runInline(std::string identifier, ChildFunction const& child_function) -> void
{
    ChildOutput output { .exit_code = CHILD_EXCEPTION_EXIT_CODE };
    {
        m_is_child = true;
        Defer defer([this]() { m_is_child = false; });
        try {
            output = child_function();
        } catch (std::exception const& exception) {
            fmt::print(stderr, "Inline child \"{}\" terminated by exception: {}\n", identifier,
                exception.what());
        }
    }
    // A forked child that writes nothing leaves an empty file, which reads as no data
    if (output.data.has_value() && output.data->empty()) {
        output.data.reset();
    }
    if (m_on_finish) {
        m_on_finish(FinishedChild { .pid = getpid(),
            .exit_code = output.exit_code,
            .identifier = std::move(identifier),
            .data = std::move(output.data) });
    }
}

auto ForkPool::ReapFinishedChildren() -> std::expected<uint64_t, ForkliftError>
{
    // Finish callbacks may start new children, so work from a snapshot
    std::vector<pid_t> pids;
    pids.reserve(m_running.size());
    for (auto const& [pid, child] : m_running) {
        pids.push_back(pid);
    }

    uint64_t reaped = 0;
    for (auto pid : pids) {
        auto iterator = m_running.find(pid);
        if (iterator == m_running.end()) {
            continue;
        }
        auto poll_result = iterator->second.handle.PollChildProcess();
        if (not poll_result.has_value()) {
            abandon(pid, poll_result.error());
            ++reaped;
            continue;
        }
        if (not poll_result->has_value()) {
            continue;
        }
        auto node = m_running.extract(iterator);
        finish(pid, std::move(node.mapped()), **poll_result);
        ++reaped;
    }
    return reaped;
}

auto ForkPool::WaitOneChild() -> std::expected<void, ForkliftError>
{
    if (m_running.empty()) {
        return {};
    }
    if (m_waitpid_blocking_sleep <= 0) {
        return waitBlocking();
    }
    while (true) {
        auto reaped = ReapFinishedChildren();
        if (not reaped.has_value()) {
            return std::unexpected(reaped.error());
        }
        if (*reaped > 0 || m_running.empty()) {
            return {};
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(m_waitpid_blocking_sleep));
    }
}

auto ForkPool::waitBlocking() -> std::expected<void, ForkliftError>
{
    while (not m_running.empty()) {
        int status {};
        auto pid = waitpid(-1, &status, 0);
        if (pid == -1) {
            if (errno == EINTR) {
                errno = 0;
                continue;
            }
            auto const wait_errno = errno;
            errno = 0;
            auto error = ForkliftError { .error_type = ForkliftErrorType::WaitError,
                .error_message
                = fmt::format("waitpid(-1) failed with error:{}", strerror(wait_errno)) };
            if (wait_errno != ECHILD) {
                return std::unexpected(error);
            }
            // Somebody else reaped our children
            std::vector<pid_t> pids;
            for (auto const& [running_pid, child] : m_running) {
                pids.push_back(running_pid);
            }
            for (auto running_pid : pids) {
                abandon(running_pid, error);
            }
            return {};
        }
        if (!WIFEXITED(status) && !WIFSIGNALED(status)) {
            continue;
        }
        auto iterator = m_running.find(pid);
        if (iterator == m_running.end()) {
            fmt::print(stderr, "ForkPool reaped unknown child process {}\n", pid);
            continue;
        }
        auto node = m_running.extract(iterator);
        finish(pid, std::move(node.mapped()), DecodeWaitStatus(status));
        return {};
    }
    return {};
}

auto ForkPool::WaitForAvailableProcs(uint64_t count) -> std::expected<void, ForkliftError>
{
    count = std::min(count, m_max_procs);
    while (m_max_procs - std::min(m_max_procs, RunningProcs()) < count) {
        auto result = WaitOneChild();
        if (not result.has_value()) {
            return std::unexpected(result.error());
        }
    }
    return {};
}

auto ForkPool::WaitAllChildren() -> std::expected<void, ForkliftError>
{
    while (not m_running.empty()) {
        auto result = WaitOneChild();
        if (not result.has_value()) {
            return std::unexpected(result.error());
        }
    }
    return {};
}

auto ForkPool::finish(pid_t pid, RunningChild child, ExitStatus exit_status) -> void
{
    std::optional<std::string> data;
    auto read_result = child.result_file.Read();
    if (read_result.has_value()) {
        data = std::move(*read_result);
    } else {
        fmt::print(stderr, "Could not read data of child \"{}\" ({}): {}\n", child.identifier, pid,
            read_result.error().error_message);
    }
    if (m_on_finish) {
        m_on_finish(FinishedChild { .pid = pid,
            .exit_code = exit_status.exit_code,
            .identifier = std::move(child.identifier),
            .signal = exit_status.signal,
            .core_dump = exit_status.core_dump,
            .data = std::move(data) });
    }
}

auto ForkPool::abandon(pid_t pid, ForkliftError const& error) -> void
{
    auto node = m_running.extract(pid);
    if (node.empty()) {
        return;
    }
    fmt::print(stderr, "Lost track of child \"{}\" ({}): {}\n", node.mapped().identifier, pid,
        error.error_message);
    // The exit status is gone but the result file still holds whatever the child wrote
    finish(pid, std::move(node.mapped()), ExitStatus { .exit_code = -1 });
}
