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

#ifndef FORKLIFT_FORK_POOL_HPP
#define FORKLIFT_FORK_POOL_HPP

#include "error.hpp"
#include "process_fork.hpp"
#include "result_file.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_map>

// What a child function hands back to its parent. Empty data arrives as no data.
struct ChildOutput {
    int exit_code = 0;
    std::optional<std::string> data;
};

// Reported to the finish callback, in the parent, for every reaped child
struct FinishedChild {
    pid_t pid {};
    int exit_code = 0;
    std::string identifier;
    int signal = 0;
    bool core_dump = false;
    std::optional<std::string> data;
};

using ChildFunction = std::function<ChildOutput()>;
using FinishCallback = std::function<void(FinishedChild const&)>;

// Bounded set of forked children. A pool with max_procs == 0 does not fork
// and runs every child function in the calling process.
class ForkPool {
public:
    ForkPool(uint64_t max_procs, double waitpid_blocking_sleep)
        : m_max_procs(max_procs)
        , m_waitpid_blocking_sleep(waitpid_blocking_sleep)
    {
    }
    ForkPool(ForkPool const&) = delete;
    ForkPool(ForkPool&&) = delete;
    ForkPool& operator=(ForkPool&&) = delete;

    auto SetOnFinish(FinishCallback on_finish) -> void { m_on_finish = std::move(on_finish); }

    // Blocks until a slot is free, then forks and runs child_function in the
    // child. Fails when called from a child of this pool.
    [[nodiscard]] auto Start(std::string identifier, ChildFunction const& child_function)
        -> std::expected<void, ForkliftError>;

    // Non-blocking, returns the number of children reaped
    [[nodiscard]] auto ReapFinishedChildren() -> std::expected<uint64_t, ForkliftError>;

    [[nodiscard]] auto WaitOneChild() -> std::expected<void, ForkliftError>;
    [[nodiscard]] auto WaitForAvailableProcs(uint64_t count) -> std::expected<void, ForkliftError>;
    [[nodiscard]] auto WaitAllChildren() -> std::expected<void, ForkliftError>;

    [[nodiscard]] auto RunningProcs() const -> uint64_t { return m_running.size(); }
    [[nodiscard]] auto MaxProcs() const -> uint64_t { return m_max_procs; }
    [[nodiscard]] auto IsChild() const -> bool { return m_is_child; }
    [[nodiscard]] auto GetWaitpidBlockingSleep() const -> double
    {
        return m_waitpid_blocking_sleep;
    }

private:
    struct RunningChild {
        ChildProcessHandle handle;
        std::string identifier;
        ResultFile result_file;
    };

    auto runInline(std::string identifier, ChildFunction const& child_function) -> void;
    auto finish(pid_t pid, RunningChild child, ExitStatus exit_status) -> void;
    auto abandon(pid_t pid, ForkliftError const& error) -> void;
    auto waitBlocking() -> std::expected<void, ForkliftError>;

    uint64_t m_max_procs = 0;
    double m_waitpid_blocking_sleep = 0;
    bool m_is_child = false;
    std::unordered_map<pid_t, RunningChild> m_running;
    FinishCallback m_on_finish;
};

#endif
