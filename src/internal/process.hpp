// POSIX subprocess management used by the external image tool backend

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolmedia::process
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Thrown by run() when the child outlives its deadline
class ProcessTimeoutError : public ProcessError
{
  public:
    explicit ProcessTimeoutError(const std::string& message) : ProcessError(message) {}
};

/// Read end of a child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// True when data or EOF is ready within timeout_ms
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Child process with stdout and stderr captured and stdin from /dev/null.
/// A child still running at destruction is killed and reaped.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Looks the executable up in PATH. Throws ProcessError when the exec fails.
    void spawn(const std::string& executable, const std::vector<std::string>& args);

    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    /// Exit code once the child is reaped; 128 + signal for signalled children
    std::optional<int> try_wait();
    int wait();

    void kill();

  private:
    std::unique_ptr<ProcessHandle> handle_;
    ReadPipe stdout_;
    ReadPipe stderr_;
};

struct RunOptions
{
    std::chrono::milliseconds timeout{10000};
    /// Cap applied to stdout and stderr separately
    std::size_t max_output = 1024 * 1024;
};

struct RunResult
{
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
};

/// Runs a command to completion. Throws ProcessTimeoutError when the deadline
/// passes and ProcessError when output exceeds the cap or the exit code is
/// non-zero; the child is killed and reaped in both cases.
RunResult run(const std::string& executable, const std::vector<std::string>& args,
              const RunOptions& options = {});

} // namespace toolmedia::process
