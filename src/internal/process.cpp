// Bounded command execution on top of Process

#include "process.hpp"

#include <algorithm>
#include <thread>

namespace toolmedia::process
{

namespace
{

using Clock = std::chrono::steady_clock;

// Reads whatever is available; returns false once the pipe reached EOF
bool drain(ReadPipe& pipe, std::string& sink, int wait_ms)
{
    if (!pipe.is_open())
        return false;
    if (!pipe.has_data(wait_ms))
        return true;

    char buf[8192];
    size_t n = pipe.read(buf, sizeof(buf));
    if (n == 0)
    {
        pipe.close();
        return false;
    }
    sink.append(buf, n);
    return true;
}

void kill_and_reap(Process& proc)
{
    proc.kill();
    proc.wait();
}

} // namespace

RunResult run(const std::string& executable, const std::vector<std::string>& args,
              const RunOptions& options)
{
    Process proc;
    proc.spawn(executable, args);

    RunResult result;
    auto deadline = Clock::now() + options.timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open)
    {
        auto now = Clock::now();
        if (now >= deadline)
        {
            kill_and_reap(proc);
            throw ProcessTimeoutError(executable + " timed out after " +
                                      std::to_string(options.timeout.count()) + "ms");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::min<long long>(left.count(), 50));

        if (out_open)
            out_open = drain(proc.stdout_pipe(), result.stdout_data, slice);
        if (err_open)
            err_open = drain(proc.stderr_pipe(), result.stderr_data, out_open ? 0 : slice);

        if (result.stdout_data.size() > options.max_output ||
            result.stderr_data.size() > options.max_output)
        {
            kill_and_reap(proc);
            throw ProcessError(executable + " output exceeded " +
                               std::to_string(options.max_output) + " bytes");
        }
    }

    // Both pipes closed; the child is exiting or has handed them to a grandchild
    while (true)
    {
        if (auto code = proc.try_wait())
        {
            result.exit_code = *code;
            break;
        }
        if (Clock::now() >= deadline)
        {
            kill_and_reap(proc);
            throw ProcessTimeoutError(executable + " timed out after " +
                                      std::to_string(options.timeout.count()) + "ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (result.exit_code != 0)
    {
        std::string msg = executable + " exited with code " + std::to_string(result.exit_code);
        if (!result.stderr_data.empty())
            msg += ": " + result.stderr_data.substr(0, 512);
        throw ProcessError(msg);
    }
    return result;
}

} // namespace toolmedia::process
