// POSIX implementation of subprocess process management

#include "process.hpp"

#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolmedia::process
{

struct PipeHandle
{
    int fd = -1;
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string errno_message()
{
    return std::strerror(errno);
}

// Both ends of a pipe(2); closes whatever is still open on destruction
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        close_end(0);
        close_end(1);
    }

    void open(const char* what)
    {
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " +
                               errno_message());
    }

    void close_end(int i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }

    int release(int i)
    {
        int fd = fds[i];
        fds[i] = -1;
        return fd;
    }
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// ReadPipe

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ssize_t n;
    do
    {
        n = ::read(handle_->fd, buffer, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + errno_message());
    }
    return static_cast<size_t>(n);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int ready = ::select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (ready < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + errno_message());
    }
    return ready > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// Process

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    stdout_.close();
    stderr_.close();
    if (handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to collect
        }
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args)
{
    if (handle_->pid != 0)
        throw ProcessError("Process already spawned");

    FdPair out;
    out.open("stdout");
    FdPair err;
    err.open("stderr");
    // Closed by a successful exec; carries errno back otherwise
    FdPair status;
    status.open("status");
    ::fcntl(status.fds[1], F_SETFD, FD_CLOEXEC);

    // Built before fork: the child must not allocate
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message());

    if (pid == 0)
    {
        int report = status.fds[1];
        auto fail = [report]()
        {
            int e = errno;
            (void)::write(report, &e, sizeof(e));
            _exit(127);
        };

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0)
            fail();
        if (::dup2(out.fds[1], STDOUT_FILENO) < 0 || ::dup2(err.fds[1], STDERR_FILENO) < 0)
            fail();
        ::close(devnull);
        ::close(out.fds[0]);
        ::close(out.fds[1]);
        ::close(err.fds[0]);
        ::close(err.fds[1]);
        ::close(status.fds[0]);

        ::execvp(executable.c_str(), argv.data());
        fail();
    }

    status.close_end(1);
    out.close_end(1);
    err.close_end(1);

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    stdout_.handle_->fd = out.release(0);
    stderr_.handle_->fd = err.release(0);
    handle_->pid = pid;
    handle_->running = true;
}

ReadPipe& Process::stdout_pipe()
{
    return stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    return stderr_;
}

std::optional<int> Process::try_wait()
{
    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t reaped = ::waitpid(handle_->pid, &status, WNOHANG);
    if (reaped == 0)
        return std::nullopt;
    if (reaped != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

int Process::wait()
{
    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t reaped;
    do
    {
        reaped = ::waitpid(handle_->pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    if (reaped != handle_->pid)
    {
        handle_->running = false;
        throw ProcessError("waitpid failed: " + errno_message());
    }

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

void Process::kill()
{
    if (handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

} // namespace toolmedia::process
