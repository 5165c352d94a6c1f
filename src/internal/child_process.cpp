// POSIX implementation of subprocess management

#ifndef _WIN32

#include "child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace mcplink::process
{

namespace
{

std::string errno_message(int err = errno)
{
    return std::strerror(err);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2])
{
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// A write to a pipe whose reader has exited must surface as EPIPE, not kill us.
void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe()
{
    if (::pipe(wake_) != 0)
        throw ProcessError("Failed to create wake pipe: " + errno_message());
    ::fcntl(wake_[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(wake_[1], F_SETFD, FD_CLOEXEC);
}

ReadPipe::~ReadPipe()
{
    close();
    close_pair(wake_);
}

void ReadPipe::adopt(int fd)
{
    fd_ = fd;
    buffer_.clear();
    interrupted_.store(false);
}

std::optional<std::string> ReadPipe::read_line(size_t max_size)
{
    char chunk[4096];
    while (true)
    {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos)
        {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
        if (buffer_.size() > max_size)
            throw ProcessError("Line exceeds maximum frame size");
        if (interrupted_.load() || fd_ < 0)
            return std::nullopt;

        pollfd fds[2];
        fds[0] = {fd_, POLLIN, 0};
        fds[1] = {wake_[0], POLLIN, 0};
        int ready = ::poll(fds, 2, -1);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + errno_message());
        }
        if (fds[1].revents != 0 || interrupted_.load())
            return std::nullopt;

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw ProcessError("Read failed: " + errno_message());
        }
        if (n == 0)
        {
            if (buffer_.empty())
                return std::nullopt;
            std::string tail = std::move(buffer_);
            buffer_.clear();
            return tail;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void ReadPipe::interrupt()
{
    if (interrupted_.exchange(true))
        return;
    if (wake_[1] >= 0)
    {
        char b = 1;
        (void)::write(wake_[1], &b, 1);
    }
}

void ReadPipe::close()
{
    close_fd(fd_);
}

bool ReadPipe::is_open() const
{
    return fd_ >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe()
{
    if (::pipe(wake_) != 0)
        throw ProcessError("Failed to create wake pipe: " + errno_message());
    ::fcntl(wake_[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(wake_[1], F_SETFD, FD_CLOEXEC);
}

WritePipe::~WritePipe()
{
    close();
    close_pair(wake_);
}

void WritePipe::adopt(int fd)
{
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw ProcessError("Failed to make stdin pipe non-blocking: " + errno_message());
    fd_ = fd;
    interrupted_.store(false);
}

void WritePipe::write_all(const std::string& data)
{
    if (fd_ < 0)
        throw ProcessError("Pipe is not open");

    size_t written = 0;
    while (written < data.size())
    {
        if (interrupted_.load())
            throw ProcessError("Write interrupted");

        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n >= 0)
        {
            written += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            throw ProcessError("Broken pipe (process closed stdin)");
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            throw ProcessError("Write failed: " + errno_message());

        // Pipe full: wait for room or for interrupt()
        pollfd fds[2];
        fds[0] = {fd_, POLLOUT, 0};
        fds[1] = {wake_[0], POLLIN, 0};
        int ready = ::poll(fds, 2, -1);
        if (ready < 0 && errno != EINTR)
            throw ProcessError("poll failed: " + errno_message());
        if (fds[1].revents != 0)
            throw ProcessError("Write interrupted");
    }
}

void WritePipe::interrupt()
{
    if (interrupted_.exchange(true))
        return;
    if (wake_[1] >= 0)
    {
        char b = 1;
        (void)::write(wake_[1], &b, 1);
    }
}

void WritePipe::close()
{
    close_fd(fd_);
}

bool WritePipe::is_open() const
{
    return fd_ >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process() : stdin_(std::make_unique<WritePipe>()), stdout_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    stdin_->close();
    if (running_)
    {
        kill();
        wait();
    }
    stdout_->close();
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (running_)
        throw ProcessError("Process already running");

    ignore_sigpipe_once();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(in_pipe) != 0)
        throw ProcessError("Failed to create stdin pipe: " + errno_message());
    if (::pipe(out_pipe) != 0)
    {
        int err = errno;
        close_pair(in_pipe);
        throw ProcessError("Failed to create stdout pipe: " + errno_message(err));
    }
    if (::pipe(err_pipe) != 0)
    {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        throw ProcessError("Failed to create error pipe: " + errno_message(err));
    }
    // Parent ends must not leak into this or any later child
    ::fcntl(in_pipe[1], F_SETFD, FD_CLOEXEC);
    ::fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        throw ProcessError("Failed to fork process: " + errno_message(err));
    }

    if (pid == 0)
    {
        ::close(err_pipe[0]);
        if (::dup2(in_pipe[0], STDIN_FILENO) < 0 || ::dup2(out_pipe[1], STDOUT_FILENO) < 0)
            child_fail(err_pipe[1]);
        ::close(in_pipe[0]);
        ::close(out_pipe[1]);

        if (options.stderr_path)
        {
            int log_fd = ::open(options.stderr_path->c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (log_fd < 0 || ::dup2(log_fd, STDERR_FILENO) < 0)
                child_fail(err_pipe[1]);
            ::close(log_fd);
        }

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(err_pipe[1]);

        if (!options.inherit_environment)
            ::clearenv();
        for (const auto& [key, value] : options.environment)
            ::setenv(key.c_str(), value.c_str(), 1);

        ::execvp(executable.c_str(), argv.data());
        child_fail(err_pipe[1]);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    // exec succeeded iff the close-on-exec error pipe hits EOF with no payload
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0)
    {
        ::waitpid(pid, nullptr, 0);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_message(child_errno));
    }

    try
    {
        stdin_->adopt(in_pipe[1]);
    }
    catch (const ProcessError&)
    {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        throw;
    }
    stdout_->adopt(out_pipe[0]);
    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

bool Process::is_running()
{
    return running_ && !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!running_)
        return pid_ == 0 ? std::nullopt : std::optional<int>(exit_code_);

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_)
    {
        exit_code_ = decode_status(status);
        running_ = false;
        return exit_code_;
    }
    if (result == 0)
        return std::nullopt;
    throw ProcessError("waitpid failed: " + errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto now = std::chrono::steady_clock::now();
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - now);
    if (timeout >= headroom)
        return wait();
    auto deadline = now + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result != pid_)
        throw ProcessError("waitpid failed: " + errno_message());
    exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

void Process::terminate()
{
    if (running_ && pid_ > 0)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    if (running_ && pid_ > 0)
        ::kill(pid_, SIGKILL);
}

} // namespace mcplink::process

#endif // !_WIN32
