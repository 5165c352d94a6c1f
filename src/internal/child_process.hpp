// Subprocess management for StdioTransport (POSIX)

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcplink::process
{

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Read end of a pipe connected to the child's stdout.
/// read_line() blocks in poll() on the pipe and on an internal wake pipe, so
/// interrupt() can release a reader blocked on another thread.
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// Next newline-delimited line without its delimiter; nullopt on EOF or interrupt.
    /// A trailing partial line at EOF is returned as a line.
    std::optional<std::string> read_line(size_t max_size = 64 * 1024 * 1024);

    /// Wake any blocked read_line(); subsequent reads return nullopt
    void interrupt();

    void close();
    bool is_open() const;

  private:
    friend class Process;
    void adopt(int fd);

    int fd_ = -1;
    int wake_[2] = {-1, -1};
    std::atomic<bool> interrupted_{false};
    std::string buffer_;
};

/// Write end of a pipe connected to the child's stdin.
/// The fd is non-blocking; write_all() waits in poll() on it and on a wake
/// pipe, so interrupt() can release a writer stuck on a full pipe.
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write all bytes; throws ProcessError on EPIPE, interrupt or any other failure
    void write_all(const std::string& data);

    /// Wake any blocked write_all(); subsequent writes throw
    void interrupt();

    void close();
    bool is_open() const;

  private:
    friend class Process;
    void adopt(int fd);

    int fd_ = -1;
    int wake_[2] = {-1, -1};
    std::atomic<bool> interrupted_{false};
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    /// Variables set on top of (or instead of) the parent's environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    /// When set, child stderr is appended to this file; otherwise it is inherited
    std::optional<std::string> stderr_path;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Fork/exec the executable (PATH lookup). Exec failures are reported here,
    /// not later as an unexpected exit.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe()
    {
        return *stdin_;
    }
    ReadPipe& stdout_pipe()
    {
        return *stdout_;
    }

    bool is_running();

    /// Non-blocking wait; exit code (128+signal for signalled children) or nullopt
    std::optional<int> try_wait();

    /// Wait up to `timeout` for the child to exit
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Blocking wait for process termination
    int wait();

    /// SIGTERM
    void terminate();

    /// SIGKILL
    void kill();

    int pid() const
    {
        return pid_;
    }

  private:
    int pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

} // namespace mcplink::process
