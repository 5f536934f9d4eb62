#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

enum class ReadStatus { Line, Timeout, Eof };
enum class WriteStatus { Written, Timeout, Closed };

// Child process with piped stdio, leader of its own process group.
// Exit codes follow the shell convention: 128 + signal for signalled children.
class Process {
public:
    Process(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return pid_; }

    // Stdin is non-blocking; output arriving meanwhile is buffered for read_line.
    WriteStatus write_stdin(const std::string& data, std::chrono::milliseconds timeout);
    void close_stdin();

    // Next stdout line without the newline. A trailing unterminated line is
    // returned once stdout reaches EOF.
    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    // Reads stdout and stderr until both are closed; false if the timeout hit first.
    bool drain(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::string take_stdout();
    const std::string& stderr_text() const { return stderr_buf_; }

    std::optional<int> try_wait();
    std::optional<int> wait_for(std::chrono::milliseconds timeout);
    void send_signal(int sig);

private:
    bool pump(int timeout_ms);
    void read_into(int& fd, std::string& buf);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::string stdout_buf_;
    std::string stderr_buf_;

    std::mutex wait_mutex_;
    std::optional<int> exit_code_;
};

struct ContainerRef {
    std::string runtime; // docker | podman
    std::string id;
};

// Process/container runtime collaborator used by the workers.
class ProcessRuntime {
public:
    virtual ~ProcessRuntime() = default;

    // Throws SpawnError when the executable cannot be launched.
    virtual std::shared_ptr<Process> spawn_process(const std::vector<std::string>& argv) = 0;
    virtual std::shared_ptr<Process> exec_in_container(const ContainerRef& container,
                                                       const std::string& command) = 0;
    // SIGTERM, then SIGKILL once grace expires; grace of zero kills immediately.
    virtual void terminate(Process& process, std::chrono::milliseconds grace) = 0;
};

class PosixProcessRuntime : public ProcessRuntime {
public:
    PosixProcessRuntime();

    std::shared_ptr<Process> spawn_process(const std::vector<std::string>& argv) override;
    std::shared_ptr<Process> exec_in_container(const ContainerRef& container,
                                               const std::string& command) override;
    void terminate(Process& process, std::chrono::milliseconds grace) override;
};

struct CommandOutput {
    int exit_code{-1};
    bool timed_out{false};
    std::string out;
    std::string err;
};

// Spawns argv and collects its output; the process is killed if it outlives timeout.
CommandOutput run_command(ProcessRuntime& runtime, const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout);
