#include "../include/process.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono;

namespace {
struct Pipe {
    int r{-1};
    int w{-1};
    ~Pipe() { close_r(); close_w(); }
    void close_r() { if (r >= 0) { ::close(r); r = -1; } }
    void close_w() { if (w >= 0) { ::close(w); w = -1; } }
    int release_r() { int fd = r; r = -1; return fd; }
    int release_w() { int fd = w; w = -1; return fd; }
};

static void open_pipe(Pipe& p) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw SpawnError(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    p.r = fds[0];
    p.w = fds[1];
}

static int decode_wait_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return -1;
}

static std::once_flag g_sigpipe_once;
}

Process::Process(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

Process::~Process() {
    if (!try_wait()) {
        send_signal(SIGKILL);
        int st = 0;
        while (waitpid(pid_, &st, 0) < 0 && errno == EINTR) {}
    }
    close_stdin();
    if (stdout_fd_ >= 0) ::close(stdout_fd_);
    if (stderr_fd_ >= 0) ::close(stderr_fd_);
}

WriteStatus Process::write_stdin(const std::string& data, milliseconds timeout) {
    if (stdin_fd_ < 0) return WriteStatus::Closed;
    auto deadline = steady_clock::now() + timeout;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
        if (n >= 0) {
            off += (size_t)n;
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return WriteStatus::Closed; // EPIPE once the child is gone

        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remaining <= 0) return WriteStatus::Timeout;
        pollfd fds[3];
        nfds_t count = 0;
        fds[count++] = {stdin_fd_, POLLOUT, 0};
        if (stdout_fd_ >= 0) fds[count++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = {stderr_fd_, POLLIN, 0};
        int rc = ::poll(fds, count, (int)remaining);
        if (rc < 0 && errno != EINTR) return WriteStatus::Closed;
        if (rc <= 0) continue;
        if (fds[0].revents & (POLLERR | POLLHUP)) return WriteStatus::Closed;
        for (nfds_t i = 1; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == stdout_fd_) read_into(stdout_fd_, stdout_buf_);
            else read_into(stderr_fd_, stderr_buf_);
        }
    }
    return WriteStatus::Written;
}

void Process::close_stdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void Process::read_into(int& fd, std::string& buf) {
    char chunk[65536];
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        buf.append(chunk, (size_t)n);
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        ::close(fd);
        fd = -1;
    }
}

bool Process::pump(int timeout_ms) {
    pollfd fds[2];
    int* owners[2];
    std::string* bufs[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) {
        fds[count] = {stdout_fd_, POLLIN, 0};
        owners[count] = &stdout_fd_;
        bufs[count] = &stdout_buf_;
        ++count;
    }
    if (stderr_fd_ >= 0) {
        fds[count] = {stderr_fd_, POLLIN, 0};
        owners[count] = &stderr_fd_;
        bufs[count] = &stderr_buf_;
        ++count;
    }
    if (count == 0) return false;

    int rc = ::poll(fds, count, timeout_ms);
    if (rc < 0) return errno == EINTR;
    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) read_into(*owners[i], *bufs[i]);
    }
    return stdout_fd_ >= 0 || stderr_fd_ >= 0;
}

ReadStatus Process::read_line(std::string& line, milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    for (;;) {
        auto pos = stdout_buf_.find('\n');
        if (pos != std::string::npos) {
            line = stdout_buf_.substr(0, pos);
            stdout_buf_.erase(0, pos + 1);
            return ReadStatus::Line;
        }
        if (stdout_fd_ < 0) {
            if (stdout_buf_.empty()) return ReadStatus::Eof;
            line = std::move(stdout_buf_);
            stdout_buf_.clear();
            return ReadStatus::Line;
        }
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remaining <= 0) return ReadStatus::Timeout;
        pump((int)remaining);
    }
}

bool Process::drain(std::optional<milliseconds> timeout) {
    auto deadline = steady_clock::now() + timeout.value_or(milliseconds(0));
    for (;;) {
        int wait_ms = -1;
        if (timeout) {
            auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
            if (remaining <= 0) return stdout_fd_ < 0 && stderr_fd_ < 0;
            wait_ms = (int)remaining;
        }
        if (!pump(wait_ms)) return true;
    }
}

std::string Process::take_stdout() {
    std::string out = std::move(stdout_buf_);
    stdout_buf_.clear();
    return out;
}

std::optional<int> Process::try_wait() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (exit_code_) return exit_code_;
    int st = 0;
    pid_t r = waitpid(pid_, &st, WNOHANG);
    if (r == pid_) {
        exit_code_ = decode_wait_status(st);
    } else if (r < 0 && errno == ECHILD) {
        exit_code_ = -1; // reaped elsewhere
    }
    return exit_code_;
}

std::optional<int> Process::wait_for(milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    for (;;) {
        if (auto code = try_wait()) return code;
        if (steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(milliseconds(10));
    }
}

void Process::send_signal(int sig) {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (exit_code_) return;
    if (::kill(-pid_, sig) != 0) ::kill(pid_, sig);
}

PosixProcessRuntime::PosixProcessRuntime() {
    // Writes to a dead agent's stdin must surface as EPIPE, not kill the service.
    std::call_once(g_sigpipe_once, []{ std::signal(SIGPIPE, SIG_IGN); });
}

std::shared_ptr<Process> PosixProcessRuntime::spawn_process(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) throw SpawnError("empty command");

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Pipe in, out, err, status;
    open_pipe(in);
    open_pipe(out);
    open_pipe(err);
    open_pipe(status);

    pid_t pid = fork();
    if (pid < 0) throw SpawnError(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        setpgid(0, 0);
        dup2(in.r, STDIN_FILENO);
        dup2(out.w, STDOUT_FILENO);
        dup2(err.w, STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(status.w, &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    in.close_r();
    out.close_w();
    err.close_w();
    status.close_w();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.r, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == (ssize_t)sizeof(child_errno)) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        throw SpawnError("cannot launch '" + argv[0] + "': " + std::strerror(child_errno));
    }

    int in_fd = in.release_w();
    int out_fd = out.release_r();
    int err_fd = err.release_r();
    for (int fd : {in_fd, out_fd, err_fd}) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    log_debug("runtime", "spawned pid " + std::to_string(pid) + ": " + argv[0]);
    return std::make_shared<Process>(pid, in_fd, out_fd, err_fd);
}

std::shared_ptr<Process> PosixProcessRuntime::exec_in_container(const ContainerRef& container,
                                                                const std::string& command) {
    return spawn_process({container.runtime, "exec", container.id, "sh", "-c", command});
}

void PosixProcessRuntime::terminate(Process& process, milliseconds grace) {
    if (process.try_wait()) return;
    if (grace.count() > 0) {
        process.send_signal(SIGTERM);
        if (process.wait_for(grace)) return;
        log_warn("runtime", "pid " + std::to_string(process.pid()) + " ignored SIGTERM; killing");
    }
    process.send_signal(SIGKILL);
    if (!process.wait_for(seconds(5))) {
        log_error("runtime", "pid " + std::to_string(process.pid()) + " did not exit after SIGKILL");
    }
}

CommandOutput run_command(ProcessRuntime& runtime, const std::vector<std::string>& argv,
                          milliseconds timeout) {
    auto proc = runtime.spawn_process(argv);
    proc->close_stdin();
    CommandOutput res;
    if (!proc->drain(timeout)) {
        res.timed_out = true;
        runtime.terminate(*proc, milliseconds(0));
        proc->drain(seconds(1));
    }
    auto code = proc->wait_for(res.timed_out ? seconds(1) : timeout);
    if (!code) {
        res.timed_out = true;
        runtime.terminate(*proc, milliseconds(0));
        code = proc->try_wait();
    }
    res.exit_code = code.value_or(-1);
    res.out = proc->take_stdout();
    res.err = proc->stderr_text();
    return res;
}
