#include <trellis/subprocess.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <sys/wait.h>
#include <unistd.h>

namespace trellis {

namespace {

struct Pipe {
    int fd[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }
    // Close-on-exec so children forked by other threads never inherit them
    bool open() { return pipe2(fd, O_CLOEXEC) == 0; }
    void close_read() { if (fd[0] >= 0) { close(fd[0]); fd[0] = -1; } }
    void close_write() { if (fd[1] >= 0) { close(fd[1]); fd[1] = -1; } }
};

// Blocks SIGPIPE on the calling thread so a child that exits before reading
// all of stdin surfaces as EPIPE. Any SIGPIPE raised meanwhile is consumed
// before the previous mask is restored.
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_);
    }

    ~SigpipeBlock() {
        if (!was_pending_) {
            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1) {
                struct timespec zero = {0, 0};
                sigtimedwait(&pipe_set_, nullptr, &zero);
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool was_pending_ = false;
};

void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& stdin_data,
                                  int timeout_seconds) {
    if (args.empty()) {
        return TrellisError{TrellisError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    Pipe in, out, err;
    if (!in.open() || !out.open() || !err.open()) {
        return TrellisError{TrellisError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        return TrellisError{TrellisError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        dup2(in.fd[0], STDIN_FILENO);
        dup2(out.fd[1], STDOUT_FILENO);
        dup2(err.fd[1], STDERR_FILENO);
        in.close_read(); in.close_write();
        out.close_read(); out.close_write();
        err.close_read(); err.close_write();

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    in.close_read();
    out.close_write();
    err.close_write();

    SigpipeBlock no_sigpipe;

    fcntl(in.fd[1], F_SETFL, O_NONBLOCK);
    fcntl(out.fd[0], F_SETFL, O_NONBLOCK);
    fcntl(err.fd[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    size_t written = 0;
    if (stdin_data.empty()) in.close_write();
    auto start = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return TrellisError{TrellisError::Transport,
                "command timed out after " + std::to_string(timeout_seconds) + "s",
                "raise inference.timeout-seconds or check the model service"};
        }

        // Feed stdin as the child consumes it
        if (in.fd[1] >= 0) {
            ssize_t n = write(in.fd[1], stdin_data.data() + written,
                              stdin_data.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                in.close_write();  // child closed its stdin
            }
            if (written == stdin_data.size()) in.close_write();
        }

        drain(out.fd[0], out_buf);
        drain(err.fd[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(out.fd[0], out_buf);
            drain(err.fd[0], err_buf);
            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            return TrellisError{TrellisError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

} // namespace trellis
