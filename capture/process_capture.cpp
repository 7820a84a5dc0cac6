// ============================================================================
// process_capture.cpp - fork/exec, poll(2) multiplexing and reaping
// ============================================================================

#include "capture/process_capture.h"
#include "common/digest.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace Trace::Capture {

namespace {

constexpr size_t CHUNK_SIZE = 4096;
constexpr int TERMINATE_POLL_MS = 20;

// Where spawning stopped, reported through the status pipe
constexpr int STAGE_PIPE = 1;
constexpr int STAGE_FORK = 2;
constexpr int STAGE_CHDIR = 3;
constexpr int STAGE_EXEC = 4;

constexpr int INTERRUPT_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP};
constexpr size_t INTERRUPT_SIGNAL_COUNT = sizeof(INTERRUPT_SIGNALS) / sizeof(INTERRUPT_SIGNALS[0]);

volatile sig_atomic_t g_interrupt_signal = 0;

void onInterruptSignal(int sig) {
    g_interrupt_signal = sig;
}

// Installs the interrupt handlers and ignores SIGPIPE and SIGTTOU for the
// lifetime of one capture, restoring the previous dispositions afterwards.
// SIGTTOU is ignored so the terminal can be taken back from the background.
class InterruptGuard {
public:
    InterruptGuard() noexcept {
        g_interrupt_signal = 0;

        struct sigaction sa{};
        sa.sa_handler = onInterruptSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;  // no SA_RESTART, poll() must wake up
        for (size_t i = 0; i < INTERRUPT_SIGNAL_COUNT; ++i) {
            installed_[i] = sigaction(INTERRUPT_SIGNALS[i], &sa, &saved_[i]) == 0;
        }

        struct sigaction ignore{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        pipe_installed_ = sigaction(SIGPIPE, &ignore, &saved_pipe_) == 0;
        ttou_installed_ = sigaction(SIGTTOU, &ignore, &saved_ttou_) == 0;
    }

    ~InterruptGuard() {
        for (size_t i = 0; i < INTERRUPT_SIGNAL_COUNT; ++i) {
            if (installed_[i]) {
                sigaction(INTERRUPT_SIGNALS[i], &saved_[i], nullptr);
            }
        }
        if (pipe_installed_) {
            sigaction(SIGPIPE, &saved_pipe_, nullptr);
        }
        if (ttou_installed_) {
            sigaction(SIGTTOU, &saved_ttou_, nullptr);
        }
    }

    TRACE_NON_COPYABLE(InterruptGuard);

    static bool triggered() noexcept { return g_interrupt_signal != 0; }
    static int signalNumber() noexcept { return static_cast<int>(g_interrupt_signal); }

private:
    struct sigaction saved_[INTERRUPT_SIGNAL_COUNT]{};
    struct sigaction saved_pipe_{};
    struct sigaction saved_ttou_{};
    bool installed_[INTERRUPT_SIGNAL_COUNT]{};
    bool pipe_installed_{false};
    bool ttou_installed_{false};
};

// Lends the controlling terminal to the command's process group when we
// are its foreground owner, and takes it back on release or destruction
class TerminalGuard {
public:
    explicit TerminalGuard(bool wanted) noexcept
        : owner_(wanted && isatty(STDIN_FILENO) && tcgetpgrp(STDIN_FILENO) == getpgrp()) {
    }

    ~TerminalGuard() { release(); }

    TRACE_NON_COPYABLE(TerminalGuard);

    bool owner() const noexcept { return owner_; }
    bool lent() const noexcept { return lent_; }

    void lendTo(pid_t pgid) noexcept {
        if (!owner_) {
            return;
        }
        if (tcsetpgrp(STDIN_FILENO, pgid) == 0) {
            lent_ = true;
        } else {
            LOG_DEBUG("tcsetpgrp to %d failed: %s", static_cast<int>(pgid), strerror(errno));
        }
    }

    // The child may have taken the terminal itself before a failed exec,
    // so ownership is checked rather than remembered
    void release() noexcept {
        if (owner_ && tcgetpgrp(STDIN_FILENO) != getpgrp()) {
            if (tcsetpgrp(STDIN_FILENO, getpgrp()) != 0) {
                LOG_WARN("Could not take back the terminal: %s", strerror(errno));
            }
        }
        lent_ = false;
    }

private:
    bool owner_{false};
    bool lent_{false};
};

// Signals every process in the command's group, or the leader alone when
// the group was never formed
bool signalGroup(pid_t pgid, int sig) noexcept {
    if (kill(-pgid, sig) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        return false;
    }
    return kill(pgid, sig) == 0 || errno == ESRCH;
}

enum class StreamEnd : uint8_t {
    COMPLETE,
    INTERRUPTED,
    ERROR
};

void closeFd(int* fd) noexcept {
    if (*fd >= 0) {
        close(*fd);
        *fd = -1;
    }
}

int decodeWaitStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return EXIT_RUNTIME_FAILURE;
}

// Child side of a failed spawn: report and leave without running atexit
[[noreturn]] void reportAndExit(int status_fd, int stage, int error) noexcept {
    int payload[2] = {stage, error};
    ssize_t ignored = write(status_fd, payload, sizeof(payload));
    (void)ignored;
    _exit(EXIT_SPAWN_FAILURE);
}

std::string describeSpawnError(const CaptureOptions& options, int stage, int error) {
    const char* reason = strerror(error);
    switch (stage) {
        case STAGE_PIPE: return std::string("pipe: ") + reason;
        case STAGE_FORK: return std::string("fork: ") + reason;
        case STAGE_CHDIR: return "cannot change directory to " + options.cwd + ": " + reason;
        case STAGE_EXEC: return options.shell + ": " + reason;
        default: return reason;
    }
}

std::string currentDirectory() {
    char buffer[4096];
    if (getcwd(buffer, sizeof(buffer)) == nullptr) {
        return std::string();
    }
    return std::string(buffer);
}

std::string digestOf(const std::string& data) {
    char hex[Common::SHA256_HEX_LENGTH + 1];
    if (!Common::sha256Hex(data.data(), data.size(), hex, sizeof(hex))) {
        return std::string();
    }
    return std::string(hex);
}

} // namespace

const char* captureStateToString(CaptureState state) noexcept {
    switch (state) {
        case CaptureState::INIT: return "INIT";
        case CaptureState::SPAWNING: return "SPAWNING";
        case CaptureState::STREAMING: return "STREAMING";
        case CaptureState::DRAINING: return "DRAINING";
        case CaptureState::DONE: return "DONE";
        case CaptureState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

ProcessCapture::ProcessCapture(Storage::EvidenceStore& store, OutputSink& sink) noexcept
    : store_(store), sink_(sink) {
}

void ProcessCapture::transition(CaptureState next) noexcept {
    LOG_DEBUG("Capture state %s -> %s", captureStateToString(state_), captureStateToString(next));
    state_ = next;
}

void ProcessCapture::mirror(StreamId stream, bool quiet, const char* data, size_t len) noexcept {
    if (!sink_.write(selectChannel(stream, quiet), data, len)) {
        if (sink_failures_++ == 0) {
            LOG_WARN("Live output mirror failed, capture continues");
        }
    }
}

void ProcessCapture::appendDiagnostic(const std::string& line, bool quiet, CaptureResult* result) noexcept {
    mirror(StreamId::STDERR, quiet, line.data(), line.size());
    try {
        result->session.stderr_data += line;
    } catch (const std::exception& e) {
        LOG_ERROR("Could not record diagnostic: %s", e.what());
    }
}

// ========== Spawning ==========

bool ProcessCapture::spawn(const CaptureOptions& options, bool take_terminal, Child* child,
                           SpawnError* error) noexcept {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto closeAll = [&]() {
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1]}) {
            closeFd(fd);
        }
    };

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        error->stage = STAGE_PIPE;
        error->error = errno;
        closeAll();
        return false;
    }

    // Everything the child touches is prepared before fork
    const char* shell = options.shell.c_str();
    const char* command = options.command.c_str();
    const char* cwd = options.cwd.empty() ? nullptr : options.cwd.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        error->stage = STAGE_FORK;
        error->error = errno;
        closeAll();
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on. The command
        // leads its own process group so an interrupt reaches all of it.
        setpgid(0, 0);
        if (take_terminal) {
            tcsetpgrp(STDIN_FILENO, getpid());
        }

        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(SIGPIPE, &dfl, nullptr);
        sigaction(SIGTTOU, &dfl, nullptr);
        for (int sig : INTERRUPT_SIGNALS) {
            sigaction(sig, &dfl, nullptr);
        }

        if (dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
            reportAndExit(status_pipe[1], STAGE_EXEC, errno);
        }

        if (cwd && chdir(cwd) != 0) {
            reportAndExit(status_pipe[1], STAGE_CHDIR, errno);
        }

        execl(shell, shell, "-c", command, static_cast<char*>(nullptr));
        reportAndExit(status_pipe[1], STAGE_EXEC, errno);
    }

    // Parent: repeat setpgid so the group exists whichever side runs first.
    // EACCES means the child already exec'd, after its own setpgid.
    if (setpgid(pid, pid) != 0 && errno != EACCES) {
        LOG_WARN("setpgid for pid %d failed: %s", static_cast<int>(pid), strerror(errno));
    }

    closeFd(&out_pipe[1]);
    closeFd(&err_pipe[1]);
    closeFd(&status_pipe[1]);

    int payload[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], payload, sizeof(payload));
    } while (n < 0 && errno == EINTR);
    closeFd(&status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(payload))) {
        // exec never happened, collect the child
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error->stage = payload[0];
        error->error = payload[1];
        closeAll();
        return false;
    }

    child->pid = pid;
    child->stdout_fd = out_pipe[0];
    child->stderr_fd = err_pipe[0];
    LOG_DEBUG("Spawned child pid %d", static_cast<int>(pid));
    return true;
}

// ========== Streaming ==========

bool ProcessCapture::stream(const CaptureOptions& options, Child* child, CaptureResult* result,
                            bool drain_only) noexcept {
    int* fds_owned[2] = {&child->stdout_fd, &child->stderr_fd};
    const StreamId ids[2] = {StreamId::STDOUT, StreamId::STDERR};
    std::string* buffers[2] = {&result->session.stdout_data, &result->session.stderr_data};

    struct pollfd fds[2];
    for (int i = 0; i < 2; ++i) {
        fds[i].fd = *fds_owned[i];
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }

    // Interrupts are checked between poll rounds; a child that never
    // closes its pipes keeps us here until then. Drain mode only takes
    // what is already buffered in the pipes.
    const int timeout_ms = drain_only ? 0 : options.poll_timeout_ms;
    char chunk[CHUNK_SIZE];
    bool ok = true;
    int open_count = (fds[0].fd >= 0 ? 1 : 0) + (fds[1].fd >= 0 ? 1 : 0);

    try {
        while (open_count > 0) {
            if (!drain_only && InterruptGuard::triggered()) {
                break;
            }

            int rc = poll(fds, 2, timeout_ms);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("poll failed: %s", strerror(errno));
                ok = false;
                break;
            }
            if (rc == 0) {
                if (drain_only) {
                    break;
                }
                continue;
            }

            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }

                if (fds[i].revents & POLLNVAL) {
                    LOG_ERROR("Output pipe %d became invalid", i);
                    fds[i].fd = -1;
                    *fds_owned[i] = -1;
                    --open_count;
                    ok = false;
                    continue;
                }

                ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
                if (n > 0) {
                    mirror(ids[i], options.quiet, chunk, static_cast<size_t>(n));
                    buffers[i]->append(chunk, static_cast<size_t>(n));
                } else if (n == 0) {
                    // EOF on this stream only, the other keeps going
                    closeFd(fds_owned[i]);
                    fds[i].fd = -1;
                    --open_count;
                } else if (errno != EINTR && errno != EAGAIN) {
                    LOG_ERROR("read from child failed: %s", strerror(errno));
                    closeFd(fds_owned[i]);
                    fds[i].fd = -1;
                    --open_count;
                    ok = false;
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Capture buffering failed: %s", e.what());
        ok = false;
    }
    return ok;
}

// ========== Reaping ==========

int ProcessCapture::terminate(const CaptureOptions& options, pid_t pid) noexcept {
    int code = reapWithin(options, pid);
    sweepGroup(pid);
    return code;
}

int ProcessCapture::reapWithin(const CaptureOptions& options, pid_t pid) noexcept {
    int status = 0;
    if (!signalGroup(pid, SIGTERM)) {
        LOG_WARN("SIGTERM to group %d failed: %s", static_cast<int>(pid), strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.kill_grace_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return decodeWaitStatus(status);
        }
        if (r < 0 && errno != EINTR) {
            LOG_ERROR("waitpid failed: %s", strerror(errno));
            return -1;
        }
        poll(nullptr, 0, TERMINATE_POLL_MS);
    }

    LOG_WARN("Child %d ignored SIGTERM, sending SIGKILL to its group", static_cast<int>(pid));
    if (!signalGroup(pid, SIGKILL)) {
        LOG_ERROR("SIGKILL to group %d failed: %s", static_cast<int>(pid), strerror(errno));
    }
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG_ERROR("waitpid failed: %s", strerror(errno));
            return -1;
        }
    }
    return decodeWaitStatus(status);
}

void ProcessCapture::sweepGroup(pid_t pgid) noexcept {
    // Leader is gone; anything left in its group outlived the interrupt
    if (kill(-pgid, SIGKILL) == 0) {
        LOG_WARN("Killed processes left in group %d", static_cast<int>(pgid));
    } else if (errno != ESRCH) {
        LOG_WARN("Sweep of group %d failed: %s", static_cast<int>(pgid), strerror(errno));
    }
}

int ProcessCapture::reap(const CaptureOptions& options, pid_t pid, bool* interrupted) noexcept {
    for (;;) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return decodeWaitStatus(status);
        }
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("waitpid failed: %s", strerror(errno));
            return -1;
        }
        if (InterruptGuard::triggered()) {
            *interrupted = true;
            return terminate(options, pid);
        }
        poll(nullptr, 0, options.poll_timeout_ms);
    }
}

// ========== Entry point ==========

CaptureStatus ProcessCapture::run(const CaptureOptions& options, CaptureResult* result) noexcept {
    if (!result || options.shell.empty()) {
        return CaptureStatus::INVALID_ARGUMENT;
    }

    try {
        *result = CaptureResult{};
        sink_failures_ = 0;
        state_ = CaptureState::INIT;

        auto& session = result->session;
        session.session_id = store_.generateSessionId();
        if (session.session_id.empty()) {
            LOG_ERROR("No session id available, command not started");
            result->store_status = Storage::StoreStatus::IO_ERROR;
            result->final_state = CaptureState::FAILED;
            return CaptureStatus::PERSIST_FAILED;
        }
        session.command = options.command;
        session.cwd = options.cwd.empty() ? currentDirectory() : options.cwd;

        char started_at[64];
        if (Common::getIso8601Now(started_at, sizeof(started_at))) {
            session.started_at = started_at;
        }

        // Command text may hold secrets, only the id is logged
        LOG_INFO("Capture %s starting (quiet=%d)", session.session_id.c_str(), options.quiet ? 1 : 0);

        InterruptGuard guard;
        TerminalGuard terminal(options.foreground);
        bool interrupted = false;
        int interrupt_signal = 0;
        const char* failure = nullptr;
        auto t0 = std::chrono::steady_clock::now();

        transition(CaptureState::SPAWNING);
        Child child;
        SpawnError spawn_error;
        if (!spawn(options, terminal.owner(), &child, &spawn_error)) {
            terminal.release();
            if (spawn_error.stage == STAGE_EXEC && spawn_error.error == ENOENT) {
                session.exit_code = EXIT_SPAWN_FAILURE;
                failure = "spawn";
                appendDiagnostic("Command not found: " + options.shell + "\n", options.quiet, result);
            } else {
                session.exit_code = EXIT_RUNTIME_FAILURE;
                failure = "runtime";
                appendDiagnostic("Error executing command: " +
                                 describeSpawnError(options, spawn_error.stage, spawn_error.error) + "\n",
                                 options.quiet, result);
            }
            LOG_WARN("Capture %s spawn failed at stage %d: %s", session.session_id.c_str(),
                     spawn_error.stage, strerror(spawn_error.error));
            transition(CaptureState::FAILED);
        } else {
            terminal.lendTo(child.pid);
            result->process_group = static_cast<int64_t>(child.pid);

            transition(CaptureState::STREAMING);
            bool stream_ok = stream(options, &child, result, false);
            bool both_eof = child.stdout_fd < 0 && child.stderr_fd < 0;
            StreamEnd end = !stream_ok ? StreamEnd::ERROR
                          : both_eof ? StreamEnd::COMPLETE
                          : StreamEnd::INTERRUPTED;

            transition(CaptureState::DRAINING);
            int code;
            if (end == StreamEnd::COMPLETE) {
                code = reap(options, child.pid, &interrupted);
                // Keys typed at a lent terminal signal the command's group, not us
                if (!interrupted && terminal.lent() && (code == 128 + SIGINT || code == 128 + SIGQUIT)) {
                    interrupted = true;
                    interrupt_signal = code - 128;
                    sweepGroup(child.pid);
                }
            } else {
                interrupted = end == StreamEnd::INTERRUPTED;
                code = terminate(options, child.pid);
                // Pick up whatever the child wrote before it died
                if (!stream(options, &child, result, true)) {
                    end = StreamEnd::ERROR;
                }
            }
            closeFd(&child.stdout_fd);
            closeFd(&child.stderr_fd);
            terminal.release();

            if (end == StreamEnd::ERROR || code < 0) {
                session.exit_code = EXIT_RUNTIME_FAILURE;
                failure = "runtime";
                appendDiagnostic("Error executing command: lost contact with child process\n",
                                 options.quiet, result);
                transition(CaptureState::FAILED);
            } else {
                session.exit_code = code;
                transition(CaptureState::DONE);
            }
        }

        auto elapsed = std::chrono::steady_clock::now() - t0;
        session.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

        auto& meta = session.metadata;
        meta["cwd"] = session.cwd;
        meta["quiet"] = options.quiet;
        meta["interrupted"] = interrupted;
        meta["shell"] = options.shell;
        meta["stdout_bytes"] = static_cast<int64_t>(session.stdout_data.size());
        meta["stderr_bytes"] = static_cast<int64_t>(session.stderr_data.size());
        meta["stdout_sha256"] = digestOf(session.stdout_data);
        meta["stderr_sha256"] = digestOf(session.stderr_data);
        if (failure) {
            meta["failure"] = std::string(failure);
        }
        if (interrupted) {
            if (interrupt_signal == 0) {
                interrupt_signal = InterruptGuard::signalNumber();
            }
            meta["signal"] = static_cast<int64_t>(interrupt_signal);
        }

        result->final_state = state_;
        result->sink_failures = sink_failures_;

        LOG_INFO("Capture %s finished: state=%s exit=%d duration=%lldms stdout=%zu stderr=%zu",
                 session.session_id.c_str(), captureStateToString(state_), session.exit_code,
                 static_cast<long long>(session.duration_ms),
                 session.stdout_data.size(), session.stderr_data.size());

        // Exactly one save, no retry
        result->store_status = store_.saveCapture(session, &result->evidence_path);
        if (result->store_status != Storage::StoreStatus::OK) {
            LOG_ERROR("Capture %s not saved: %s", session.session_id.c_str(),
                      Storage::storeStatusToString(result->store_status));
            return CaptureStatus::PERSIST_FAILED;
        }
        return CaptureStatus::OK;
    } catch (const std::exception& e) {
        LOG_ERROR("Capture aborted: %s", e.what());
        result->final_state = CaptureState::FAILED;
        result->store_status = Storage::StoreStatus::IO_ERROR;
        return CaptureStatus::PERSIST_FAILED;
    }
}

} // namespace Trace::Capture
