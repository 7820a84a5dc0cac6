// ============================================================================
// process_capture.h - Run a shell command, mirror and record its output
// ============================================================================

#pragma once

#include "capture/output_sink.h"
#include "storage/evidence_store.h"
#include "storage/records.h"
#include "common/macros.h"
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace Trace::Capture {

enum class CaptureState : uint8_t {
    INIT,
    SPAWNING,
    STREAMING,
    DRAINING,
    DONE,
    FAILED
};

const char* captureStateToString(CaptureState state) noexcept;

/// Outcome of the whole call. The command's own result is in the session.
enum class CaptureStatus : uint8_t {
    OK,
    PERSIST_FAILED,     // command ran (or failed to spawn) but nothing was saved
    INVALID_ARGUMENT
};

// Exit codes the engine manufactures itself
constexpr int32_t EXIT_SPAWN_FAILURE = 127;
constexpr int32_t EXIT_RUNTIME_FAILURE = 1;

struct CaptureOptions {
    std::string command;
    std::string cwd;                 // empty = inherit
    bool quiet{false};
    std::string shell{"/bin/sh"};
    int poll_timeout_ms{50};
    int kill_grace_ms{2000};         // SIGTERM to SIGKILL on interrupt
    bool foreground{true};           // lend a controlling terminal to the command
};

struct CaptureResult {
    Storage::CaptureSession session;
    std::string evidence_path;
    CaptureState final_state{CaptureState::INIT};
    Storage::StoreStatus store_status{Storage::StoreStatus::OK};
    uint64_t sink_failures{0};
    int64_t process_group{-1};       // command's process group, -1 if never spawned
};

/// Executes `<shell> -c <command>` with both output pipes multiplexed by
/// poll(2) on the calling thread. Every chunk is mirrored to the sink
/// before it is buffered. The finished session is saved exactly once.
///
/// The command leads its own process group. When we own the controlling
/// terminal it is lent to that group for the duration of the command.
///
/// SIGINT, SIGTERM and SIGHUP received during run() stop the loop: the
/// group gets SIGTERM, then SIGKILL after kill_grace_ms, and anything left
/// in it once the shell is reaped is killed. The partial session is still
/// saved with metadata.interrupted = true.
class ProcessCapture {
public:
    ProcessCapture(Storage::EvidenceStore& store, OutputSink& sink) noexcept;
    ~ProcessCapture() = default;

    TRACE_NON_COPYABLE(ProcessCapture);

    CaptureStatus run(const CaptureOptions& options, CaptureResult* result) noexcept;

    CaptureState state() const noexcept { return state_; }

private:
    struct Child {
        pid_t pid{-1};
        int stdout_fd{-1};
        int stderr_fd{-1};
    };

    struct SpawnError {
        int stage{0};
        int error{0};
    };

    bool spawn(const CaptureOptions& options, bool take_terminal, Child* child, SpawnError* error) noexcept;
    bool stream(const CaptureOptions& options, Child* child, CaptureResult* result, bool drain_only) noexcept;
    int reap(const CaptureOptions& options, pid_t pid, bool* interrupted) noexcept;
    int terminate(const CaptureOptions& options, pid_t pid) noexcept;
    int reapWithin(const CaptureOptions& options, pid_t pid) noexcept;
    static void sweepGroup(pid_t pgid) noexcept;

    void mirror(StreamId stream, bool quiet, const char* data, size_t len) noexcept;
    void appendDiagnostic(const std::string& line, bool quiet, CaptureResult* result) noexcept;
    void transition(CaptureState next) noexcept;

    Storage::EvidenceStore& store_;
    OutputSink& sink_;
    CaptureState state_{CaptureState::INIT};
    uint64_t sink_failures_{0};
};

} // namespace Trace::Capture
