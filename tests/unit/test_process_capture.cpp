#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <sys/types.h>
#include <unistd.h>

#include "capture/output_sink.h"
#include "capture/process_capture.h"
#include "common/digest.h"
#include "common/logging.h"
#include "storage/evidence_store.h"

using namespace Trace::Capture;
using Trace::Storage::EvidenceRecord;
using Trace::Storage::EvidenceStore;
using Trace::Storage::StoreStatus;

// Compile-time routing contract
static_assert(selectChannel(StreamId::STDOUT, false) == Channel::PRIMARY);
static_assert(selectChannel(StreamId::STDERR, false) == Channel::DIAGNOSTIC);
static_assert(selectChannel(StreamId::STDOUT, true) == Channel::DIAGNOSTIC);
static_assert(selectChannel(StreamId::STDERR, true) == Channel::DIAGNOSTIC);

namespace {

// Keeps everything mirrored per channel, optionally refusing every write
class RecordingSink final : public OutputSink {
public:
    bool write(Channel channel, const char* data, size_t len) noexcept override {
        if (fail_) {
            return false;
        }
        (channel == Channel::PRIMARY ? primary_ : diagnostic_).append(data, len);
        return true;
    }

    void setFailing(bool fail) { fail_ = fail; }
    const std::string& primary() const { return primary_; }
    const std::string& diagnostic() const { return diagnostic_; }

private:
    std::string primary_;
    std::string diagnostic_;
    bool fail_{false};
};

std::string sha256Of(const std::string& data) {
    char hex[Trace::Common::SHA256_HEX_LENGTH + 1];
    if (!Trace::Common::sha256Hex(data.data(), data.size(), hex, sizeof(hex))) {
        return std::string();
    }
    return hex;
}

// Processes still running (not zombies) in the given process group
size_t liveGroupMembers(pid_t pgid) {
    size_t alive = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        std::ifstream stat(entry.path() / "stat");
        std::string line;
        if (!std::getline(stat, line)) {
            continue;
        }
        // comm may contain spaces, fields resume after its closing paren
        size_t close = line.rfind(')');
        if (close == std::string::npos) {
            continue;
        }
        std::istringstream fields(line.substr(close + 1));
        char state = 0;
        long ppid = 0;
        long pgrp = 0;
        if (!(fields >> state >> ppid >> pgrp)) {
            continue;
        }
        if (pgrp == static_cast<long>(pgid) && state != 'Z' && state != 'X') {
            ++alive;
        }
    }
    return alive;
}

} // namespace

class ProcessCaptureTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        base_dir_ = (std::filesystem::temp_directory_path() /
                     ("trace_capture_" + std::to_string(stamp))).string();
        std::filesystem::create_directories(base_dir_);

        Trace::Common::shutdownLogging();
        Trace::Common::initLogging((base_dir_ + "/capture_test.log").c_str());
        LOG_INFO("=== Starting Process Capture Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== Process Capture Test Completed ===");
        Trace::Common::shutdownLogging();
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
    }

    CaptureStatus capture(const std::string& command, CaptureResult* result, bool quiet = false) {
        CaptureOptions options;
        options.command = command;
        options.quiet = quiet;
        EvidenceStore store(base_dir_);
        ProcessCapture engine(store, sink_);
        return engine.run(options, result);
    }

    std::string base_dir_;
    RecordingSink sink_;
};

TEST_F(ProcessCaptureTestBase, EchoIsCapturedAndSaved) {
    // GIVEN / WHEN
    CaptureResult result;
    ASSERT_EQ(capture("echo hello", &result), CaptureStatus::OK);

    // THEN
    const auto& s = result.session;
    EXPECT_EQ(s.exit_code, 0);
    EXPECT_EQ(s.stdout_data, "hello\n");
    EXPECT_EQ(s.stderr_data, "");
    EXPECT_GE(s.duration_ms, 0);
    EXPECT_EQ(result.final_state, CaptureState::DONE);
    EXPECT_EQ(s.session_id.size(), 8u);
    EXPECT_FALSE(s.started_at.empty());

    // Mirrored live as well as buffered
    EXPECT_EQ(sink_.primary(), "hello\n");

    // Persisted once, readable back
    EXPECT_EQ(result.evidence_path, base_dir_ + "/.ai/evidence/session_" + s.session_id + ".json");
    EvidenceStore store(base_dir_);
    EvidenceRecord loaded;
    ASSERT_EQ(store.loadRecord(s.session_id, &loaded), StoreStatus::OK);
    EXPECT_EQ(loaded.capture.stdout_data, "hello\n");
    EXPECT_EQ(loaded.capture.command, "echo hello");
}

TEST_F(ProcessCaptureTestBase, MetadataCarriesDigestsAndSizes) {
    CaptureResult result;
    ASSERT_EQ(capture("printf abc; printf 'oops\\n' 1>&2", &result), CaptureStatus::OK);

    auto& meta = result.session.metadata;
    EXPECT_EQ(std::get<std::string>(meta["stdout_sha256"]), sha256Of("abc"));
    EXPECT_EQ(std::get<std::string>(meta["stderr_sha256"]), sha256Of("oops\n"));
    EXPECT_EQ(std::get<int64_t>(meta["stdout_bytes"]), 3);
    EXPECT_EQ(std::get<int64_t>(meta["stderr_bytes"]), 5);
    EXPECT_EQ(std::get<bool>(meta["interrupted"]), false);
    EXPECT_EQ(std::get<bool>(meta["quiet"]), false);
    EXPECT_EQ(std::get<std::string>(meta["shell"]), "/bin/sh");
    EXPECT_EQ(meta.count("failure"), 0u);

    EXPECT_EQ(sha256Of("hello\n"), "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03");
}

TEST_F(ProcessCaptureTestBase, MissingCommandReportsNotFound) {
    CaptureResult result;
    ASSERT_EQ(capture("definitely_not_a_command_4711", &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.exit_code, 127);
    EXPECT_NE(result.session.stderr_data.find("not found"), std::string::npos);
}

TEST_F(ProcessCaptureTestBase, MissingShellIsSpawnFailure) {
    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);

    CaptureOptions options;
    options.command = "echo never";
    options.shell = "/nonexistent/bin/sh";

    CaptureResult result;
    ASSERT_EQ(engine.run(options, &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.exit_code, EXIT_SPAWN_FAILURE);
    EXPECT_EQ(result.session.stderr_data, "Command not found: /nonexistent/bin/sh\n");
    EXPECT_EQ(result.final_state, CaptureState::FAILED);
    EXPECT_EQ(std::get<std::string>(result.session.metadata["failure"]), "spawn");

    // The diagnostic is mirrored and the failed run is still evidence
    EXPECT_EQ(sink_.diagnostic(), "Command not found: /nonexistent/bin/sh\n");
    EXPECT_TRUE(std::filesystem::exists(result.evidence_path));
}

TEST_F(ProcessCaptureTestBase, BadWorkingDirectoryIsRuntimeFailure) {
    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);

    CaptureOptions options;
    options.command = "pwd";
    options.cwd = base_dir_ + "/does/not/exist";

    CaptureResult result;
    ASSERT_EQ(engine.run(options, &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.exit_code, EXIT_RUNTIME_FAILURE);
    EXPECT_EQ(result.session.stderr_data.rfind("Error executing command: ", 0), 0u);
    EXPECT_EQ(result.final_state, CaptureState::FAILED);
    EXPECT_EQ(std::get<std::string>(result.session.metadata["failure"]), "runtime");
}

TEST_F(ProcessCaptureTestBase, WorkingDirectoryIsHonoured) {
    std::filesystem::create_directories(base_dir_ + "/sub");

    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);
    CaptureOptions options;
    options.command = "pwd";
    options.cwd = base_dir_ + "/sub";

    CaptureResult result;
    ASSERT_EQ(engine.run(options, &result), CaptureStatus::OK);
    EXPECT_EQ(result.session.exit_code, 0);
    EXPECT_EQ(std::filesystem::canonical(result.session.stdout_data.substr(0, result.session.stdout_data.size() - 1)),
              std::filesystem::canonical(base_dir_ + "/sub"));
    EXPECT_EQ(result.session.cwd, base_dir_ + "/sub");
}

TEST_F(ProcessCaptureTestBase, ExitCodesPassThrough) {
    CaptureResult result;
    ASSERT_EQ(capture("exit 3", &result), CaptureStatus::OK);
    EXPECT_EQ(result.session.exit_code, 3);
    EXPECT_EQ(result.final_state, CaptureState::DONE);

    // Killed by a signal: 128 + signal number
    ASSERT_EQ(capture("kill -TERM $$", &result), CaptureStatus::OK);
    EXPECT_EQ(result.session.exit_code, 128 + SIGTERM);
}

TEST_F(ProcessCaptureTestBase, NormalModeRoutesStreamsSeparately) {
    CaptureResult result;
    ASSERT_EQ(capture("echo out; echo err 1>&2", &result), CaptureStatus::OK);

    EXPECT_EQ(sink_.primary(), "out\n");
    EXPECT_EQ(sink_.diagnostic(), "err\n");
    EXPECT_EQ(result.session.stdout_data, "out\n");
    EXPECT_EQ(result.session.stderr_data, "err\n");
}

TEST_F(ProcessCaptureTestBase, QuietModeKeepsPrimaryChannelClean) {
    CaptureResult result;
    ASSERT_EQ(capture("echo out; echo err 1>&2", &result, true), CaptureStatus::OK);

    EXPECT_TRUE(sink_.primary().empty());
    EXPECT_NE(sink_.diagnostic().find("out\n"), std::string::npos);
    EXPECT_NE(sink_.diagnostic().find("err\n"), std::string::npos);

    // Buffers stay split by origin regardless of routing
    EXPECT_EQ(result.session.stdout_data, "out\n");
    EXPECT_EQ(result.session.stderr_data, "err\n");
    EXPECT_EQ(std::get<bool>(result.session.metadata["quiet"]), true);
}

TEST_F(ProcessCaptureTestBase, StreamsEndIndependently) {
    // stdout closes long before stderr is written
    CaptureResult result;
    ASSERT_EQ(capture("exec 1>&-; sleep 0.3; echo late 1>&2", &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.exit_code, 0);
    EXPECT_EQ(result.session.stdout_data, "");
    EXPECT_EQ(result.session.stderr_data, "late\n");
    EXPECT_EQ(result.final_state, CaptureState::DONE);
}

TEST_F(ProcessCaptureTestBase, LargeOutputOnBothStreamsDoesNotStall) {
    const std::string command =
        "head -c 200000 /dev/zero | tr '\\0' a; head -c 150000 /dev/zero | tr '\\0' b 1>&2";

    CaptureResult result;
    ASSERT_EQ(capture(command, &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.stdout_data, std::string(200000, 'a'));
    EXPECT_EQ(result.session.stderr_data, std::string(150000, 'b'));
    EXPECT_EQ(sink_.primary().size(), 200000u);
}

TEST_F(ProcessCaptureTestBase, SinkFailureDoesNotStopBuffering) {
    sink_.setFailing(true);

    CaptureResult result;
    ASSERT_EQ(capture("echo one; echo two 1>&2", &result), CaptureStatus::OK);

    EXPECT_EQ(result.session.stdout_data, "one\n");
    EXPECT_EQ(result.session.stderr_data, "two\n");
    EXPECT_GE(result.sink_failures, 2u);
}

TEST_F(ProcessCaptureTestBase, PersistenceFailureIsDistinctFromExitCode) {
    // GIVEN: .ai is a plain file, the store cannot create its directories
    {
        std::ofstream blocker(base_dir_ + "/.ai");
        blocker << "not a directory";
    }

    // WHEN
    CaptureResult result;
    CaptureStatus status = capture("echo still runs; exit 4", &result);

    // THEN: the command ran, its result is intact, but nothing was saved
    EXPECT_EQ(status, CaptureStatus::PERSIST_FAILED);
    EXPECT_EQ(result.store_status, StoreStatus::IO_ERROR);
    EXPECT_EQ(result.session.exit_code, 4);
    EXPECT_EQ(result.session.stdout_data, "still runs\n");
    EXPECT_TRUE(result.evidence_path.empty());
}

TEST_F(ProcessCaptureTestBase, InterruptTerminatesChildAndKeepsPartialOutput) {
    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);

    CaptureOptions options;
    options.command = "echo started; sleep 30";
    options.kill_grace_ms = 2000;

    // Deliver SIGINT to ourselves once the child is running
    std::thread interrupter([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        kill(getpid(), SIGINT);
    });

    auto t0 = std::chrono::steady_clock::now();
    CaptureResult result;
    CaptureStatus status = engine.run(options, &result);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    interrupter.join();

    ASSERT_EQ(status, CaptureStatus::OK);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 10);
    EXPECT_TRUE(std::get<bool>(result.session.metadata["interrupted"]));
    EXPECT_EQ(std::get<int64_t>(result.session.metadata["signal"]), SIGINT);
    EXPECT_EQ(result.session.stdout_data, "started\n");
    EXPECT_NE(result.session.exit_code, 0);

    // Partial record is on disk
    EvidenceRecord loaded;
    ASSERT_EQ(store.loadRecord(result.session.session_id, &loaded), StoreStatus::OK);
    EXPECT_TRUE(std::get<bool>(loaded.capture.metadata["interrupted"]));
}

TEST_F(ProcessCaptureTestBase, InterruptStopsEveryProcessInThePipeline) {
    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);

    // GIVEN: a pipeline whose members outlive the shell if only it is signalled
    CaptureOptions options;
    options.command = "sleep 300 | cat; echo unreachable";
    options.kill_grace_ms = 2000;
    options.foreground = false;

    std::thread interrupter([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        kill(getpid(), SIGTERM);
    });

    // WHEN
    auto t0 = std::chrono::steady_clock::now();
    CaptureResult result;
    CaptureStatus status = engine.run(options, &result);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    interrupter.join();

    // THEN: the shell never reached the next command
    ASSERT_EQ(status, CaptureStatus::OK);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 10);
    EXPECT_TRUE(std::get<bool>(result.session.metadata["interrupted"]));
    EXPECT_EQ(std::get<int64_t>(result.session.metadata["signal"]), SIGTERM);
    EXPECT_NE(result.session.exit_code, 0);
    EXPECT_EQ(result.session.stdout_data.find("unreachable"), std::string::npos);

    // AND: nothing from the command's group is left running
    ASSERT_GT(result.process_group, 0);
    const pid_t pgid = static_cast<pid_t>(result.process_group);
    size_t alive = liveGroupMembers(pgid);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (alive > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        alive = liveGroupMembers(pgid);
    }
    EXPECT_EQ(alive, 0u);
}

TEST_F(ProcessCaptureTestBase, CommandLeadsItsOwnProcessGroup) {
    CaptureResult result;
    ASSERT_EQ(capture("cut -d' ' -f5 /proc/$$/stat", &result), CaptureStatus::OK);

    ASSERT_GT(result.process_group, 0);
    EXPECT_NE(result.process_group, static_cast<int64_t>(getpgrp()));
    EXPECT_EQ(std::stoll(result.session.stdout_data), result.process_group);
}

TEST_F(ProcessCaptureTestBase, InvalidArguments) {
    EvidenceStore store(base_dir_);
    ProcessCapture engine(store, sink_);

    CaptureOptions options;
    options.command = "true";
    options.shell.clear();

    CaptureResult result;
    EXPECT_EQ(engine.run(options, &result), CaptureStatus::INVALID_ARGUMENT);
    EXPECT_EQ(engine.run(options, nullptr), CaptureStatus::INVALID_ARGUMENT);
}

TEST_F(ProcessCaptureTestBase, StateNames) {
    EXPECT_STREQ(captureStateToString(CaptureState::INIT), "INIT");
    EXPECT_STREQ(captureStateToString(CaptureState::DRAINING), "DRAINING");
    EXPECT_STREQ(captureStateToString(CaptureState::FAILED), "FAILED");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
