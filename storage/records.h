#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace Trace::Storage {

// Flat metadata values; nested JSON in hand-edited records is not kept
using MetaValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Metadata = std::map<std::string, MetaValue>;

// One command execution. Buffers are the exact bytes the child wrote.
struct CaptureSession {
    std::string session_id;
    std::string command;
    std::string cwd;
    int32_t exit_code{0};
    std::string stdout_data;
    std::string stderr_data;
    std::string started_at;     // ISO-8601 UTC
    int64_t duration_ms{0};
    Metadata metadata;
};

// A log file brought in with `trace capture --log`
struct ImportedLog {
    std::string session_id;
    std::string source_file;
    std::string content;
    std::string timestamp;
    Metadata metadata;
};

enum class RecordType : uint8_t {
    COMMAND,
    IMPORTED_LOG
};

// A loaded evidence file of either kind
struct EvidenceRecord {
    RecordType type{RecordType::COMMAND};
    CaptureSession capture;
    ImportedLog log;

    const std::string& sessionId() const noexcept {
        return type == RecordType::COMMAND ? capture.session_id : log.session_id;
    }

    const std::string& timestamp() const noexcept {
        return type == RecordType::COMMAND ? capture.started_at : log.timestamp;
    }

    // Command text, or import:<source_file> for imported logs
    std::string label() const {
        return type == RecordType::COMMAND ? capture.command : "import:" + log.source_file;
    }

    // stdout followed by stderr, or the imported content
    std::string combinedOutput() const {
        return type == RecordType::COMMAND ? capture.stdout_data + capture.stderr_data : log.content;
    }
};

struct EvidenceSummary {
    std::string session_id;
    std::string command_or_source;
    bool has_exit_code{false};
    int32_t exit_code{0};
    std::string timestamp;
    RecordType type{RecordType::COMMAND};
    std::string file;
};

struct ContextMessage {
    std::string role;
    std::string content;
};

// Ingested conversation context; content is always redacted text
struct ContextSession {
    std::string session_id;
    std::string source;
    std::string title;
    std::string created_at;
    std::vector<ContextMessage> messages;
    Metadata metadata;
};

struct ContextSummary {
    std::string session_id;
    std::string source;
    std::string title;
    std::string created_at;
    size_t message_count{0};
    std::string file;
};

} // namespace Trace::Storage
