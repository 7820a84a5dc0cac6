// ============================================================================
// evidence_store.h - .ai/ directory persistence for evidence and context
// ============================================================================

#pragma once

#include "storage/records.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Trace::Storage {

enum class StoreStatus : uint8_t {
    OK,
    NOT_FOUND,
    IO_ERROR,
    PARSE_ERROR
};

const char* storeStatusToString(StoreStatus status) noexcept;

// One JSON document per record under <base>/.ai/{evidence,context}.
// Writes go to a temp file that is renamed into place.
class EvidenceStore {
public:
    explicit EvidenceStore(const std::string& base_dir);

    // Create .ai/evidence and .ai/context
    bool initialize() noexcept;

    // 8 lowercase hex chars; regenerated while a record with that id exists.
    // Empty on failure.
    std::string generateSessionId() noexcept;

    StoreStatus saveCapture(const CaptureSession& session, std::string* path_out) noexcept;
    StoreStatus saveImportedLog(const ImportedLog& log, std::string* path_out) noexcept;
    StoreStatus saveContext(const ContextSession& context, std::string* path_out) noexcept;

    // Newest first; unreadable files are skipped
    std::vector<EvidenceSummary> listSessions() const noexcept;

    // session_<id>.json, then log_<id>.json
    StoreStatus loadRecord(const std::string& session_id, EvidenceRecord* out) const noexcept;

    std::vector<ContextSummary> listContexts() const noexcept;
    StoreStatus loadContext(const std::string& session_id, ContextSession* out) const noexcept;

    const std::string& baseDir() const noexcept { return base_dir_; }
    const std::string& evidenceDir() const noexcept { return evidence_dir_; }
    const std::string& contextDir() const noexcept { return context_dir_; }

private:
    bool idInUse(const std::string& session_id) const noexcept;
    StoreStatus writeDocument(const std::string& path, const std::string& body) noexcept;
    StoreStatus readDocument(const std::string& path, std::string* body) const noexcept;

    std::string base_dir_;
    std::string evidence_dir_;
    std::string context_dir_;
};

} // namespace Trace::Storage
