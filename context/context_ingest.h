#pragma once

#include "redaction/redaction_engine.h"
#include "storage/evidence_store.h"
#include "storage/records.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Trace::Context {

enum class IngestStatus : uint8_t {
    OK,
    FILE_NOT_FOUND,
    READ_ERROR,
    EMPTY_INPUT,
    PERSIST_FAILED
};

const char* ingestStatusToString(IngestStatus status) noexcept;

struct IngestResult {
    Storage::ContextSession context;
    std::vector<Redaction::RedactionRecord> redactions;  // for the operator warning
    std::string path;
};

/// Turns pasted or file text into a stored context session. The text is
/// redacted before anything else sees it; the raw form is never stored.
class ContextIngestor {
public:
    ContextIngestor(Storage::EvidenceStore& store, const Redaction::RedactionEngine& engine) noexcept;

    IngestStatus ingestText(const std::string& text, const std::string& source,
                            IngestResult* result) noexcept;

    IngestStatus ingestFile(const std::string& path, const std::string& source,
                            IngestResult* result) noexcept;

    // First non-empty line, trimmed, cut at 80 chars with "..."
    static std::string extractTitle(const std::string& text);

private:
    IngestStatus ingest(const std::string& text, const std::string& source,
                        const char* method, IngestResult* result);

    Storage::EvidenceStore& store_;
    const Redaction::RedactionEngine& engine_;
};

} // namespace Trace::Context
