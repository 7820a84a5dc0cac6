// ============================================================================
// evidence_gatherer.h - Bounded, redacted evidence and context for review
// ============================================================================

#pragma once

#include "redaction/redaction_engine.h"
#include "storage/evidence_store.h"
#include "triage/evidence_triage.h"
#include <cstddef>
#include <string>
#include <vector>

namespace Trace::Review {

constexpr const char* NO_EVIDENCE_MESSAGE =
    "[No evidence captured. Run 'trace run <command>' to capture evidence.]";
constexpr const char* NO_CONTEXT_MESSAGE =
    "[No context ingested. Run 'trace context add' to add AI session history.]";

struct EvidenceOptions {
    std::vector<std::string> session_ids;   // empty = newest max_sessions
    size_t max_sessions{5};
    size_t max_lines{Triage::DEFAULT_MAX_LINES};
    size_t max_chars{50000};
};

struct ContextOptions {
    std::vector<std::string> session_ids;
    size_t max_sessions{3};
    size_t max_messages{10};
    size_t max_message_chars{500};
    size_t max_chars{10000};
};

struct GatheredText {
    std::string text;
    std::vector<Triage::EvidenceBlock> blocks;
    std::vector<Redaction::RedactionRecord> redactions;
    std::vector<std::string> missing_ids;
    bool truncated{false};      // stopped at max_chars
};

/// Read side of the pipeline: load records, compress, redact, format.
/// Everything in GatheredText::text has been through the redaction engine.
class EvidenceGatherer {
public:
    EvidenceGatherer(const Storage::EvidenceStore& store, const Redaction::RedactionEngine& engine) noexcept;

    GatheredText gatherEvidence(const EvidenceOptions& options) const;
    GatheredText gatherContext(const ContextOptions& options) const;

    /// Advisory file ranking over already gathered (redacted) text
    Triage::RelevanceMap rankFiles(const GatheredText& gathered,
                                   const std::vector<std::string>& changed_files) const;

private:
    std::string redactInto(const std::string& text, GatheredText* out) const;

    const Storage::EvidenceStore& store_;
    const Redaction::RedactionEngine& engine_;
};

} // namespace Trace::Review
