// ============================================================================
// evidence_gatherer.cpp - Bounded, redacted evidence and context for review
// ============================================================================

#include "review/evidence_gatherer.h"
#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace Trace::Review {

EvidenceGatherer::EvidenceGatherer(const Storage::EvidenceStore& store,
                                   const Redaction::RedactionEngine& engine) noexcept
    : store_(store), engine_(engine) {
}

std::string EvidenceGatherer::redactInto(const std::string& text, GatheredText* out) const {
    Redaction::RedactionResult r = engine_.redact(text);
    out->redactions.insert(out->redactions.end(), r.records.begin(), r.records.end());
    return std::move(r.redacted_text);
}

GatheredText EvidenceGatherer::gatherEvidence(const EvidenceOptions& options) const {
    GatheredText out;

    std::vector<std::string> ids = options.session_ids;
    if (ids.empty()) {
        for (const auto& summary : store_.listSessions()) {
            if (ids.size() >= options.max_sessions) {
                break;
            }
            ids.push_back(summary.session_id);
        }
    }

    size_t total_chars = 0;
    std::vector<std::string> parts;
    for (const auto& id : ids) {
        Storage::EvidenceRecord record;
        Storage::StoreStatus status = store_.loadRecord(id, &record);
        if (status != Storage::StoreStatus::OK) {
            LOG_WARN("Evidence %s unavailable: %s", id.c_str(), Storage::storeStatusToString(status));
            out.missing_ids.push_back(id);
            continue;
        }

        // Records are stored raw; compress first, then scrub what is left
        GatheredText scratch;
        Triage::EvidenceBlock block;
        block.source_session_id = record.sessionId();
        block.command = redactInto(record.label(), &scratch);
        if (record.type == Storage::RecordType::COMMAND) {
            block.has_exit_code = true;
            block.exit_code = record.capture.exit_code;
        }
        block.compressed_text = redactInto(Triage::compress(record.combinedOutput(), options.max_lines), &scratch);

        std::string formatted = block.format();
        if (total_chars + formatted.size() > options.max_chars) {
            out.truncated = true;
            break;
        }

        total_chars += formatted.size();
        parts.push_back(std::move(formatted));
        out.blocks.push_back(std::move(block));
        out.redactions.insert(out.redactions.end(), scratch.redactions.begin(), scratch.redactions.end());
    }

    if (parts.empty()) {
        out.text = NO_EVIDENCE_MESSAGE;
        return out;
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.text += '\n';
        }
        out.text += parts[i];
    }
    LOG_INFO("Gathered %zu evidence block(s), %zu chars", parts.size(), out.text.size());
    return out;
}

GatheredText EvidenceGatherer::gatherContext(const ContextOptions& options) const {
    GatheredText out;

    std::vector<std::string> ids = options.session_ids;
    if (ids.empty()) {
        for (const auto& summary : store_.listContexts()) {
            if (ids.size() >= options.max_sessions) {
                break;
            }
            ids.push_back(summary.session_id);
        }
    }

    size_t total_chars = 0;
    std::vector<std::string> parts;
    for (const auto& id : ids) {
        Storage::ContextSession context;
        if (store_.loadContext(id, &context) != Storage::StoreStatus::OK) {
            out.missing_ids.push_back(id);
            continue;
        }

        size_t first = context.messages.size() > options.max_messages
                     ? context.messages.size() - options.max_messages : 0;

        std::string body;
        for (size_t i = first; i < context.messages.size(); ++i) {
            const auto& msg = context.messages[i];
            std::string role = msg.role.empty() ? std::string("?") : msg.role;
            std::transform(role.begin(), role.end(), role.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            std::string content = msg.content;
            if (content.size() > options.max_message_chars) {
                content = content.substr(0, options.max_message_chars) + "...";
            }
            if (!body.empty()) {
                body += '\n';
            }
            body += role + ": " + content;
        }

        std::string block = "\n=== Context from " + context.source + " (Session: " + id + ") ===\n" + body + "\n";

        // Stored context is already redacted; this pass covers hand-edited files
        GatheredText scratch;
        std::string redacted = redactInto(block, &scratch);
        if (total_chars + redacted.size() > options.max_chars) {
            out.truncated = true;
            break;
        }

        total_chars += redacted.size();
        parts.push_back(std::move(redacted));
        out.redactions.insert(out.redactions.end(), scratch.redactions.begin(), scratch.redactions.end());
    }

    if (parts.empty()) {
        out.text = NO_CONTEXT_MESSAGE;
        return out;
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.text += '\n';
        }
        out.text += parts[i];
    }
    return out;
}

Triage::RelevanceMap EvidenceGatherer::rankFiles(const GatheredText& gathered,
                                                 const std::vector<std::string>& changed_files) const {
    return Triage::relevance(gathered.text, changed_files);
}

} // namespace Trace::Review
