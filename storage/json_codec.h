// ============================================================================
// json_codec.h - Evidence and context records to and from JSON text
// ============================================================================

#pragma once

#include "storage/records.h"
#include <string>

namespace Trace::Storage {

// Replace every invalid UTF-8 sequence with U+FFFD.
// Returns true when the output differs from the input.
bool sanitizeUtf8(const std::string& in, std::string* out);

// Pretty-printed, two-space indent. Invalid UTF-8 anywhere in the record is
// normalised and flagged with metadata.utf8_normalized = true.
bool serializeCapture(const CaptureSession& session, std::string* out) noexcept;
bool serializeImportedLog(const ImportedLog& log, std::string* out) noexcept;
bool serializeContext(const ContextSession& context, std::string* out) noexcept;

// False on malformed JSON or a missing session_id
bool parseEvidence(const std::string& json, EvidenceRecord* out) noexcept;
bool parseContext(const std::string& json, ContextSession* out) noexcept;

} // namespace Trace::Storage
