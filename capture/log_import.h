#pragma once

#include "storage/evidence_store.h"
#include "storage/records.h"
#include <cstdint>
#include <string>

namespace Trace::Capture {

enum class ImportStatus : uint8_t {
    OK,
    FILE_NOT_FOUND,
    READ_ERROR,
    PERSIST_FAILED
};

struct ImportResult {
    Storage::ImportedLog log;
    std::string evidence_path;
};

// Store an existing log file as evidence (log_<id>.json), content verbatim
ImportStatus importLogFile(const std::string& path, Storage::EvidenceStore& store,
                           ImportResult* result) noexcept;

} // namespace Trace::Capture
