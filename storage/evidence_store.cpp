// ============================================================================
// evidence_store.cpp - .ai/ directory persistence for evidence and context
// ============================================================================

#include "storage/evidence_store.h"
#include "storage/json_codec.h"
#include "common/digest.h"
#include "common/logging.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Trace::Storage {

namespace {

constexpr size_t SESSION_ID_BYTES = 4;
constexpr int MAX_ID_ATTEMPTS = 16;

// Ids become file names, keep them to a safe alphabet
bool isSafeId(const std::string& id) noexcept {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool startsWith(const std::string& s, const char* prefix) noexcept {
    return s.rfind(prefix, 0) == 0;
}

bool pathExists(const std::string& path) noexcept {
    return access(path.c_str(), F_OK) == 0;
}

} // namespace

const char* storeStatusToString(StoreStatus status) noexcept {
    switch (status) {
        case StoreStatus::OK: return "OK";
        case StoreStatus::NOT_FOUND: return "NOT_FOUND";
        case StoreStatus::IO_ERROR: return "IO_ERROR";
        case StoreStatus::PARSE_ERROR: return "PARSE_ERROR";
    }
    return "UNKNOWN";
}

EvidenceStore::EvidenceStore(const std::string& base_dir)
    : base_dir_(base_dir.empty() ? std::string(".") : base_dir),
      evidence_dir_(base_dir_ + "/.ai/evidence"),
      context_dir_(base_dir_ + "/.ai/context") {
}

bool EvidenceStore::initialize() noexcept {
    std::error_code ec;
    fs::create_directories(evidence_dir_, ec);
    if (ec) {
        LOG_ERROR("Failed to create %s: %s", evidence_dir_.c_str(), ec.message().c_str());
        return false;
    }
    fs::create_directories(context_dir_, ec);
    if (ec) {
        LOG_ERROR("Failed to create %s: %s", context_dir_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool EvidenceStore::idInUse(const std::string& session_id) const noexcept {
    return pathExists(evidence_dir_ + "/session_" + session_id + ".json") ||
           pathExists(evidence_dir_ + "/log_" + session_id + ".json") ||
           pathExists(context_dir_ + "/context_" + session_id + ".json");
}

std::string EvidenceStore::generateSessionId() noexcept {
    char hex[SESSION_ID_BYTES * 2 + 1];
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        if (!Common::randomHex(SESSION_ID_BYTES, hex, sizeof(hex))) {
            return std::string();
        }
        std::string id(hex);
        if (!idInUse(id)) {
            return id;
        }
        LOG_WARN("Session id %s already on disk, regenerating", hex);
    }
    LOG_ERROR("Could not find a free session id after %d attempts", MAX_ID_ATTEMPTS);
    return std::string();
}

StoreStatus EvidenceStore::writeDocument(const std::string& path, const std::string& body) noexcept {
    std::string tmp_path = path + ".tmp." + std::to_string(getpid());

    FILE* fp = fopen(tmp_path.c_str(), "w");
    if (!fp) {
        LOG_ERROR("Failed to open %s: %s", tmp_path.c_str(), strerror(errno));
        return StoreStatus::IO_ERROR;
    }

    bool ok = fwrite(body.data(), 1, body.size(), fp) == body.size();
    ok = (fputc('\n', fp) != EOF) && ok;
    ok = (fflush(fp) == 0) && ok;
    ok = (fsync(fileno(fp)) == 0) && ok;
    if (fclose(fp) != 0) {
        ok = false;
    }

    if (!ok) {
        LOG_ERROR("Failed to write %s: %s", tmp_path.c_str(), strerror(errno));
        unlink(tmp_path.c_str());
        return StoreStatus::IO_ERROR;
    }

    if (rename(tmp_path.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Failed to rename %s: %s", tmp_path.c_str(), strerror(errno));
        unlink(tmp_path.c_str());
        return StoreStatus::IO_ERROR;
    }
    return StoreStatus::OK;
}

StoreStatus EvidenceStore::readDocument(const std::string& path, std::string* body) const noexcept {
    FILE* fp = fopen(path.c_str(), "rb");
    if (!fp) {
        return errno == ENOENT ? StoreStatus::NOT_FOUND : StoreStatus::IO_ERROR;
    }

    try {
        body->clear();
        char chunk[8192];
        size_t n;
        while ((n = fread(chunk, 1, sizeof(chunk), fp)) > 0) {
            body->append(chunk, n);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read %s: %s", path.c_str(), e.what());
        fclose(fp);
        return StoreStatus::IO_ERROR;
    }

    bool failed = ferror(fp) != 0;
    fclose(fp);
    return failed ? StoreStatus::IO_ERROR : StoreStatus::OK;
}

StoreStatus EvidenceStore::saveCapture(const CaptureSession& session, std::string* path_out) noexcept {
    if (!isSafeId(session.session_id)) {
        LOG_ERROR("Refusing to save capture with invalid session id");
        return StoreStatus::IO_ERROR;
    }
    if (!initialize()) {
        return StoreStatus::IO_ERROR;
    }

    std::string body;
    if (!serializeCapture(session, &body)) {
        return StoreStatus::IO_ERROR;
    }

    try {
        std::string path = evidence_dir_ + "/session_" + session.session_id + ".json";
        StoreStatus status = writeDocument(path, body);
        if (status == StoreStatus::OK) {
            LOG_INFO("Saved capture %s (%zu bytes)", session.session_id.c_str(), body.size());
            if (path_out) {
                *path_out = path;
            }
        }
        return status;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save capture %s: %s", session.session_id.c_str(), e.what());
        return StoreStatus::IO_ERROR;
    }
}

StoreStatus EvidenceStore::saveImportedLog(const ImportedLog& log, std::string* path_out) noexcept {
    if (!isSafeId(log.session_id)) {
        LOG_ERROR("Refusing to save imported log with invalid session id");
        return StoreStatus::IO_ERROR;
    }
    if (!initialize()) {
        return StoreStatus::IO_ERROR;
    }

    try {
        ImportedLog record = log;
        record.metadata["imported"] = true;

        std::string body;
        if (!serializeImportedLog(record, &body)) {
            return StoreStatus::IO_ERROR;
        }

        std::string path = evidence_dir_ + "/log_" + log.session_id + ".json";
        StoreStatus status = writeDocument(path, body);
        if (status == StoreStatus::OK) {
            LOG_INFO("Saved imported log %s (%zu bytes)", log.session_id.c_str(), body.size());
            if (path_out) {
                *path_out = path;
            }
        }
        return status;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save imported log %s: %s", log.session_id.c_str(), e.what());
        return StoreStatus::IO_ERROR;
    }
}

StoreStatus EvidenceStore::saveContext(const ContextSession& context, std::string* path_out) noexcept {
    if (!isSafeId(context.session_id)) {
        LOG_ERROR("Refusing to save context with invalid session id");
        return StoreStatus::IO_ERROR;
    }
    if (!initialize()) {
        return StoreStatus::IO_ERROR;
    }

    std::string body;
    if (!serializeContext(context, &body)) {
        return StoreStatus::IO_ERROR;
    }

    try {
        std::string path = context_dir_ + "/context_" + context.session_id + ".json";
        StoreStatus status = writeDocument(path, body);
        if (status == StoreStatus::OK) {
            LOG_INFO("Saved context %s (%zu messages)", context.session_id.c_str(), context.messages.size());
            if (path_out) {
                *path_out = path;
            }
        }
        return status;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save context %s: %s", context.session_id.c_str(), e.what());
        return StoreStatus::IO_ERROR;
    }
}

std::vector<EvidenceSummary> EvidenceStore::listSessions() const noexcept {
    std::vector<EvidenceSummary> sessions;
    try {
        std::error_code ec;
        if (!fs::is_directory(evidence_dir_, ec)) {
            return sessions;
        }

        for (const auto& entry : fs::directory_iterator(evidence_dir_, ec)) {
            std::string name = entry.path().filename().string();
            if (entry.path().extension() != ".json" ||
                (!startsWith(name, "session_") && !startsWith(name, "log_"))) {
                continue;
            }

            std::string body;
            EvidenceRecord record;
            if (readDocument(entry.path().string(), &body) != StoreStatus::OK ||
                !parseEvidence(body, &record)) {
                LOG_WARN("Skipping unreadable evidence file %s", name.c_str());
                continue;
            }

            EvidenceSummary summary;
            summary.session_id = record.sessionId();
            summary.type = record.type;
            summary.timestamp = record.timestamp();
            summary.file = entry.path().string();
            if (record.type == RecordType::COMMAND) {
                summary.command_or_source = record.capture.command;
                summary.has_exit_code = true;
                summary.exit_code = record.capture.exit_code;
            } else {
                summary.command_or_source = record.log.source_file;
            }
            sessions.push_back(std::move(summary));
        }
        if (ec) {
            LOG_WARN("Evidence listing incomplete: %s", ec.message().c_str());
        }

        std::sort(sessions.begin(), sessions.end(),
                  [](const EvidenceSummary& a, const EvidenceSummary& b) {
                      if (a.timestamp != b.timestamp) {
                          return a.timestamp > b.timestamp;
                      }
                      return a.file > b.file;
                  });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list evidence: %s", e.what());
    }
    return sessions;
}

StoreStatus EvidenceStore::loadRecord(const std::string& session_id, EvidenceRecord* out) const noexcept {
    if (!isSafeId(session_id) || !out) {
        return StoreStatus::NOT_FOUND;
    }

    try {
        for (const char* prefix : {"/session_", "/log_"}) {
            std::string path = evidence_dir_ + prefix + session_id + ".json";
            std::string body;
            StoreStatus status = readDocument(path, &body);
            if (status == StoreStatus::NOT_FOUND) {
                continue;
            }
            if (status != StoreStatus::OK) {
                return status;
            }
            if (!parseEvidence(body, out)) {
                LOG_WARN("Evidence file %s is not valid JSON", path.c_str());
                return StoreStatus::PARSE_ERROR;
            }
            return StoreStatus::OK;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load evidence %s: %s", session_id.c_str(), e.what());
        return StoreStatus::IO_ERROR;
    }
    return StoreStatus::NOT_FOUND;
}

std::vector<ContextSummary> EvidenceStore::listContexts() const noexcept {
    std::vector<ContextSummary> contexts;
    try {
        std::error_code ec;
        if (!fs::is_directory(context_dir_, ec)) {
            return contexts;
        }

        for (const auto& entry : fs::directory_iterator(context_dir_, ec)) {
            std::string name = entry.path().filename().string();
            if (entry.path().extension() != ".json" || !startsWith(name, "context_")) {
                continue;
            }

            std::string body;
            ContextSession context;
            if (readDocument(entry.path().string(), &body) != StoreStatus::OK ||
                !parseContext(body, &context)) {
                LOG_WARN("Skipping unreadable context file %s", name.c_str());
                continue;
            }

            ContextSummary summary;
            summary.session_id = context.session_id;
            summary.source = context.source;
            summary.title = context.title;
            summary.created_at = context.created_at;
            summary.message_count = context.messages.size();
            summary.file = entry.path().string();
            contexts.push_back(std::move(summary));
        }

        std::sort(contexts.begin(), contexts.end(),
                  [](const ContextSummary& a, const ContextSummary& b) {
                      if (a.created_at != b.created_at) {
                          return a.created_at > b.created_at;
                      }
                      return a.file > b.file;
                  });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list contexts: %s", e.what());
    }
    return contexts;
}

StoreStatus EvidenceStore::loadContext(const std::string& session_id, ContextSession* out) const noexcept {
    if (!isSafeId(session_id) || !out) {
        return StoreStatus::NOT_FOUND;
    }

    try {
        std::string path = context_dir_ + "/context_" + session_id + ".json";
        std::string body;
        StoreStatus status = readDocument(path, &body);
        if (status != StoreStatus::OK) {
            return status;
        }
        if (!parseContext(body, out)) {
            LOG_WARN("Context file %s is not valid JSON", path.c_str());
            return StoreStatus::PARSE_ERROR;
        }
        return StoreStatus::OK;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load context %s: %s", session_id.c_str(), e.what());
        return StoreStatus::IO_ERROR;
    }
}

} // namespace Trace::Storage
