#include "context/context_ingest.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <sys/stat.h>

namespace Trace::Context {

namespace {

constexpr size_t MAX_TITLE_LENGTH = 80;

std::string trimmed(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

} // namespace

const char* ingestStatusToString(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::OK: return "OK";
        case IngestStatus::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case IngestStatus::READ_ERROR: return "READ_ERROR";
        case IngestStatus::EMPTY_INPUT: return "EMPTY_INPUT";
        case IngestStatus::PERSIST_FAILED: return "PERSIST_FAILED";
    }
    return "UNKNOWN";
}

ContextIngestor::ContextIngestor(Storage::EvidenceStore& store,
                                 const Redaction::RedactionEngine& engine) noexcept
    : store_(store), engine_(engine) {
}

std::string ContextIngestor::extractTitle(const std::string& text) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = trimmed(text.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if (!line.empty()) {
            if (line.size() > MAX_TITLE_LENGTH) {
                return line.substr(0, MAX_TITLE_LENGTH) + "...";
            }
            return line;
        }
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    return std::string();
}

IngestStatus ContextIngestor::ingest(const std::string& text, const std::string& source,
                                     const char* method, IngestResult* result) {
    *result = IngestResult{};
    if (trimmed(text).empty()) {
        return IngestStatus::EMPTY_INPUT;
    }

    // Nothing below this line touches the raw text
    Redaction::RedactionResult redacted = engine_.redact(text);

    auto& ctx = result->context;
    ctx.session_id = store_.generateSessionId();
    if (ctx.session_id.empty()) {
        return IngestStatus::PERSIST_FAILED;
    }
    ctx.source = source.empty() ? std::string("manual") : source;
    ctx.title = extractTitle(redacted.redacted_text);

    char created_at[64];
    if (Common::getIso8601Now(created_at, sizeof(created_at))) {
        ctx.created_at = created_at;
    }

    ctx.messages.push_back({"user", redacted.redacted_text});
    ctx.metadata["ingestion_method"] = std::string(method);
    ctx.metadata["redactions"] = static_cast<int64_t>(redacted.count);
    if (!redacted.skipped_patterns.empty()) {
        ctx.metadata["skipped_patterns"] = static_cast<int64_t>(redacted.skipped_patterns.size());
    }
    result->redactions = std::move(redacted.records);

    Storage::StoreStatus status = store_.saveContext(ctx, &result->path);
    if (status != Storage::StoreStatus::OK) {
        LOG_ERROR("Context %s not saved: %s", ctx.session_id.c_str(), Storage::storeStatusToString(status));
        return IngestStatus::PERSIST_FAILED;
    }

    LOG_INFO("Ingested context %s from %s (%zu redactions)", ctx.session_id.c_str(),
             ctx.source.c_str(), result->redactions.size());
    return IngestStatus::OK;
}

IngestStatus ContextIngestor::ingestText(const std::string& text, const std::string& source,
                                         IngestResult* result) noexcept {
    if (!result) {
        return IngestStatus::READ_ERROR;
    }
    try {
        return ingest(text, source, "text_paste", result);
    } catch (const std::exception& e) {
        LOG_ERROR("Context ingestion failed: %s", e.what());
        return IngestStatus::READ_ERROR;
    }
}

IngestStatus ContextIngestor::ingestFile(const std::string& path, const std::string& source,
                                         IngestResult* result) noexcept {
    if (!result) {
        return IngestStatus::READ_ERROR;
    }

    struct stat st{};
    if (path.empty() || stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return IngestStatus::FILE_NOT_FOUND;
    }

    try {
        std::unique_ptr<FILE, int (*)(FILE*)> fp(fopen(path.c_str(), "rb"), fclose);
        if (!fp) {
            LOG_ERROR("Cannot open context file: %s", strerror(errno));
            return IngestStatus::READ_ERROR;
        }

        std::string text;
        char chunk[8192];
        size_t n;
        while ((n = fread(chunk, 1, sizeof(chunk), fp.get())) > 0) {
            text.append(chunk, n);
        }
        if (ferror(fp.get()) != 0) {
            return IngestStatus::READ_ERROR;
        }

        return ingest(text, source, "file", result);
    } catch (const std::exception& e) {
        LOG_ERROR("Context ingestion failed: %s", e.what());
        return IngestStatus::READ_ERROR;
    }
}

} // namespace Trace::Context
