#include "capture/log_import.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <memory>
#include <sys/stat.h>

namespace Trace::Capture {

ImportStatus importLogFile(const std::string& path, Storage::EvidenceStore& store,
                           ImportResult* result) noexcept {
    if (!result) {
        return ImportStatus::READ_ERROR;
    }

    struct stat st{};
    if (path.empty() || stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return ImportStatus::FILE_NOT_FOUND;
    }

    try {
        *result = ImportResult{};
        auto& log = result->log;

        std::unique_ptr<FILE, int (*)(FILE*)> fp(fopen(path.c_str(), "rb"), fclose);
        if (!fp) {
            LOG_ERROR("Cannot open log file: %s", strerror(errno));
            return ImportStatus::READ_ERROR;
        }
        char chunk[8192];
        size_t n;
        while ((n = fread(chunk, 1, sizeof(chunk), fp.get())) > 0) {
            log.content.append(chunk, n);
        }
        if (ferror(fp.get()) != 0) {
            LOG_ERROR("Read error on log file");
            return ImportStatus::READ_ERROR;
        }

        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        log.source_file = ec ? path : absolute.lexically_normal().string();

        log.session_id = store.generateSessionId();
        if (log.session_id.empty()) {
            return ImportStatus::PERSIST_FAILED;
        }

        char timestamp[64];
        if (Common::getIso8601Now(timestamp, sizeof(timestamp))) {
            log.timestamp = timestamp;
        }

        Storage::StoreStatus status = store.saveImportedLog(log, &result->evidence_path);
        if (status != Storage::StoreStatus::OK) {
            LOG_ERROR("Imported log %s not saved: %s", log.session_id.c_str(),
                      Storage::storeStatusToString(status));
            return ImportStatus::PERSIST_FAILED;
        }

        LOG_INFO("Imported log %s (%zu bytes)", log.session_id.c_str(), log.content.size());
        return ImportStatus::OK;
    } catch (const std::exception& e) {
        LOG_ERROR("Log import failed: %s", e.what());
        return ImportStatus::READ_ERROR;
    }
}

} // namespace Trace::Capture
