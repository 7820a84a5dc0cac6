#include "config/config_manager.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Trace {

// Static member definitions
TraceConfig ConfigManager::config_{};
bool ConfigManager::initialized_ = false;

namespace {

constexpr const char* KNOWN_KEYS[] = {
    "MODEL",
    "API_KEY_ENV",
    "MAX_EVIDENCE_LINES",
    "MAX_CONTEXT_CHARS",
    "MAX_DIFF_CHARS",
    "MAX_EVIDENCE_SESSIONS",
    "MAX_CONTEXT_SESSIONS",
    "LOG_LEVEL",
    "FILE_LOGGING",
    nullptr
};

// Tried in order when API_KEY_ENV is not configured
constexpr const char* FALLBACK_KEY_ENVS[] = {
    "GEMINI_API_KEY",
    "GOOGLE_API_KEY",
    "OPENAI_API_KEY",
    "ANTHROPIC_API_KEY",
    "LITELLM_API_KEY",
};

// In-place whitespace trim, returns the new start
auto trim(char* s) noexcept -> char* {
    while (*s && std::isspace(static_cast<unsigned char>(*s))) {
        ++s;
    }
    size_t len = strlen(s);
    while (len > 0 && std::isspace(static_cast<unsigned char>(s[len - 1]))) {
        s[--len] = '\0';
    }
    return s;
}

auto copyField(char* dst, size_t dst_size, const char* src) noexcept -> bool {
    size_t len = strlen(src);
    if (len >= dst_size) {
        return false;
    }
    memcpy(dst, src, len + 1);
    return true;
}

auto parsePositive(const char* value, uint32_t* out) noexcept -> bool {
    if (!value || !*value) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = strtoul(value, &end, 10);
    if (errno != 0 || *end != '\0' || parsed == 0 || parsed > UINT32_MAX || value[0] == '-') {
        return false;
    }
    *out = static_cast<uint32_t>(parsed);
    return true;
}

auto parseBool(const char* value, bool* out) noexcept -> bool {
    if (strcasecmp(value, "true") == 0 || strcasecmp(value, "1") == 0 ||
        strcasecmp(value, "yes") == 0 || strcasecmp(value, "on") == 0) {
        *out = true;
        return true;
    }
    if (strcasecmp(value, "false") == 0 || strcasecmp(value, "0") == 0 ||
        strcasecmp(value, "no") == 0 || strcasecmp(value, "off") == 0) {
        *out = false;
        return true;
    }
    return false;
}

} // namespace

auto ConfigManager::init(const char* base_dir) noexcept -> bool {
    if (initialized_) {
        return true;
    }

    const char* base = base_dir;
    if (!base || !base[0]) {
        base = EnvLoader::getEnv("TRACE_BASE_DIR", ".");
    }

    if (!buildPaths(base)) {
        fprintf(stderr, "Base directory path too long: %s\n", base);
        return false;
    }

    // .env first so it can feed TRACE_LOG_LEVEL and the key variables
    if (access(config_.env_file, R_OK) == 0) {
        if (!EnvLoader::loadFromFile(config_.env_file)) {
            fprintf(stderr, "Warning: no variables loaded from %s\n", config_.env_file);
        }
    }

    if (!loadFromFile(config_.config_file)) {
        fprintf(stderr, "Warning: some settings in %s were ignored\n", config_.config_file);
    }

    const char* level_override = EnvLoader::getEnv("TRACE_LOG_LEVEL");
    if (level_override && level_override[0]) {
        if (!setValue("LOG_LEVEL", level_override)) {
            fprintf(stderr, "Warning: ignoring TRACE_LOG_LEVEL=%s\n", level_override);
        }
    }

    config_.is_valid = true;
    initialized_ = true;
    return true;
}

auto ConfigManager::reset() noexcept -> void {
    config_ = TraceConfig{};
    initialized_ = false;
}

auto ConfigManager::buildPaths(const char* base_dir) noexcept -> bool {
    config_ = TraceConfig{};
    copyField(config_.model, sizeof(config_.model), DEFAULT_MODEL);

    // Drop a trailing slash so joined paths stay clean
    char base[512];
    if (!copyField(base, sizeof(base), base_dir)) {
        return false;
    }
    size_t base_len = strlen(base);
    while (base_len > 1 && base[base_len - 1] == '/') {
        base[--base_len] = '\0';
    }

    struct Target { char* dst; size_t size; const char* suffix; };
    const Target targets[] = {
        {config_.base_dir, sizeof(config_.base_dir), ""},
        {config_.ai_dir, sizeof(config_.ai_dir), "/.ai"},
        {config_.evidence_dir, sizeof(config_.evidence_dir), "/.ai/evidence"},
        {config_.context_dir, sizeof(config_.context_dir), "/.ai/context"},
        {config_.logs_dir, sizeof(config_.logs_dir), "/.ai/logs"},
        {config_.config_file, sizeof(config_.config_file), "/.ai/config.txt"},
        {config_.env_file, sizeof(config_.env_file), "/.env"},
    };

    for (const auto& t : targets) {
        int written = snprintf(t.dst, t.size, "%s%s", base, t.suffix);
        if (written < 0 || static_cast<size_t>(written) >= t.size) {
            return false;
        }
    }
    return true;
}

auto ConfigManager::loadFromFile(const char* path) noexcept -> bool {
    if (!path || !path[0]) {
        return false;
    }

    FILE* fp = fopen(path, "r");
    if (!fp) {
        // No config file means defaults
        return errno == ENOENT;
    }

    char line[1024];
    bool all_ok = true;
    while (fgets(line, sizeof(line), fp)) {
        // Skip comments and empty lines
        char* start = trim(line);
        if (start[0] == '#' || start[0] == '\0') {
            continue;
        }

        if (!parseLine(start)) {
            all_ok = false;
        }
    }

    fclose(fp);
    return all_ok;
}

auto ConfigManager::parseLine(const char* line) noexcept -> bool {
    char buffer[1024];
    if (!copyField(buffer, sizeof(buffer), line)) {
        return false;
    }

    char* equals = strchr(buffer, '=');
    if (!equals) {
        LOG_WARN("Config line without '=' ignored");
        return false;
    }
    *equals = '\0';

    char* key = trim(buffer);
    char* value = trim(equals + 1);

    // Quoted values keep their inner text
    size_t vlen = strlen(value);
    if (vlen >= 2 && (value[0] == '"' || value[0] == '\'') && value[vlen - 1] == value[0]) {
        value[vlen - 1] = '\0';
        ++value;
    }

    return setValue(key, value);
}

auto ConfigManager::setValue(const char* key, const char* value) noexcept -> bool {
    if (!key || !value) {
        return false;
    }

    bool ok = false;
    if (strcmp(key, "MODEL") == 0) {
        ok = value[0] != '\0' && copyField(config_.model, sizeof(config_.model), value);
    } else if (strcmp(key, "API_KEY_ENV") == 0) {
        ok = copyField(config_.api_key_env, sizeof(config_.api_key_env), value);
    } else if (strcmp(key, "MAX_EVIDENCE_LINES") == 0) {
        ok = parsePositive(value, &config_.max_evidence_lines);
    } else if (strcmp(key, "MAX_CONTEXT_CHARS") == 0) {
        ok = parsePositive(value, &config_.max_context_chars);
    } else if (strcmp(key, "MAX_DIFF_CHARS") == 0) {
        ok = parsePositive(value, &config_.max_diff_chars);
    } else if (strcmp(key, "MAX_EVIDENCE_SESSIONS") == 0) {
        ok = parsePositive(value, &config_.max_evidence_sessions);
    } else if (strcmp(key, "MAX_CONTEXT_SESSIONS") == 0) {
        ok = parsePositive(value, &config_.max_context_sessions);
    } else if (strcmp(key, "LOG_LEVEL") == 0) {
        Common::Logger::Level level;
        if (Common::parseLogLevel(value, &level)) {
            // Stored upper-case so the file round-trips
            char upper[sizeof(config_.log_level)];
            size_t i = 0;
            for (; value[i] && i < sizeof(upper) - 1; ++i) {
                upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[i])));
            }
            upper[i] = '\0';
            ok = copyField(config_.log_level, sizeof(config_.log_level), upper);
        }
    } else if (strcmp(key, "FILE_LOGGING") == 0) {
        ok = parseBool(value, &config_.file_logging);
    } else {
        LOG_WARN("Unknown config key: %s", key);
        return false;
    }

    if (!ok) {
        LOG_WARN("Invalid value for config key %s", key);
    }
    return ok;
}

auto ConfigManager::getValue(const char* key, char* buffer, size_t len) noexcept -> bool {
    if (!key || !buffer || len == 0) {
        return false;
    }

    int written = -1;
    if (strcmp(key, "MODEL") == 0) {
        written = snprintf(buffer, len, "%s", config_.model);
    } else if (strcmp(key, "API_KEY_ENV") == 0) {
        written = snprintf(buffer, len, "%s", config_.api_key_env);
    } else if (strcmp(key, "MAX_EVIDENCE_LINES") == 0) {
        written = snprintf(buffer, len, "%u", config_.max_evidence_lines);
    } else if (strcmp(key, "MAX_CONTEXT_CHARS") == 0) {
        written = snprintf(buffer, len, "%u", config_.max_context_chars);
    } else if (strcmp(key, "MAX_DIFF_CHARS") == 0) {
        written = snprintf(buffer, len, "%u", config_.max_diff_chars);
    } else if (strcmp(key, "MAX_EVIDENCE_SESSIONS") == 0) {
        written = snprintf(buffer, len, "%u", config_.max_evidence_sessions);
    } else if (strcmp(key, "MAX_CONTEXT_SESSIONS") == 0) {
        written = snprintf(buffer, len, "%u", config_.max_context_sessions);
    } else if (strcmp(key, "LOG_LEVEL") == 0) {
        written = snprintf(buffer, len, "%s", config_.log_level);
    } else if (strcmp(key, "FILE_LOGGING") == 0) {
        written = snprintf(buffer, len, "%s", config_.file_logging ? "true" : "false");
    }

    return written >= 0 && static_cast<size_t>(written) < len;
}

auto ConfigManager::knownKeys() noexcept -> const char* const* {
    return KNOWN_KEYS;
}

auto ConfigManager::saveToFile(const char* path) noexcept -> bool {
    if (!path || !path[0]) {
        return false;
    }

    // Parent is normally <base>/.ai
    if (mkdir(config_.ai_dir, 0755) != 0 && errno != EEXIST) {
        LOG_ERROR("Failed to create %s: %s", config_.ai_dir, strerror(errno));
        return false;
    }

    char tmp_path[600];
    int n = snprintf(tmp_path, sizeof(tmp_path), "%s.tmp", path);
    if (n < 0 || static_cast<size_t>(n) >= sizeof(tmp_path)) {
        return false;
    }

    FILE* fp = fopen(tmp_path, "w");
    if (!fp) {
        LOG_ERROR("Failed to open %s: %s", tmp_path, strerror(errno));
        return false;
    }

    bool ok = fprintf(fp, "# trace configuration\n") > 0;
    char value[256];
    for (const char* const* key = KNOWN_KEYS; *key && ok; ++key) {
        if (getValue(*key, value, sizeof(value))) {
            ok = fprintf(fp, "%s=%s\n", *key, value) > 0;
        }
    }

    if (fclose(fp) != 0) {
        ok = false;
    }

    if (!ok || rename(tmp_path, path) != 0) {
        LOG_ERROR("Failed to write config file %s", path);
        unlink(tmp_path);
        return false;
    }

    LOG_INFO("Config written to %s", path);
    return true;
}

auto ConfigManager::resolveApiKeyEnv() noexcept -> const char* {
    if (config_.api_key_env[0]) {
        const char* value = EnvLoader::getEnv(config_.api_key_env);
        return (value && value[0]) ? config_.api_key_env : nullptr;
    }

    for (const char* name : FALLBACK_KEY_ENVS) {
        const char* value = EnvLoader::getEnv(name);
        if (value && value[0]) {
            return name;
        }
    }
    return nullptr;
}

auto ConfigManager::getLogFilePath(char* buffer, size_t len) noexcept -> bool {
    if (!initialized_ || !buffer || len == 0) {
        return false;
    }

    char timestamp[32];
    if (!Common::FastDateTime::formatFileStamp(timestamp, sizeof(timestamp))) {
        return false;
    }

    // Format: <base>/.ai/logs/trace_YYYYMMDD_HHMMSS.log
    int written = snprintf(buffer, len, "%s/trace_%s.log", config_.logs_dir, timestamp);

    return written > 0 && static_cast<size_t>(written) < len;
}

// ============================================================================
// EnvLoader Implementation
// ============================================================================

auto EnvLoader::loadFromFile(const char* filepath) noexcept -> bool {
    FILE* fp = fopen(filepath, "r");
    if (!fp) {
        return false;
    }

    char line[1024];
    int loaded_count = 0;

    while (fgets(line, sizeof(line), fp)) {
        // Skip comments and empty lines
        if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
            continue;
        }

        if (setEnvVar(line)) {
            loaded_count++;
        }
    }

    fclose(fp);
    return loaded_count > 0;
}

auto EnvLoader::setEnvVar(const char* line) noexcept -> bool {
    char buffer[1024];
    if (!copyField(buffer, sizeof(buffer), line)) {
        return false;
    }

    char* equals = strchr(buffer, '=');
    if (!equals) {
        return false;
    }
    *equals = '\0';

    char* key = trim(buffer);
    if (strncmp(key, "export ", 7) == 0) {
        key = trim(key + 7);
    }
    if (!key[0]) {
        return false;
    }

    char* value = trim(equals + 1);
    size_t vlen = strlen(value);
    if (vlen >= 2 && (value[0] == '"' || value[0] == '\'') && value[vlen - 1] == value[0]) {
        value[vlen - 1] = '\0';
        ++value;
    }

    // Variables already in the environment take precedence
    return setenv(key, value, 0) == 0;
}

auto EnvLoader::getEnv(const char* key, const char* default_val) noexcept -> const char* {
    const char* value = getenv(key);
    return value ? value : default_val;
}

} // namespace Trace
