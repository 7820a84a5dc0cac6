#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace Trace {

constexpr const char* DEFAULT_MODEL = "gemini/gemini-1.5-pro";

// Fixed-size configuration structure - no dynamic allocation
struct TraceConfig {
    // Directory layout under the base directory
    char base_dir[512]{};
    char ai_dir[512]{};
    char evidence_dir[512]{};
    char context_dir[512]{};
    char logs_dir[512]{};
    char config_file[512]{};
    char env_file[512]{};

    // Model selection (the key itself is never stored)
    char model[128]{};
    char api_key_env[128]{};

    // Evidence and context budgets
    uint32_t max_evidence_lines{200};
    uint32_t max_context_chars{10000};
    uint32_t max_diff_chars{50000};
    uint32_t max_evidence_sessions{5};
    uint32_t max_context_sessions{3};

    // Runtime settings
    char log_level[16]{"INFO"};
    bool file_logging{true};

    bool is_valid{false};
};

class ConfigManager {
private:
    static TraceConfig config_;
    static bool initialized_;

    // Parse a single KEY=value line; false for malformed or rejected lines
    static auto parseLine(const char* line) noexcept -> bool;

    static auto buildPaths(const char* base_dir) noexcept -> bool;

public:
    // Resolve the base directory (argument, TRACE_BASE_DIR, or "."),
    // load <base>/.env and <base>/.ai/config.txt when present
    [[nodiscard]] static auto init(const char* base_dir = nullptr) noexcept -> bool;

    // Back to defaults; the next init() reloads everything
    static auto reset() noexcept -> void;

    // Read KEY=value lines from a file; a missing file is not an error
    [[nodiscard]] static auto loadFromFile(const char* path) noexcept -> bool;

    // Write every known key back out
    [[nodiscard]] static auto saveToFile(const char* path) noexcept -> bool;

    // Validate and apply one setting; unknown keys and bad numbers are rejected
    [[nodiscard]] static auto setValue(const char* key, const char* value) noexcept -> bool;

    // Render one setting as text; false for unknown keys
    [[nodiscard]] static auto getValue(const char* key, char* buffer, size_t len) noexcept -> bool;

    // Known keys in file order, terminated by nullptr
    [[nodiscard]] static auto knownKeys() noexcept -> const char* const*;

    [[nodiscard]] static auto getConfig() noexcept -> const TraceConfig& {
        return config_;
    }

    [[nodiscard]] static auto getBaseDir() noexcept -> const char* {
        return config_.base_dir;
    }

    [[nodiscard]] static auto getEvidenceDir() noexcept -> const char* {
        return config_.evidence_dir;
    }

    [[nodiscard]] static auto getContextDir() noexcept -> const char* {
        return config_.context_dir;
    }

    [[nodiscard]] static auto getLogsDir() noexcept -> const char* {
        return config_.logs_dir;
    }

    [[nodiscard]] static auto getConfigFile() noexcept -> const char* {
        return config_.config_file;
    }

    [[nodiscard]] static auto getMaxEvidenceLines() noexcept -> uint32_t {
        return config_.max_evidence_lines;
    }

    [[nodiscard]] static auto isInitialized() noexcept -> bool {
        return initialized_ && config_.is_valid;
    }

    // Name of the environment variable that would supply the model key,
    // nullptr when none is set. The value is never read out.
    [[nodiscard]] static auto resolveApiKeyEnv() noexcept -> const char*;

    // <logs_dir>/trace_YYYYMMDD_HHMMSS.log
    static auto getLogFilePath(char* buffer, size_t len) noexcept -> bool;
};

// Helper class to load .env file
class EnvLoader {
public:
    // Load environment variables from file; existing variables win
    [[nodiscard]] static auto loadFromFile(const char* filepath) noexcept -> bool;

    // Get environment variable with fallback
    [[nodiscard]] static auto getEnv(const char* key, const char* default_val = nullptr) noexcept -> const char*;

private:
    // Parse and set a single environment variable
    static auto setEnvVar(const char* line) noexcept -> bool;
};

} // namespace Trace
