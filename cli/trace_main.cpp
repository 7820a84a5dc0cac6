#include "capture/log_import.h"
#include "capture/output_sink.h"
#include "capture/process_capture.h"
#include "common/digest.h"
#include "common/logging.h"
#include "config/config_manager.h"
#include "context/context_ingest.h"
#include "redaction/redaction_engine.h"
#include "review/evidence_gatherer.h"
#include "storage/evidence_store.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char* TRACE_VERSION = "0.3.0";

// Exit codes beyond the child's own
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_GENERIC = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_PERSIST = 74;    // EX_IOERR

constexpr size_t LIST_LABEL_WIDTH = 60;

void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s <command> [OPTIONS]

Trace - Evidence capture and sanitization for code review

COMMANDS:
    run [--quiet] [--cwd DIR] [--] <command...>
                            Run a shell command, mirror its output live and
                            save stdout/stderr/exit code as evidence
    capture --log <file>    Import an existing log file as evidence
    list                    List captured evidence, newest first
    show <session_id>       Print one evidence record
    verify <session_id>     Check stored output against its SHA-256 digests
    evidence [--session ID]... [--files a,b,...] [--max-lines N] [--context]
                            Print compressed, redacted evidence for review
    redact [--scan] [file]  Redact secrets from a file or stdin
    context add [--source NAME] [--file F]
                            Ingest AI session text (stdin when no file)
    context list            List ingested context sessions
    context show <id>       Print one context session
    config show             Print effective settings
    config set <KEY> <VALUE>
                            Validate and store one setting
    --version               Print version
    --help                  Show this help message

EXAMPLES:
    # Capture a failing test run
    %s run pytest -x tests/

    # Quiet mode keeps stdout free for a wrapping tool
    %s run --quiet -- make check

    # Review bundle for the last captures, ranked against changed files
    %s evidence --files src/parser.cpp,tests/test_parser.cpp

ENVIRONMENT:
    TRACE_BASE_DIR          Project directory holding .ai/ (default: .)
    TRACE_LOG_LEVEL         DEBUG, INFO, WARN or ERROR

EXIT CODES:
    run      - exit code of the command (127 shell not found, 1 spawn/runtime error)
    74       - evidence could not be saved
    2        - invalid usage
    1        - other failures

)";

    fprintf(stdout, usage, program, program, program, program);
}

// Flushes and stops the async logger on every return path of main()
struct LoggingGuard {
    ~LoggingGuard() { Trace::Common::shutdownLogging(); }
};

bool setupRuntime() {
    if (!Trace::ConfigManager::init()) {
        fprintf(stderr, "Error: invalid configuration\n");
        return false;
    }

    const auto& config = Trace::ConfigManager::getConfig();
    if (config.file_logging) {
        char log_path[600];
        if (Trace::ConfigManager::getLogFilePath(log_path, sizeof(log_path)) &&
            Trace::Common::initLogging(log_path)) {
            Trace::Common::Logger::Level level;
            if (Trace::Common::parseLogLevel(config.log_level, &level)) {
                Trace::Common::g_logger->setMinLevel(level);
            }
        }
        // A missing log file never stops a capture
    }
    return true;
}

bool readAll(FILE* in, std::string* out) {
    char chunk[8192];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), in)) > 0) {
        out->append(chunk, n);
    }
    return ferror(in) == 0;
}

bool readFileOrStdin(const char* path, std::string* out) {
    if (!path) {
        return readAll(stdin, out);
    }
    std::unique_ptr<FILE, int (*)(FILE*)> fp(fopen(path, "rb"), fclose);
    if (!fp) {
        return false;
    }
    return readAll(fp.get(), out);
}

bool parseSize(const char* text, size_t* out) {
    if (!text || !text[0]) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0' || value == 0 || text[0] == '-') {
        return false;
    }
    *out = static_cast<size_t>(value);
    return true;
}

std::vector<std::string> splitList(const char* text) {
    std::vector<std::string> parts;
    std::string current;
    for (const char* p = text; *p; ++p) {
        if (*p == ',') {
            if (!current.empty()) {
                parts.push_back(current);
            }
            current.clear();
        } else {
            current += *p;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string shortened(const std::string& text, size_t width) {
    std::string one_line = text.substr(0, text.find('\n'));
    if (one_line.size() > width) {
        return one_line.substr(0, width - 3) + "...";
    }
    return one_line;
}

const char* metaString(const Trace::Storage::Metadata& metadata, const char* key) {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return nullptr;
    }
    const auto* value = std::get_if<std::string>(&it->second);
    return value ? value->c_str() : nullptr;
}

bool metaFlag(const Trace::Storage::Metadata& metadata, const char* key) {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return false;
    }
    const auto* value = std::get_if<bool>(&it->second);
    return value && *value;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

int cmdRun(int argc, char* argv[], int first) {
    Trace::Capture::CaptureOptions options;

    int i = first;
    for (; i < argc; ++i) {
        if (std::strcmp(argv[i], "--quiet") == 0 || std::strcmp(argv[i], "-q") == 0) {
            options.quiet = true;
        }
        else if (std::strcmp(argv[i], "--cwd") == 0 && i + 1 < argc) {
            options.cwd = argv[++i];
        }
        else if (std::strcmp(argv[i], "--") == 0) {
            ++i;
            break;
        }
        else {
            break;
        }
    }

    for (; i < argc; ++i) {
        if (!options.command.empty()) {
            options.command += ' ';
        }
        options.command += argv[i];
    }

    if (options.command.empty()) {
        fprintf(stderr, "Error: no command given\n");
        return EXIT_USAGE;
    }

    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    if (!store.initialize()) {
        fprintf(stderr, "Error: cannot create %s\n", store.evidenceDir().c_str());
        return EXIT_PERSIST;
    }

    // Header and footer stay off stdout in quiet mode
    FILE* chrome = options.quiet ? stderr : stdout;
    if (!options.quiet) {
        fprintf(chrome, "● Recording  %s\n\n", options.command.c_str());
        fflush(chrome);
    }

    Trace::Capture::ConsoleSink sink;
    Trace::Capture::ProcessCapture capture(store, sink);
    Trace::Capture::CaptureResult result;
    Trace::Capture::CaptureStatus status = capture.run(options, &result);

    if (status == Trace::Capture::CaptureStatus::INVALID_ARGUMENT) {
        fprintf(stderr, "Error: invalid capture request\n");
        return EXIT_USAGE;
    }

    const auto& session = result.session;
    if (status == Trace::Capture::CaptureStatus::PERSIST_FAILED) {
        fprintf(stderr, "Error: failed to save evidence (%s)\n",
                Trace::Storage::storeStatusToString(result.store_status));
        fprintf(stderr, "Command exit code: %d\n", session.exit_code);
        return EXIT_PERSIST;
    }

    if (metaFlag(session.metadata, "interrupted")) {
        fprintf(stderr, "\nInterrupted, partial output saved\n");
    }

    if (!options.quiet) {
        if (session.exit_code == 0) {
            fprintf(chrome, "\n✓ Complete | %lldms | Session: %s\n",
                    static_cast<long long>(session.duration_ms), session.session_id.c_str());
        } else {
            fprintf(chrome, "\n✗ Exit %d | %lldms | Session: %s\n", session.exit_code,
                    static_cast<long long>(session.duration_ms), session.session_id.c_str());
        }
    }
    fprintf(chrome, "Evidence saved: %s\n", result.evidence_path.c_str());

    return session.exit_code;
}

// ---------------------------------------------------------------------------
// capture --log
// ---------------------------------------------------------------------------

int cmdCapture(int argc, char* argv[], int first) {
    const char* log_path = nullptr;
    for (int i = first; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_path = argv[++i];
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_USAGE;
        }
    }
    if (!log_path) {
        fprintf(stderr, "Error: capture needs --log <file>\n");
        return EXIT_USAGE;
    }

    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    if (!store.initialize()) {
        fprintf(stderr, "Error: cannot create %s\n", store.evidenceDir().c_str());
        return EXIT_PERSIST;
    }

    Trace::Capture::ImportResult result;
    switch (Trace::Capture::importLogFile(log_path, store, &result)) {
        case Trace::Capture::ImportStatus::OK:
            break;
        case Trace::Capture::ImportStatus::FILE_NOT_FOUND:
            fprintf(stderr, "Error: Log file not found: %s\n", log_path);
            return EXIT_FAILURE_GENERIC;
        case Trace::Capture::ImportStatus::READ_ERROR:
            fprintf(stderr, "Error: cannot read %s\n", log_path);
            return EXIT_FAILURE_GENERIC;
        case Trace::Capture::ImportStatus::PERSIST_FAILED:
            fprintf(stderr, "Error: failed to save evidence\n");
            return EXIT_PERSIST;
    }

    printf("✓ Imported %s | %zu bytes | Session: %s\n", result.log.source_file.c_str(),
           result.log.content.size(), result.log.session_id.c_str());
    printf("Evidence saved: %s\n", result.evidence_path.c_str());
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// list / show / verify
// ---------------------------------------------------------------------------

int cmdList() {
    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    auto sessions = store.listSessions();
    if (sessions.empty()) {
        printf("No evidence captured yet. Run 'trace run <command>' to start.\n");
        return EXIT_OK;
    }

    // Command lines often carry tokens; never echo them unredacted
    const auto& engine = Trace::Redaction::defaultEngine();

    printf("%-10s  %-5s  %-24s  %s\n", "SESSION", "EXIT", "TIMESTAMP", "COMMAND");
    for (const auto& s : sessions) {
        char exit_text[16];
        if (s.has_exit_code) {
            snprintf(exit_text, sizeof(exit_text), "%d", s.exit_code);
        } else {
            snprintf(exit_text, sizeof(exit_text), "log");
        }
        std::string label = engine.redact(s.command_or_source).redacted_text;
        printf("%-10s  %-5s  %-24s  %s\n", s.session_id.c_str(), exit_text,
               s.timestamp.c_str(), shortened(label, LIST_LABEL_WIDTH).c_str());
    }
    printf("\n%zu record(s)\n", sessions.size());
    return EXIT_OK;
}

int loadOrReport(const Trace::Storage::EvidenceStore& store, const char* id,
                 Trace::Storage::EvidenceRecord* record) {
    Trace::Storage::StoreStatus status = store.loadRecord(id, record);
    if (status == Trace::Storage::StoreStatus::OK) {
        return EXIT_OK;
    }
    if (status == Trace::Storage::StoreStatus::NOT_FOUND) {
        fprintf(stderr, "Error: Session not found: %s\n", id);
    } else {
        fprintf(stderr, "Error: cannot load session %s (%s)\n", id,
                Trace::Storage::storeStatusToString(status));
    }
    return EXIT_FAILURE_GENERIC;
}

int cmdShow(const char* id) {
    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    Trace::Storage::EvidenceRecord record;
    int rc = loadOrReport(store, id, &record);
    if (rc != EXIT_OK) {
        return rc;
    }

    if (record.type == Trace::Storage::RecordType::COMMAND) {
        const auto& c = record.capture;
        printf("Session:   %s\n", c.session_id.c_str());
        printf("Command:   %s\n", c.command.c_str());
        if (!c.cwd.empty()) {
            printf("Directory: %s\n", c.cwd.c_str());
        }
        printf("Exit code: %d\n", c.exit_code);
        printf("Started:   %s\n", c.started_at.c_str());
        printf("Duration:  %lldms\n", static_cast<long long>(c.duration_ms));
        printf("\n--- stdout (%zu bytes) ---\n", c.stdout_data.size());
        fwrite(c.stdout_data.data(), 1, c.stdout_data.size(), stdout);
        printf("\n--- stderr (%zu bytes) ---\n", c.stderr_data.size());
        fwrite(c.stderr_data.data(), 1, c.stderr_data.size(), stdout);
        printf("\n");
    } else {
        const auto& l = record.log;
        printf("Session:   %s\n", l.session_id.c_str());
        printf("Source:    %s\n", l.source_file.c_str());
        printf("Imported:  %s\n", l.timestamp.c_str());
        printf("\n--- content (%zu bytes) ---\n", l.content.size());
        fwrite(l.content.data(), 1, l.content.size(), stdout);
        printf("\n");
    }
    return EXIT_OK;
}

// Compare one stored stream against the digest recorded at capture time
bool verifyStream(const char* name, const std::string& data, const char* expected) {
    if (!expected) {
        printf("  %s: no digest recorded\n", name);
        return false;
    }
    char actual[Trace::Common::SHA256_HEX_LENGTH + 1];
    if (!Trace::Common::sha256Hex(data.data(), data.size(), actual, sizeof(actual))) {
        printf("  %s: digest unavailable\n", name);
        return false;
    }
    bool match = std::strcmp(actual, expected) == 0;
    printf("  %s: %s\n", name, match ? "OK" : "MISMATCH");
    return match;
}

int cmdVerify(const char* id) {
    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    Trace::Storage::EvidenceRecord record;
    int rc = loadOrReport(store, id, &record);
    if (rc != EXIT_OK) {
        return rc;
    }

    if (record.type != Trace::Storage::RecordType::COMMAND) {
        fprintf(stderr, "Error: %s is an imported log; only captures carry digests\n", id);
        return EXIT_FAILURE_GENERIC;
    }

    const auto& c = record.capture;
    printf("Verifying %s\n", c.session_id.c_str());
    bool stdout_ok = verifyStream("stdout", c.stdout_data, metaString(c.metadata, "stdout_sha256"));
    bool stderr_ok = verifyStream("stderr", c.stderr_data, metaString(c.metadata, "stderr_sha256"));

    if (stdout_ok && stderr_ok) {
        printf("✓ Evidence intact\n");
        return EXIT_OK;
    }
    if (metaFlag(c.metadata, "utf8_normalized")) {
        printf("Note: output was not valid UTF-8 and was normalised when saved\n");
    }
    printf("✗ Evidence does not match its recorded digests\n");
    return EXIT_FAILURE_GENERIC;
}

// ---------------------------------------------------------------------------
// evidence
// ---------------------------------------------------------------------------

int cmdEvidence(int argc, char* argv[], int first) {
    const auto& config = Trace::ConfigManager::getConfig();

    Trace::Review::EvidenceOptions evidence_options;
    evidence_options.max_sessions = config.max_evidence_sessions;
    evidence_options.max_lines = config.max_evidence_lines;
    evidence_options.max_chars = config.max_diff_chars;

    std::vector<std::string> files;
    bool with_context = false;

    for (int i = first; i < argc; ++i) {
        if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            evidence_options.session_ids.emplace_back(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--files") == 0 && i + 1 < argc) {
            files = splitList(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--max-lines") == 0 && i + 1 < argc) {
            if (!parseSize(argv[++i], &evidence_options.max_lines)) {
                fprintf(stderr, "Error: --max-lines needs a positive number\n");
                return EXIT_USAGE;
            }
        }
        else if (std::strcmp(argv[i], "--context") == 0) {
            with_context = true;
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_USAGE;
        }
    }

    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    Trace::Review::EvidenceGatherer gatherer(store, Trace::Redaction::defaultEngine());

    Trace::Review::GatheredText evidence = gatherer.gatherEvidence(evidence_options);
    for (const auto& id : evidence.missing_ids) {
        fprintf(stderr, "Warning: session %s not found\n", id.c_str());
    }
    printf("%s\n", evidence.text.c_str());
    if (evidence.truncated) {
        fprintf(stderr, "Note: evidence stopped at %zu characters\n", evidence_options.max_chars);
    }

    std::vector<Trace::Redaction::RedactionRecord> redactions = evidence.redactions;

    if (with_context) {
        Trace::Review::ContextOptions context_options;
        context_options.max_sessions = config.max_context_sessions;
        context_options.max_chars = config.max_context_chars;
        Trace::Review::GatheredText context = gatherer.gatherContext(context_options);
        printf("%s\n", context.text.c_str());
        redactions.insert(redactions.end(), context.redactions.begin(), context.redactions.end());
    }

    if (!files.empty()) {
        Trace::Triage::RelevanceMap scores = gatherer.rankFiles(evidence, files);
        std::vector<std::pair<std::string, double>> ranked(scores.begin(), scores.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        printf("\nFile relevance:\n");
        for (const auto& [file, score] : ranked) {
            printf("  %.2f  %s\n", score, file.c_str());
        }
    }

    Trace::Redaction::printRedactionWarning(redactions, stderr);
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// redact
// ---------------------------------------------------------------------------

int cmdRedact(int argc, char* argv[], int first) {
    bool scan_only = false;
    const char* path = nullptr;
    for (int i = first; i < argc; ++i) {
        if (std::strcmp(argv[i], "--scan") == 0) {
            scan_only = true;
        }
        else if (!path && argv[i][0] != '-') {
            path = argv[i];
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_USAGE;
        }
    }

    std::string text;
    if (!readFileOrStdin(path, &text)) {
        fprintf(stderr, "Error: cannot read %s\n", path ? path : "stdin");
        return EXIT_FAILURE_GENERIC;
    }

    const auto& engine = Trace::Redaction::defaultEngine();
    if (scan_only) {
        auto findings = engine.scan(text);
        if (findings.empty()) {
            printf("No secrets detected.\n");
            return EXIT_OK;
        }
        for (const auto& f : findings) {
            printf("%s: %s\n", f.pattern_name.c_str(), f.preview.c_str());
        }
        printf("\n%zu potential secret(s)\n", findings.size());
        return EXIT_OK;
    }

    Trace::Redaction::RedactionResult result = engine.redact(text);
    fwrite(result.redacted_text.data(), 1, result.redacted_text.size(), stdout);
    fflush(stdout);
    Trace::Redaction::printRedactionWarning(result.records, stderr);
    for (const auto& name : result.skipped_patterns) {
        fprintf(stderr, "Warning: pattern %s was skipped\n", name.c_str());
    }
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// context
// ---------------------------------------------------------------------------

int cmdContextAdd(int argc, char* argv[], int first) {
    std::string source;
    const char* file = nullptr;
    for (int i = first; i < argc; ++i) {
        if (std::strcmp(argv[i], "--source") == 0 && i + 1 < argc) {
            source = argv[++i];
        }
        else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            file = argv[++i];
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return EXIT_USAGE;
        }
    }

    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    if (!store.initialize()) {
        fprintf(stderr, "Error: cannot create %s\n", store.contextDir().c_str());
        return EXIT_PERSIST;
    }

    Trace::Context::ContextIngestor ingestor(store, Trace::Redaction::defaultEngine());
    Trace::Context::IngestResult result;
    Trace::Context::IngestStatus status;
    if (file) {
        status = ingestor.ingestFile(file, source, &result);
    } else {
        std::string text;
        if (!readAll(stdin, &text)) {
            fprintf(stderr, "Error: cannot read stdin\n");
            return EXIT_FAILURE_GENERIC;
        }
        status = ingestor.ingestText(text, source, &result);
    }

    switch (status) {
        case Trace::Context::IngestStatus::OK:
            break;
        case Trace::Context::IngestStatus::FILE_NOT_FOUND:
            fprintf(stderr, "Error: File not found: %s\n", file);
            return EXIT_FAILURE_GENERIC;
        case Trace::Context::IngestStatus::EMPTY_INPUT:
            fprintf(stderr, "Error: no context text provided\n");
            return EXIT_FAILURE_GENERIC;
        case Trace::Context::IngestStatus::READ_ERROR:
            fprintf(stderr, "Error: cannot read context input\n");
            return EXIT_FAILURE_GENERIC;
        case Trace::Context::IngestStatus::PERSIST_FAILED:
            fprintf(stderr, "Error: failed to save context\n");
            return EXIT_PERSIST;
    }

    Trace::Redaction::printRedactionWarning(result.redactions, stderr);
    printf("✓ Context saved | Session: %s | %s\n", result.context.session_id.c_str(),
           result.context.title.c_str());
    printf("Saved: %s\n", result.path.c_str());
    return EXIT_OK;
}

int cmdContextList() {
    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    auto contexts = store.listContexts();
    if (contexts.empty()) {
        printf("No context ingested yet. Run 'trace context add' to add one.\n");
        return EXIT_OK;
    }
    printf("%-10s  %-12s  %-24s  %-4s  %s\n", "SESSION", "SOURCE", "CREATED", "MSGS", "TITLE");
    for (const auto& c : contexts) {
        printf("%-10s  %-12s  %-24s  %-4zu  %s\n", c.session_id.c_str(), c.source.c_str(),
               c.created_at.c_str(), c.message_count, shortened(c.title, LIST_LABEL_WIDTH).c_str());
    }
    return EXIT_OK;
}

int cmdContextShow(const char* id) {
    Trace::Storage::EvidenceStore store(Trace::ConfigManager::getBaseDir());
    Trace::Storage::ContextSession context;
    Trace::Storage::StoreStatus status = store.loadContext(id, &context);
    if (status != Trace::Storage::StoreStatus::OK) {
        fprintf(stderr, "Error: Context not found: %s (%s)\n", id,
                Trace::Storage::storeStatusToString(status));
        return EXIT_FAILURE_GENERIC;
    }

    printf("Session: %s\n", context.session_id.c_str());
    printf("Source:  %s\n", context.source.c_str());
    printf("Title:   %s\n", context.title.c_str());
    printf("Created: %s\n", context.created_at.c_str());
    for (const auto& msg : context.messages) {
        printf("\n[%s]\n%s\n", msg.role.c_str(), msg.content.c_str());
    }
    return EXIT_OK;
}

int cmdContext(int argc, char* argv[], int first) {
    if (first >= argc) {
        fprintf(stderr, "Error: context needs add, list or show\n");
        return EXIT_USAGE;
    }
    const char* sub = argv[first];
    if (std::strcmp(sub, "add") == 0) {
        return cmdContextAdd(argc, argv, first + 1);
    }
    if (std::strcmp(sub, "list") == 0) {
        return cmdContextList();
    }
    if (std::strcmp(sub, "show") == 0 && first + 1 < argc) {
        return cmdContextShow(argv[first + 1]);
    }
    fprintf(stderr, "Unknown context command: %s\n", sub);
    return EXIT_USAGE;
}

// ---------------------------------------------------------------------------
// config
// ---------------------------------------------------------------------------

int cmdConfig(int argc, char* argv[], int first) {
    if (first >= argc) {
        fprintf(stderr, "Error: config needs show or set\n");
        return EXIT_USAGE;
    }

    if (std::strcmp(argv[first], "show") == 0) {
        printf("# %s\n", Trace::ConfigManager::getConfigFile());
        char value[256];
        for (const char* const* key = Trace::ConfigManager::knownKeys(); *key; ++key) {
            if (Trace::ConfigManager::getValue(*key, value, sizeof(value))) {
                printf("%s=%s\n", *key, value);
            }
        }
        // Name only; the key value is never printed
        const char* key_env = Trace::ConfigManager::resolveApiKeyEnv();
        printf("\n# API key: %s\n", key_env ? key_env : "(no key variable set)");
        return EXIT_OK;
    }

    if (std::strcmp(argv[first], "set") == 0 && first + 2 < argc) {
        const char* key = argv[first + 1];
        const char* value = argv[first + 2];
        if (!Trace::ConfigManager::setValue(key, value)) {
            fprintf(stderr, "Error: invalid setting %s=%s\n", key, value);
            return EXIT_USAGE;
        }
        if (!Trace::ConfigManager::saveToFile(Trace::ConfigManager::getConfigFile())) {
            fprintf(stderr, "Error: cannot write %s\n", Trace::ConfigManager::getConfigFile());
            return EXIT_FAILURE_GENERIC;
        }
        printf("%s=%s\n", key, value);
        return EXIT_OK;
    }

    fprintf(stderr, "Unknown config command: %s\n", argv[first]);
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    const char* command = argv[1];
    if (std::strcmp(command, "--help") == 0 || std::strcmp(command, "-h") == 0) {
        printUsage(argv[0]);
        return EXIT_OK;
    }
    if (std::strcmp(command, "--version") == 0) {
        printf("trace %s\n", TRACE_VERSION);
        return EXIT_OK;
    }

    if (!setupRuntime()) {
        return EXIT_FAILURE_GENERIC;
    }
    LoggingGuard logging_guard;
    LOG_INFO("trace %s: %s", TRACE_VERSION, command);

    if (std::strcmp(command, "run") == 0) {
        return cmdRun(argc, argv, 2);
    }
    if (std::strcmp(command, "capture") == 0) {
        return cmdCapture(argc, argv, 2);
    }
    if (std::strcmp(command, "list") == 0) {
        return cmdList();
    }
    if (std::strcmp(command, "show") == 0 && argc > 2) {
        return cmdShow(argv[2]);
    }
    if (std::strcmp(command, "verify") == 0 && argc > 2) {
        return cmdVerify(argv[2]);
    }
    if (std::strcmp(command, "evidence") == 0) {
        return cmdEvidence(argc, argv, 2);
    }
    if (std::strcmp(command, "redact") == 0) {
        return cmdRedact(argc, argv, 2);
    }
    if (std::strcmp(command, "context") == 0) {
        return cmdContext(argc, argv, 2);
    }
    if (std::strcmp(command, "config") == 0) {
        return cmdConfig(argc, argv, 2);
    }

    fprintf(stderr, "Unknown command: %s\n", command);
    printUsage(argv[0]);
    return EXIT_USAGE;
}
