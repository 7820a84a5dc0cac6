#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Trace::Triage {

constexpr size_t DEFAULT_MAX_LINES = 200;

/// error, fail, exception, traceback, warn, assert, panic, fatal, critical, denied
const std::vector<std::string>& defaultKeywords();

/// Shrink a log to roughly max_lines while keeping what matters.
///
/// Content with at most max_lines lines ("\n"-separated) comes back unchanged.
/// Otherwise the result is a banner, up to max_lines / 3 keyword lines
/// tagged "[line N]", an omission marker, and the last max_lines / 2 lines
/// (never fewer than one).
/// A line that is both important and in the tail is only shown tagged.
std::string compress(const std::string& content, size_t max_lines,
                     const std::vector<std::string>& keywords);

inline std::string compress(const std::string& content, size_t max_lines = DEFAULT_MAX_LINES) {
    return compress(content, max_lines, defaultKeywords());
}

using RelevanceMap = std::map<std::string, double>;

/// Advisory ranking of changed files against evidence text, each in [0, 1].
/// +0.5 stem mentioned, +0.2 per path part mentioned, +0.1 per test keyword
/// (pass, fail, error, assert, test) when the file looks like a test.
RelevanceMap relevance(const std::string& evidence, const std::vector<std::string>& changed_files);

/// Compressed view of one evidence record, built on demand
struct EvidenceBlock {
    std::string source_session_id;
    std::string command;
    int32_t exit_code{0};
    bool has_exit_code{false};
    std::string compressed_text;

    // "\n=== Evidence: <command> ===\nExit Code: <code|?>\n<text>\n"
    std::string format() const;
};

} // namespace Trace::Triage
