#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <span>
#include <string>
#include <vector>

namespace Trace::Redaction {

/// One secret detector. Instances live in a static table and are never
/// mutated; their order decides which name a secret is tagged with.
/// Expressions keep every quantifier bounded, since std::regex recurses
/// once per matched character. Longer runs are picked up by run_continues,
/// and multi-line blocks by searching for end_expression separately.
struct RedactionPattern {
    const char* name;
    const char* expression;          // ECMAScript regex
    const char* replacement;         // "{name}" expands to the pattern name
    const char* description;
    bool case_insensitive;
    uint8_t secret_group;            // group shown in the preview, 0 = whole match
    const char* leading_exclusions;  // reject a match preceded by any of these
    const char* end_expression;      // block patterns: expression opens, this closes
    bool (*run_continues)(char);     // chars a capped trailing run keeps absorbing
};

/// Ordered list used by defaultEngine(): provider specific shapes first,
/// generic key=value and bare 40-char heuristics last.
std::span<const RedactionPattern> defaultPatterns() noexcept;

struct RedactionRecord {
    std::string pattern_name;
    std::string description;
    std::string preview;             // first4...last4, or *** for short secrets
};

struct RedactionResult {
    std::string redacted_text;
    std::vector<RedactionRecord> records;
    size_t count{0};
    std::vector<std::string> skipped_patterns;
};

/// Pattern-based secret scrubber. Regexes are compiled once in the
/// constructor; redact() and scan() are const and safe to call from
/// several threads.
class RedactionEngine {
public:
    explicit RedactionEngine(std::span<const RedactionPattern> patterns);

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    /// Apply every pattern in order, each pass over the output of the
    /// previous one. Never throws; a failing pattern is skipped and named
    /// in skipped_patterns.
    RedactionResult redact(const std::string& text) const noexcept;

    /// Detection only, every pattern against the original text
    std::vector<RedactionRecord> scan(const std::string& text) const noexcept;

    size_t patternCount() const noexcept { return compiled_.size(); }

private:
    struct CompiledPattern {
        RedactionPattern def;
        std::string token;
        std::regex regex;
        std::regex end_regex;
        bool usable{false};
    };

    struct Match {
        size_t begin;
        size_t length;
        std::string secret;
    };

    // All accepted matches of one pattern, left to right
    static std::vector<Match> findMatches(const CompiledPattern& pattern, const std::string& text);

    std::vector<CompiledPattern> compiled_;
};

/// Engine over defaultPatterns(), built on first use
const RedactionEngine& defaultEngine();

std::string makePreview(const std::string& secret);

/// Operator-facing summary of pattern names and previews, empty when there
/// is nothing to report
std::string formatRedactionWarning(const std::vector<RedactionRecord>& records);
void printRedactionWarning(const std::vector<RedactionRecord>& records, FILE* out) noexcept;

} // namespace Trace::Redaction
