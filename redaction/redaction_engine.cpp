// ============================================================================
// redaction_engine.cpp - Sequential multi-pass secret redaction
// ============================================================================

#include "redaction/redaction_engine.h"
#include "common/logging.h"
#include <cstring>
#include <exception>

namespace Trace::Redaction {

namespace {

constexpr size_t PREVIEW_MIN_LENGTH = 12;
constexpr size_t PREVIEW_EDGE = 4;

std::string expandReplacement(const char* tmpl, const char* name) {
    std::string out(tmpl);
    const std::string placeholder = "{name}";
    size_t pos = out.find(placeholder);
    while (pos != std::string::npos) {
        out.replace(pos, placeholder.size(), name);
        pos = out.find(placeholder, pos + std::strlen(name));
    }
    return out;
}

} // namespace

std::string makePreview(const std::string& secret) {
    if (secret.size() <= PREVIEW_MIN_LENGTH) {
        return "***";
    }
    return secret.substr(0, PREVIEW_EDGE) + "..." + secret.substr(secret.size() - PREVIEW_EDGE);
}

RedactionEngine::RedactionEngine(std::span<const RedactionPattern> patterns) {
    compiled_.reserve(patterns.size());
    for (const auto& def : patterns) {
        CompiledPattern cp;
        cp.def = def;
        cp.token = expandReplacement(def.replacement, def.name);
        try {
            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (def.case_insensitive) {
                flags |= std::regex::icase;
            }
            cp.regex = std::regex(def.expression, flags);
            if (def.end_expression) {
                cp.end_regex = std::regex(def.end_expression, flags);
            }
            cp.usable = true;
        } catch (const std::regex_error& e) {
            LOG_ERROR("Redaction pattern %s failed to compile: %s", def.name, e.what());
        }
        compiled_.push_back(std::move(cp));
    }
}

std::vector<RedactionEngine::Match> RedactionEngine::findMatches(const CompiledPattern& pattern,
                                                                 const std::string& text) {
    std::vector<Match> matches;
    const char* exclusions = pattern.def.leading_exclusions;
    auto begin = text.cbegin();
    auto end = text.cend();
    size_t pos = 0;

    while (pos < text.size()) {
        std::smatch m;
        auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                             : std::regex_constants::match_default;
        if (!std::regex_search(begin + static_cast<std::ptrdiff_t>(pos), end, m, pattern.regex, flags)) {
            break;
        }

        size_t start = pos + static_cast<size_t>(m.position(0));
        size_t length = static_cast<size_t>(m.length(0));

        // Stand-in for a lookbehind: nothing inside a run of excluded
        // characters may start a match, so skip the whole run
        if (exclusions && start > 0 && std::strchr(exclusions, text[start - 1]) && text[start - 1] != '\0') {
            size_t next = start;
            while (next < text.size() && text[next] != '\0' && std::strchr(exclusions, text[next])) {
                ++next;
            }
            pos = next > start ? next : start + 1;
            continue;
        }

        size_t match_end = start + length;
        size_t secret_begin = start;
        size_t secret_end = match_end;
        size_t group = pattern.def.secret_group;
        if (group > 0 && group < m.size() && m[group].matched && m[group].length() > 0) {
            secret_begin = pos + static_cast<size_t>(m.position(group));
            secret_end = secret_begin + static_cast<size_t>(m.length(group));
        }

        if (pattern.def.end_expression) {
            // Block runs from the opening marker to the first closing one
            std::smatch close;
            auto from = begin + static_cast<std::ptrdiff_t>(match_end);
            if (!std::regex_search(from, end, close, pattern.end_regex,
                                   std::regex_constants::match_prev_avail)) {
                break;
            }
            match_end += static_cast<size_t>(close.position(0) + close.length(0));
            secret_begin = start;
            secret_end = match_end;
        } else if (pattern.def.run_continues && secret_end == match_end) {
            // Bounded quantifier stopped short of the end of the run
            while (match_end < text.size() && pattern.def.run_continues(text[match_end])) {
                ++match_end;
            }
            secret_end = match_end;
        }
        length = match_end - start;

        Match match;
        match.begin = start;
        match.length = length;
        match.secret = text.substr(secret_begin, secret_end - secret_begin);
        matches.push_back(std::move(match));

        pos = start + (length > 0 ? length : 1);
    }
    return matches;
}

RedactionResult RedactionEngine::redact(const std::string& text) const noexcept {
    RedactionResult result;
    result.redacted_text = text;

    for (const auto& pattern : compiled_) {
        if (!pattern.usable) {
            result.skipped_patterns.emplace_back(pattern.def.name);
            continue;
        }

        try {
            std::vector<Match> matches = findMatches(pattern, result.redacted_text);
            if (matches.empty()) {
                continue;
            }

            std::string next;
            next.reserve(result.redacted_text.size());
            size_t cursor = 0;
            for (const auto& m : matches) {
                next.append(result.redacted_text, cursor, m.begin - cursor);
                next.append(pattern.token);
                cursor = m.begin + m.length;
            }
            next.append(result.redacted_text, cursor, std::string::npos);

            for (auto& m : matches) {
                result.records.push_back({pattern.def.name, pattern.def.description, makePreview(m.secret)});
            }
            result.redacted_text.swap(next);
        } catch (const std::exception& e) {
            // Text stays as the previous pass left it
            LOG_ERROR("Redaction pattern %s skipped: %s", pattern.def.name, e.what());
            result.skipped_patterns.emplace_back(pattern.def.name);
        }
    }

    result.count = result.records.size();
    if (result.count > 0) {
        LOG_INFO("Redacted %zu secret(s)", result.count);
    }
    return result;
}

std::vector<RedactionRecord> RedactionEngine::scan(const std::string& text) const noexcept {
    std::vector<RedactionRecord> detected;
    for (const auto& pattern : compiled_) {
        if (!pattern.usable) {
            continue;
        }
        try {
            for (const auto& m : findMatches(pattern, text)) {
                detected.push_back({pattern.def.name, pattern.def.description, makePreview(m.secret)});
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Secret scan with %s skipped: %s", pattern.def.name, e.what());
        }
    }
    return detected;
}

const RedactionEngine& defaultEngine() {
    static const RedactionEngine engine(defaultPatterns());
    return engine;
}

std::string formatRedactionWarning(const std::vector<RedactionRecord>& records) {
    if (records.empty()) {
        return std::string();
    }
    std::string out = "\n\xE2\x9A\xA0 Sensitive data detected and redacted:\n";
    for (const auto& r : records) {
        out += "  \xE2\x80\xA2 " + r.pattern_name + ": " + r.preview + "\n";
    }
    out += "\n";
    return out;
}

void printRedactionWarning(const std::vector<RedactionRecord>& records, FILE* out) noexcept {
    if (records.empty() || !out) {
        return;
    }
    try {
        std::string text = formatRedactionWarning(records);
        fputs(text.c_str(), out);
        fflush(out);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to print redaction warning: %s", e.what());
    }
}

} // namespace Trace::Redaction
