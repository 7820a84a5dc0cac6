#include "triage/evidence_triage.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

namespace Trace::Triage {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool containsAny(const std::string& haystack_lower, const std::vector<std::string>& needles_lower) {
    for (const auto& kw : needles_lower) {
        if (!kw.empty() && haystack_lower.find(kw) != std::string::npos) {
            return true;
        }
    }
    return false;
}

constexpr const char* TEST_KEYWORDS[] = {"pass", "fail", "error", "assert", "test"};

} // namespace

const std::vector<std::string>& defaultKeywords() {
    static const std::vector<std::string> keywords = {
        "error", "fail", "exception", "traceback", "warn",
        "assert", "panic", "fatal", "critical", "denied",
    };
    return keywords;
}

std::string compress(const std::string& content, size_t max_lines,
                     const std::vector<std::string>& keywords) {
    std::vector<std::string> lines = splitLines(content);
    const size_t total = lines.size();
    if (total <= max_lines) {
        return content;
    }

    std::vector<std::string> lowered;
    lowered.reserve(keywords.size());
    for (const auto& kw : keywords) {
        lowered.push_back(toLower(kw));
    }

    std::vector<size_t> important;
    for (size_t i = 0; i < total; ++i) {
        if (containsAny(toLower(lines[i]), lowered)) {
            important.push_back(i);
        }
    }

    // The final line is always kept, however small the budget
    const size_t tail_start = total - std::min(total, std::max<size_t>(1, max_lines / 2));
    const size_t important_budget = std::min(important.size(), max_lines / 3);

    std::vector<std::string> out;
    std::set<size_t> shown;
    for (size_t k = 0; k < important_budget; ++k) {
        size_t idx = important[k];
        out.push_back("[line " + std::to_string(idx + 1) + "] " + lines[idx]);
        shown.insert(idx);
    }

    if (!important.empty()) {
        size_t tail_only = 0;
        for (size_t i = tail_start; i < total; ++i) {
            if (shown.count(i) == 0) {
                ++tail_only;
            }
        }
        size_t omitted = total - shown.size() - tail_only;
        out.push_back("...");
        out.push_back("[... " + std::to_string(omitted) + " lines omitted ...]");
        out.push_back("...");
    }

    for (size_t i = tail_start; i < total; ++i) {
        if (shown.count(i) == 0) {
            out.push_back(lines[i]);
        }
    }

    std::string result = "[TRUNCATED: Original " + std::to_string(total) + " lines -> " +
                         std::to_string(out.size()) + " lines]\n\n";
    for (size_t i = 0; i < out.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += out[i];
    }
    return result;
}

RelevanceMap relevance(const std::string& evidence, const std::vector<std::string>& changed_files) {
    RelevanceMap scores;
    const std::string haystack = toLower(evidence);

    for (const auto& filename : changed_files) {
        double score = 0.0;
        std::filesystem::path path(filename);

        std::string stem = toLower(path.stem().string());
        if (!stem.empty() && haystack.find(stem) != std::string::npos) {
            score += 0.5;
        }

        for (const auto& part : path) {
            std::string p = toLower(part.string());
            if (!p.empty() && p != "/" && haystack.find(p) != std::string::npos) {
                score += 0.2;
            }
        }

        std::string lowered_name = toLower(filename);
        if (lowered_name.find("test_") != std::string::npos ||
            lowered_name.find("_test") != std::string::npos) {
            for (const char* kw : TEST_KEYWORDS) {
                if (haystack.find(kw) != std::string::npos) {
                    score += 0.1;
                }
            }
        }

        scores[filename] = std::clamp(score, 0.0, 1.0);
    }
    return scores;
}

std::string EvidenceBlock::format() const {
    std::string code = has_exit_code ? std::to_string(exit_code) : std::string("?");
    return "\n=== Evidence: " + command + " ===\nExit Code: " + code + "\n" + compressed_text + "\n";
}

} // namespace Trace::Triage
