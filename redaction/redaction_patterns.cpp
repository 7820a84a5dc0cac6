// ============================================================================
// redaction_patterns.cpp - Default secret detectors, in application order
// ============================================================================

#include "redaction/redaction_engine.h"
#include <array>
#include <cctype>

namespace Trace::Redaction {

namespace Patterns {
    constexpr const char* TOKEN = "[REDACTED:{name}]";
    constexpr const char* BASE64_ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789/+=";

    bool alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
    bool tokenChar(char c) { return alnum(c) || c == '-' || c == '_'; }
    bool slackChar(char c) { return alnum(c) || c == '-'; }
    bool dottedTokenChar(char c) { return tokenChar(c) || c == '.'; }
    bool unquotedValueChar(char c) {
        return !std::isspace(static_cast<unsigned char>(c)) && c != '\'' && c != '"';
    }
}

namespace {

const std::array<RedactionPattern, 18> DEFAULT_PATTERNS = {{
    // Provider API keys
    {"OPENAI_API_KEY", R"(sk-(?:proj-)?[a-zA-Z0-9]{16,512})",
     Patterns::TOKEN, "OpenAI API key", false, 0, nullptr, nullptr, Patterns::alnum},
    {"ANTHROPIC_API_KEY", R"(sk-ant-[a-zA-Z0-9\-_]{20,512})",
     Patterns::TOKEN, "Anthropic API key", false, 0, nullptr, nullptr, Patterns::tokenChar},
    {"GOOGLE_API_KEY", R"(AIza[0-9A-Za-z\-_]{35})",
     Patterns::TOKEN, "Google API key", false, 0, nullptr, nullptr, nullptr},
    {"AWS_ACCESS_KEY", R"(AKIA[0-9A-Z]{16})",
     Patterns::TOKEN, "AWS Access Key ID", false, 0, nullptr, nullptr, nullptr},

    // GitHub
    {"GITHUB_TOKEN", R"(ghp_[a-zA-Z0-9]{36})",
     Patterns::TOKEN, "GitHub Personal Access Token", false, 0, nullptr, nullptr, nullptr},
    {"GITHUB_OAUTH", R"(gho_[a-zA-Z0-9]{36})",
     Patterns::TOKEN, "GitHub OAuth Access Token", false, 0, nullptr, nullptr, nullptr},
    {"GITHUB_APP", R"(ghu_[a-zA-Z0-9]{36})",
     Patterns::TOKEN, "GitHub App User-to-Server Token", false, 0, nullptr, nullptr, nullptr},

    {"SLACK_TOKEN", R"(xox[baprs]-[0-9]{10,13}-[0-9]{10,13}[a-zA-Z0-9-]{0,512})",
     Patterns::TOKEN, "Slack Token", false, 0, nullptr, nullptr, Patterns::slackChar},

    // Stripe
    {"STRIPE_KEY", R"(sk_live_[0-9a-zA-Z]{24,512})",
     Patterns::TOKEN, "Stripe Live API Key", false, 0, nullptr, nullptr, Patterns::alnum},
    {"STRIPE_TEST_KEY", R"(sk_test_[0-9a-zA-Z]{24,512})",
     Patterns::TOKEN, "Stripe Test API Key", false, 0, nullptr, nullptr, Patterns::alnum},

    // PEM blocks, opening marker through the first closing marker
    {"PRIVATE_KEY", R"(-----BEGIN\s{1,16}(RSA\s{1,16})?PRIVATE\s{1,16}KEY-----)",
     Patterns::TOKEN, "Private key (PEM format)", false, 0, nullptr,
     R"(-----END\s{1,16}(RSA\s{1,16})?PRIVATE\s{1,16}KEY-----)", nullptr},
    {"SSH_PRIVATE_KEY", R"(-----BEGIN\s{1,16}OPENSSH\s{1,16}PRIVATE\s{1,16}KEY-----)",
     Patterns::TOKEN, "SSH private key", false, 0, nullptr,
     R"(-----END\s{1,16}OPENSSH\s{1,16}PRIVATE\s{1,16}KEY-----)", nullptr},

    {"BEARER_TOKEN", R"([Bb]earer\s{1,16}[a-zA-Z0-9\-_\.]{20,512})",
     Patterns::TOKEN, "Bearer token in Authorization header", false, 0, nullptr, nullptr,
     Patterns::dottedTokenChar},
    {"JWT", R"(eyJ[a-zA-Z0-9\-_]{1,2048}\.eyJ[a-zA-Z0-9\-_]{1,2048}\.[a-zA-Z0-9\-_]{1,2048})",
     Patterns::TOKEN, "JSON Web Token", false, 0, nullptr, nullptr, Patterns::tokenChar},

    // User part is kept as a placeholder so the URL stays readable
    {"URL_PASSWORD", R"(://[^:]{1,256}:([^@]{1,256})@)",
     "://[USER]:[REDACTED:{name}]@", "Password in URL", false, 1, nullptr, nullptr, nullptr},

    // Generic catch-alls
    {"GENERIC_API_KEY",
     R"((api[_-]?key|apikey|secret[_-]?key|access[_-]?token|auth[_-]?token)[\s]{0,64}[:=][\s]{0,64}['"]?([a-zA-Z0-9\-_\.]{16,512})['"]?)",
     Patterns::TOKEN, "Generic API key pattern", true, 2, nullptr, nullptr, Patterns::dottedTokenChar},
    {"ENV_SECRET",
     R"((PASSWORD|SECRET|TOKEN|API_KEY|APIKEY|AUTH|CREDENTIAL)s?[\s]{0,64}=[\s]{0,64}['"]?([^\s'"\n]{8,512})['"]?)",
     Patterns::TOKEN, "Secret in environment variable", true, 2, nullptr, nullptr,
     Patterns::unquotedValueChar},

    // Bare 40-char base64 run, whole run only
    {"AWS_SECRET_KEY", R"([A-Za-z0-9/+=]{40}(?![A-Za-z0-9/+=]))",
     Patterns::TOKEN, "AWS Secret Access Key (potential)", false, 0, Patterns::BASE64_ALPHABET,
     nullptr, nullptr},
}};

} // namespace

std::span<const RedactionPattern> defaultPatterns() noexcept {
    return std::span<const RedactionPattern>(DEFAULT_PATTERNS.data(), DEFAULT_PATTERNS.size());
}

} // namespace Trace::Redaction
