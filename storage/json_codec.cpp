// ============================================================================
// json_codec.cpp - rapidjson encoding of evidence and context records
// ============================================================================

#include "storage/json_codec.h"
#include "common/logging.h"
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <exception>
#include <utility>

namespace Trace::Storage {

namespace {

constexpr char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";

bool isCont(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

// Length of the valid sequence starting at s[i], 0 if invalid
size_t validSequenceLength(const unsigned char* s, size_t i, size_t n) noexcept {
    unsigned char c = s[i];
    if (c < 0x80) {
        return 1;
    }
    if (c >= 0xC2 && c <= 0xDF) {
        return (i + 1 < n && isCont(s[i + 1])) ? 2 : 0;
    }
    if (c >= 0xE0 && c <= 0xEF) {
        if (i + 2 >= n) return 0;
        unsigned char c1 = s[i + 1];
        if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return 0;
        if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return 0;
        if (!isCont(c1) || !isCont(s[i + 2])) return 0;
        return 3;
    }
    if (c >= 0xF0 && c <= 0xF4) {
        if (i + 3 >= n) return 0;
        unsigned char c1 = s[i + 1];
        if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return 0;
        if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return 0;
        if (!isCont(c1) || !isCont(s[i + 2]) || !isCont(s[i + 3])) return 0;
        return 4;
    }
    return 0;
}

bool isValidUtf8(const std::string& in) noexcept {
    const auto* s = reinterpret_cast<const unsigned char*>(in.data());
    size_t n = in.size();
    for (size_t i = 0; i < n;) {
        size_t len = validSequenceLength(s, i, n);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

// PrettyWriter wrapper that normalises strings on the way out
class RecordWriter {
public:
    RecordWriter() : buffer_(), writer_(buffer_) {
        writer_.SetIndent(' ', 2);
    }

    void key(const char* k) { writer_.Key(k); }

    void string(const std::string& s) {
        if (sanitizeUtf8(s, &scratch_)) {
            normalized_ = true;
            writer_.String(scratch_.data(), static_cast<rapidjson::SizeType>(scratch_.size()));
        } else {
            writer_.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
        }
    }

    void field(const char* k, const std::string& v) {
        key(k);
        string(v);
    }

    rapidjson::PrettyWriter<rapidjson::StringBuffer>& raw() { return writer_; }

    // Metadata goes last so utf8_normalized covers every other field
    void metadata(const Metadata& meta) {
        key("metadata");
        writer_.StartObject();
        for (const auto& [name, value] : meta) {
            if (name == "utf8_normalized") {
                continue;
            }
            string(name);
            writeValue(value);
        }
        bool flagged = normalized_;
        if (!flagged) {
            auto it = meta.find("utf8_normalized");
            flagged = it != meta.end() && std::holds_alternative<bool>(it->second) &&
                      std::get<bool>(it->second);
        }
        if (flagged) {
            writer_.Key("utf8_normalized");
            writer_.Bool(true);
        }
        writer_.EndObject();
    }

    std::string finish() {
        return std::string(buffer_.GetString(), buffer_.GetSize());
    }

private:
    void writeValue(const MetaValue& value) {
        if (std::holds_alternative<bool>(value)) {
            writer_.Bool(std::get<bool>(value));
        } else if (std::holds_alternative<int64_t>(value)) {
            writer_.Int64(std::get<int64_t>(value));
        } else if (std::holds_alternative<double>(value)) {
            writer_.Double(std::get<double>(value));
        } else if (std::holds_alternative<std::string>(value)) {
            string(std::get<std::string>(value));
        } else {
            writer_.Null();
        }
    }

    rapidjson::StringBuffer buffer_;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer_;
    std::string scratch_;
    bool normalized_{false};
};

std::string readString(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::string();
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

void readMetadata(const rapidjson::Value& obj, Metadata* out) {
    auto it = obj.FindMember("metadata");
    if (it == obj.MemberEnd() || !it->value.IsObject()) {
        return;
    }
    for (const auto& m : it->value.GetObject()) {
        std::string name(m.name.GetString(), m.name.GetStringLength());
        const auto& v = m.value;
        if (v.IsBool()) {
            (*out)[name] = v.GetBool();
        } else if (v.IsInt64()) {
            (*out)[name] = static_cast<int64_t>(v.GetInt64());
        } else if (v.IsNumber()) {
            (*out)[name] = v.GetDouble();
        } else if (v.IsString()) {
            (*out)[name] = std::string(v.GetString(), v.GetStringLength());
        } else if (v.IsNull()) {
            (*out)[name] = std::monostate{};
        }
    }
}

bool parseDocument(const std::string& json, rapidjson::Document* doc) {
    doc->Parse(json.data(), json.size());
    if (doc->HasParseError() || !doc->IsObject()) {
        return false;
    }
    auto it = doc->FindMember("session_id");
    return it != doc->MemberEnd() && it->value.IsString();
}

} // namespace

bool sanitizeUtf8(const std::string& in, std::string* out) {
    if (isValidUtf8(in)) {
        *out = in;
        return false;
    }

    const auto* s = reinterpret_cast<const unsigned char*>(in.data());
    size_t n = in.size();
    out->clear();
    out->reserve(n + 16);
    for (size_t i = 0; i < n;) {
        size_t len = validSequenceLength(s, i, n);
        if (len == 0) {
            out->append(REPLACEMENT_CHAR);
            ++i;
        } else {
            out->append(in, i, len);
            i += len;
        }
    }
    return true;
}

bool serializeCapture(const CaptureSession& session, std::string* out) noexcept {
    try {
        RecordWriter w;
        auto& raw = w.raw();
        raw.StartObject();
        w.field("session_id", session.session_id);
        w.field("command", session.command);
        raw.Key("exit_code");
        raw.Int(session.exit_code);
        w.field("stdout", session.stdout_data);
        w.field("stderr", session.stderr_data);
        w.field("timestamp", session.started_at);
        raw.Key("duration_ms");
        raw.Int64(session.duration_ms);
        w.metadata(session.metadata);
        raw.EndObject();
        *out = w.finish();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode capture %s: %s", session.session_id.c_str(), e.what());
        return false;
    }
}

bool serializeImportedLog(const ImportedLog& log, std::string* out) noexcept {
    try {
        RecordWriter w;
        auto& raw = w.raw();
        raw.StartObject();
        w.field("session_id", log.session_id);
        raw.Key("type");
        raw.String("imported_log");
        w.field("source_file", log.source_file);
        w.field("content", log.content);
        w.field("timestamp", log.timestamp);
        w.metadata(log.metadata);
        raw.EndObject();
        *out = w.finish();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode imported log %s: %s", log.session_id.c_str(), e.what());
        return false;
    }
}

bool serializeContext(const ContextSession& context, std::string* out) noexcept {
    try {
        RecordWriter w;
        auto& raw = w.raw();
        raw.StartObject();
        w.field("session_id", context.session_id);
        w.field("source", context.source);
        w.field("title", context.title);
        w.field("created_at", context.created_at);
        raw.Key("messages");
        raw.StartArray();
        for (const auto& msg : context.messages) {
            raw.StartObject();
            w.field("role", msg.role);
            w.field("content", msg.content);
            raw.Key("timestamp");
            raw.Null();
            raw.Key("metadata");
            raw.StartObject();
            raw.EndObject();
            raw.EndObject();
        }
        raw.EndArray();
        w.metadata(context.metadata);
        raw.EndObject();
        *out = w.finish();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to encode context %s: %s", context.session_id.c_str(), e.what());
        return false;
    }
}

bool parseEvidence(const std::string& json, EvidenceRecord* out) noexcept {
    try {
        rapidjson::Document doc;
        if (!parseDocument(json, &doc)) {
            return false;
        }

        EvidenceRecord record;
        if (readString(doc, "type") == "imported_log") {
            record.type = RecordType::IMPORTED_LOG;
            record.log.session_id = readString(doc, "session_id");
            record.log.source_file = readString(doc, "source_file");
            record.log.content = readString(doc, "content");
            record.log.timestamp = readString(doc, "timestamp");
            readMetadata(doc, &record.log.metadata);
        } else {
            auto& cap = record.capture;
            record.type = RecordType::COMMAND;
            cap.session_id = readString(doc, "session_id");
            cap.command = readString(doc, "command");
            cap.stdout_data = readString(doc, "stdout");
            cap.stderr_data = readString(doc, "stderr");
            cap.started_at = readString(doc, "timestamp");

            auto code = doc.FindMember("exit_code");
            if (code != doc.MemberEnd() && code->value.IsInt()) {
                cap.exit_code = code->value.GetInt();
            }
            auto duration = doc.FindMember("duration_ms");
            if (duration != doc.MemberEnd() && duration->value.IsInt64()) {
                cap.duration_ms = duration->value.GetInt64();
            }

            readMetadata(doc, &cap.metadata);
            auto cwd = cap.metadata.find("cwd");
            if (cwd != cap.metadata.end() && std::holds_alternative<std::string>(cwd->second)) {
                cap.cwd = std::get<std::string>(cwd->second);
            }
        }

        *out = std::move(record);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to decode evidence record: %s", e.what());
        return false;
    }
}

bool parseContext(const std::string& json, ContextSession* out) noexcept {
    try {
        rapidjson::Document doc;
        if (!parseDocument(json, &doc)) {
            return false;
        }

        ContextSession context;
        context.session_id = readString(doc, "session_id");
        context.source = readString(doc, "source");
        context.title = readString(doc, "title");
        context.created_at = readString(doc, "created_at");
        if (context.source.empty()) {
            context.source = "unknown";
        }

        auto messages = doc.FindMember("messages");
        if (messages != doc.MemberEnd() && messages->value.IsArray()) {
            for (const auto& m : messages->value.GetArray()) {
                if (!m.IsObject()) {
                    continue;
                }
                context.messages.push_back({readString(m, "role"), readString(m, "content")});
            }
        }

        readMetadata(doc, &context.metadata);
        *out = std::move(context);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to decode context record: %s", e.what());
        return false;
    }
}

} // namespace Trace::Storage
