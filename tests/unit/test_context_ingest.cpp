#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "common/logging.h"
#include "context/context_ingest.h"
#include "redaction/redaction_engine.h"
#include "storage/evidence_store.h"

using namespace Trace::Context;
using Trace::Storage::ContextSession;
using Trace::Storage::EvidenceStore;
using Trace::Storage::StoreStatus;

class ContextIngestTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        base_dir_ = (std::filesystem::temp_directory_path() /
                     ("trace_context_" + std::to_string(stamp))).string();
        std::filesystem::create_directories(base_dir_);

        Trace::Common::shutdownLogging();
        Trace::Common::initLogging((base_dir_ + "/context_test.log").c_str());
        LOG_INFO("=== Starting Context Ingest Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== Context Ingest Test Completed ===");
        Trace::Common::shutdownLogging();
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
    }

    static std::string readFile(const std::string& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string base_dir_;
};

TEST_F(ContextIngestTestBase, PastedTextIsRedactedBeforeSaving) {
    // GIVEN: pasted session text with a key in it
    const std::string key = "sk-test1234567890123456789012345";
    const std::string text = "Let's debug the parser\nI exported OPENAI key " + key + " earlier\n";

    EvidenceStore store(base_dir_);
    ContextIngestor ingestor(store, Trace::Redaction::defaultEngine());

    // WHEN
    IngestResult result;
    ASSERT_EQ(ingestor.ingestText(text, "claude", &result), IngestStatus::OK);

    // THEN: the warning data is there, the raw key is nowhere on disk
    ASSERT_EQ(result.redactions.size(), 1u);
    EXPECT_EQ(result.redactions[0].pattern_name, "OPENAI_API_KEY");

    const auto& ctx = result.context;
    EXPECT_EQ(ctx.source, "claude");
    EXPECT_EQ(ctx.title, "Let's debug the parser");
    ASSERT_EQ(ctx.messages.size(), 1u);
    EXPECT_EQ(ctx.messages[0].role, "user");
    EXPECT_NE(ctx.messages[0].content.find("[REDACTED:OPENAI_API_KEY]"), std::string::npos);
    EXPECT_EQ(std::get<int64_t>(ctx.metadata.at("redactions")), 1);
    EXPECT_EQ(std::get<std::string>(ctx.metadata.at("ingestion_method")), "text_paste");

    std::string on_disk = readFile(result.path);
    EXPECT_FALSE(on_disk.empty());
    EXPECT_EQ(on_disk.find(key), std::string::npos);

    ContextSession loaded;
    ASSERT_EQ(store.loadContext(ctx.session_id, &loaded), StoreStatus::OK);
    EXPECT_EQ(loaded.messages[0].content, ctx.messages[0].content);
}

TEST_F(ContextIngestTestBase, SourceDefaultsToManual) {
    EvidenceStore store(base_dir_);
    ContextIngestor ingestor(store, Trace::Redaction::defaultEngine());

    IngestResult result;
    ASSERT_EQ(ingestor.ingestText("just a note", "", &result), IngestStatus::OK);
    EXPECT_EQ(result.context.source, "manual");
    EXPECT_TRUE(result.redactions.empty());
    EXPECT_FALSE(result.context.created_at.empty());
}

TEST_F(ContextIngestTestBase, BlankInputIsRejected) {
    EvidenceStore store(base_dir_);
    ContextIngestor ingestor(store, Trace::Redaction::defaultEngine());

    IngestResult result;
    EXPECT_EQ(ingestor.ingestText("", "manual", &result), IngestStatus::EMPTY_INPUT);
    EXPECT_EQ(ingestor.ingestText(" \n\t\n", "manual", &result), IngestStatus::EMPTY_INPUT);
    EXPECT_TRUE(store.listContexts().empty());
}

TEST_F(ContextIngestTestBase, FileIngestion) {
    const std::string path = base_dir_ + "/session.md";
    {
        std::ofstream file(path);
        file << "\n\n  # Refactor plan  \nstep one\n";
    }

    EvidenceStore store(base_dir_);
    ContextIngestor ingestor(store, Trace::Redaction::defaultEngine());

    IngestResult result;
    ASSERT_EQ(ingestor.ingestFile(path, "cursor", &result), IngestStatus::OK);
    EXPECT_EQ(result.context.title, "# Refactor plan");
    EXPECT_EQ(std::get<std::string>(result.context.metadata.at("ingestion_method")), "file");
    EXPECT_EQ(store.listContexts().size(), 1u);

    EXPECT_EQ(ingestor.ingestFile(base_dir_ + "/missing.md", "cursor", &result), IngestStatus::FILE_NOT_FOUND);
    EXPECT_EQ(ingestor.ingestFile(base_dir_, "cursor", &result), IngestStatus::FILE_NOT_FOUND);
}

TEST_F(ContextIngestTestBase, TitleIsFirstLineCapped) {
    EXPECT_EQ(ContextIngestor::extractTitle("\n   \nfirst\nsecond"), "first");
    EXPECT_EQ(ContextIngestor::extractTitle("   "), "");

    std::string long_line(100, 'x');
    EXPECT_EQ(ContextIngestor::extractTitle(long_line), std::string(80, 'x') + "...");
    EXPECT_EQ(ContextIngestor::extractTitle(std::string(80, 'y')), std::string(80, 'y'));
}

TEST_F(ContextIngestTestBase, StatusNames) {
    EXPECT_STREQ(ingestStatusToString(IngestStatus::OK), "OK");
    EXPECT_STREQ(ingestStatusToString(IngestStatus::EMPTY_INPUT), "EMPTY_INPUT");
    EXPECT_STREQ(ingestStatusToString(IngestStatus::PERSIST_FAILED), "PERSIST_FAILED");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
