#include <gtest/gtest.h>

#include "ConfigLoader.hpp"
#include "TestSupport.hpp"

using namespace vnt;
using vnt::test::TempDir;
using vnt::test::write_bytes;

class ConfigLoaderTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(ConfigLoaderTest, MissingFileGivesDefaults) {
    PipelineConfig config = ConfigLoader::load(dir_.file("absent.json"));

    EXPECT_EQ(config.min_memory_mb, 1900);
    EXPECT_EQ(config.min_free_storage_mb, 100);
    EXPECT_EQ(config.max_download_attempts, 3);
    EXPECT_EQ(config.download_timeout_seconds, 300);
    EXPECT_EQ(config.backoff_base_ms, 1000);
    EXPECT_EQ(config.model_file_name, "whisper-tiny.bin");
    EXPECT_EQ(config.fallback_language, "en");
    EXPECT_EQ(config.supported_languages,
              (std::vector<std::string>{"en", "hi", "gu", "mr"}));
    EXPECT_TRUE(config.remote_api_key.empty());
}

TEST_F(ConfigLoaderTest, ParseOverridesOnlyPresentKeys) {
    PipelineConfig config = ConfigLoader::parse(R"({
        "min_memory_mb": 2048,
        "fallback_language": "hi",
        "supported_languages": ["hi", "mr"],
        "remote_api_key": "k-123",
        "some_future_key": true
    })");

    EXPECT_EQ(config.min_memory_mb, 2048);
    EXPECT_EQ(config.fallback_language, "hi");
    EXPECT_EQ(config.supported_languages, (std::vector<std::string>{"hi", "mr"}));
    EXPECT_EQ(config.remote_api_key, "k-123");
    EXPECT_EQ(config.max_download_attempts, 3);
    EXPECT_EQ(config.database_path, "transcription.db");
}

TEST_F(ConfigLoaderTest, MalformedJsonGivesDefaults) {
    PipelineConfig config = ConfigLoader::parse("{ \"min_memory_mb\": ");
    EXPECT_EQ(config.min_memory_mb, 1900);

    config = ConfigLoader::parse("[1, 2, 3]");
    EXPECT_EQ(config.min_memory_mb, 1900);
}

TEST_F(ConfigLoaderTest, WrongValueTypeGivesDefaults) {
    PipelineConfig config = ConfigLoader::parse(R"({"min_memory_mb": "lots"})");
    EXPECT_EQ(config.min_memory_mb, 1900);
}

TEST_F(ConfigLoaderTest, MalformedFileGivesDefaults) {
    const std::string path = dir_.file("broken.json");
    write_bytes(path, "not json");
    EXPECT_EQ(ConfigLoader::load(path).backoff_base_ms, 1000);
}

TEST_F(ConfigLoaderTest, SaveThenLoadPreservesValues) {
    PipelineConfig config;
    config.database_path         = dir_.file("db/notes.db");
    config.model_expected_bytes  = 0;
    config.worker_threads        = 2;
    config.initial_delay_seconds = 0;
    config.log_level             = "debug";

    const std::string path = dir_.file("nested/vnt.json");
    ASSERT_TRUE(ConfigLoader::save(path, config));

    PipelineConfig loaded = ConfigLoader::load(path);
    EXPECT_EQ(loaded.database_path, config.database_path);
    EXPECT_EQ(loaded.model_expected_bytes, 0);
    EXPECT_EQ(loaded.worker_threads, 2);
    EXPECT_EQ(loaded.initial_delay_seconds, 0);
    EXPECT_EQ(loaded.log_level, "debug");
    EXPECT_EQ(loaded.model_url, config.model_url);
}
