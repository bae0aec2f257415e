#include <gtest/gtest.h>

#include "EngineSelector.hpp"
#include "NoOpEngine.hpp"
#include "RemoteSpeechEngine.hpp"
#include "TestSupport.hpp"
#include "WhisperEngine.hpp"

using namespace vnt;
using vnt::test::FakeEngine;
using vnt::test::FakeEngineScript;
using vnt::test::FakeFetcher;
using vnt::test::TempDir;
using vnt::test::capable_device;

class EngineSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ModelArtifact artifact;
        artifact.engine_id      = WhisperEngine::kEngineId;
        artifact.url            = "https://models.example/ggml-tiny.bin";
        artifact.file_name      = "whisper-tiny.bin";
        artifact.expected_bytes = 1024;

        models_ = std::make_unique<ModelArtifactManager>(
            artifact, dir_.file("models"), DownloadPolicy{},
            std::make_shared<FakeFetcher>(std::vector<FakeFetcher::Step>{FakeFetcher::Step{}}),
            [](std::chrono::milliseconds) {});
        language_ = std::make_shared<ScriptLanguageIdentifier>();
    }

    DeviceInfo device_with_memory(int64_t megabytes) const {
        DeviceInfo d = capable_device();
        d.total_memory_bytes = megabytes * kBytesPerMegabyte;
        return d;
    }

    TempDir                                   dir_;
    PipelineConfig                            config_;
    std::unique_ptr<ModelArtifactManager>     models_;
    std::shared_ptr<const LanguageIdentifier> language_;
};

TEST_F(EngineSelectorTest, LowMemoryDeviceGetsNoOp) {
    EngineSelector selector = EngineSelector::with_default_engines(config_, *models_, language_);

    auto engine = selector.select(device_with_memory(1200));
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->engine_id(), NoOpEngine::kEngineId);
}

TEST_F(EngineSelectorTest, CapableDeviceOnWifiGetsWhisper) {
    EngineSelector selector = EngineSelector::with_default_engines(config_, *models_, language_);

    auto engine = selector.select(device_with_memory(3000));
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->engine_id(), WhisperEngine::kEngineId);
    EXPECT_TRUE(engine->requires_model_artifact());
}

TEST_F(EngineSelectorTest, WhisperUnavailableWithoutModelOnMeteredNetwork) {
    EngineSelector selector = EngineSelector::with_default_engines(config_, *models_, language_);

    DeviceInfo device = device_with_memory(3000);
    device.network = NetworkClass::metered;
    EXPECT_EQ(selector.select(device)->engine_id(), NoOpEngine::kEngineId);
}

TEST_F(EngineSelectorTest, WhisperAvailableOfflineOnceModelIsPresent) {
    std::filesystem::create_directories(dir_.file("models"));
    vnt::test::write_bytes(models_->model_file(), std::string(1024, 'm'));
    ASSERT_TRUE(models_->are_models_present());

    EngineSelector selector = EngineSelector::with_default_engines(config_, *models_, language_);

    DeviceInfo device = device_with_memory(3000);
    device.network = NetworkClass::none;
    EXPECT_EQ(selector.select(device)->engine_id(), WhisperEngine::kEngineId);
}

TEST_F(EngineSelectorTest, RemoteEngineOnlyWithApiKey) {
    EngineSelector without_key = EngineSelector::with_default_engines(config_, *models_, language_);
    EXPECT_EQ(without_key.create_by_id(RemoteSpeechEngine::kEngineId, capable_device()), nullptr);

    config_.remote_api_key = "secret";
    EngineSelector with_key = EngineSelector::with_default_engines(config_, *models_, language_);
    EXPECT_EQ(with_key.select(capable_device())->engine_id(), RemoteSpeechEngine::kEngineId);

    // Offline, the remote engine steps aside for whisper.
    DeviceInfo offline = capable_device();
    offline.network = NetworkClass::none;
    std::filesystem::create_directories(dir_.file("models"));
    vnt::test::write_bytes(models_->model_file(), std::string(1024, 'm'));
    EXPECT_EQ(with_key.select(offline)->engine_id(), WhisperEngine::kEngineId);
}

TEST_F(EngineSelectorTest, FirstAvailableCandidateWins) {
    auto first = std::make_shared<FakeEngineScript>();
    first->engine_id = "first";
    first->available = false;
    auto second = std::make_shared<FakeEngineScript>();
    second->engine_id = "second";

    EngineSelector selector({
        {"first", [first](const DeviceInfo&) { return std::make_unique<FakeEngine>(first); }},
        {"second", [second](const DeviceInfo&) { return std::make_unique<FakeEngine>(second); }},
    });

    EXPECT_EQ(selector.select(capable_device())->engine_id(), "second");
    EXPECT_EQ(selector.available_engine_ids(capable_device()),
              (std::vector<std::string>{"second", "noop"}));

    second->available = false;
    EXPECT_EQ(selector.select(capable_device())->engine_id(), NoOpEngine::kEngineId);
    EXPECT_EQ(selector.available_engine_ids(capable_device()),
              (std::vector<std::string>{"noop"}));
}

TEST_F(EngineSelectorTest, CreateById) {
    EngineSelector selector = EngineSelector::with_default_engines(config_, *models_, language_);

    auto whisper = selector.create_by_id(WhisperEngine::kEngineId, capable_device());
    ASSERT_NE(whisper, nullptr);
    EXPECT_EQ(whisper->engine_id(), WhisperEngine::kEngineId);

    auto noop = selector.create_by_id(NoOpEngine::kEngineId, capable_device());
    ASSERT_NE(noop, nullptr);
    EXPECT_EQ(noop->engine_id(), NoOpEngine::kEngineId);

    EXPECT_EQ(selector.create_by_id("does-not-exist", capable_device()), nullptr);
}

// ---------------------------------------------------------------------------
// Fallback engines
// ---------------------------------------------------------------------------

TEST(NoOpEngineTest, AlwaysAvailableNeverTranscribes) {
    NoOpEngine engine;
    EXPECT_TRUE(engine.is_available(DeviceInfo{}));
    EXPECT_TRUE(engine.initialize().ok());
    EXPECT_EQ(engine.estimate_processing_seconds(30), 0);

    PcmBuffer pcm;
    pcm.samples.assign(16000, 0.0f);
    Outcome<TranscriptionResult> result = engine.transcribe(pcm);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), TranscriptionError::engine_unavailable);
}

TEST(RemoteSpeechEngineTest, NeedsKeyAndNetwork) {
    DeviceInfo online = capable_device();
    DeviceInfo offline = capable_device();
    offline.network = NetworkClass::none;

    RemoteSpeechEngine no_key("", online);
    EXPECT_FALSE(no_key.is_available(online));
    EXPECT_EQ(no_key.initialize().error(), TranscriptionError::api_key_missing);

    RemoteSpeechEngine keyed("secret", offline);
    EXPECT_TRUE(keyed.is_available(online));
    EXPECT_FALSE(keyed.is_available(offline));

    PcmBuffer pcm;
    pcm.samples.assign(1600, 0.0f);
    EXPECT_EQ(keyed.transcribe(pcm).error(), TranscriptionError::network_unavailable);
}
