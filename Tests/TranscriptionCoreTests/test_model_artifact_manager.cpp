#include <gtest/gtest.h>

#include "ModelArtifactManager.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace vnt;
using vnt::test::FakeFetcher;
using vnt::test::TempDir;
using vnt::test::capable_device;
using vnt::test::write_bytes;

namespace {

constexpr int64_t kModelBytes = 4096;

ModelArtifact tiny_artifact() {
    ModelArtifact a;
    a.engine_id      = "whisper-tiny";
    a.url            = "https://models.example/ggml-tiny.bin";
    a.file_name      = "whisper-tiny.bin";
    a.expected_bytes = kModelBytes;
    return a;
}

} // namespace

class ModelArtifactManagerTest : public ::testing::Test {
protected:
    std::unique_ptr<ModelArtifactManager> make_manager(std::shared_ptr<FakeFetcher> fetcher) {
        return std::make_unique<ModelArtifactManager>(
            tiny_artifact(), dir_.file("models"), DownloadPolicy{}, fetcher,
            [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    TempDir                                dir_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(ModelArtifactManagerTest, ReadinessChecksNetworkThenStorage) {
    auto fetcher = std::make_shared<FakeFetcher>(std::vector<FakeFetcher::Step>{FakeFetcher::Step{}});
    auto models = make_manager(fetcher);

    DeviceInfo device = capable_device();
    EXPECT_EQ(models->can_download(device), Readiness::ready);

    device.network = NetworkClass::metered;
    EXPECT_EQ(models->can_download(device), Readiness::no_wifi);

    device.network = NetworkClass::none;
    EXPECT_EQ(models->can_download(device), Readiness::no_wifi);

    device = capable_device();
    device.available_storage_bytes = 99 * kBytesPerMegabyte;
    EXPECT_EQ(models->can_download(device), Readiness::insufficient_storage);
}

TEST_F(ModelArtifactManagerTest, MeteredNetworkNeverFetches) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    DeviceInfo device = capable_device();
    device.network = NetworkClass::metered;

    DownloadResult result = models->download(device);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DownloadError::no_wifi);
    EXPECT_EQ(fetcher->calls(), 0);
    EXPECT_FALSE(models->are_models_present());
}

TEST_F(ModelArtifactManagerTest, LowStorageNeverFetches) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    DeviceInfo device = capable_device();
    device.available_storage_bytes = 10 * kBytesPerMegabyte;

    DownloadResult result = models->download(device);
    EXPECT_EQ(result.error, DownloadError::insufficient_storage);
    EXPECT_EQ(fetcher->calls(), 0);
}

TEST_F(ModelArtifactManagerTest, SuccessfulDownloadMakesModelPresent) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    int last_progress = -1;
    DownloadResult result = models->download(capable_device(),
                                             [&](int p) { last_progress = p; });

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(last_progress, 100);
    EXPECT_EQ(fetcher->last_url(), "https://models.example/ggml-tiny.bin");
    EXPECT_TRUE(models->are_models_present());
    EXPECT_EQ(models->model_size_bytes(), kModelBytes);
    EXPECT_FALSE(std::filesystem::exists(models->model_file() + ".part"));
    EXPECT_EQ(models->can_download(capable_device()), Readiness::already_present);

    // Already present: nothing to fetch.
    EXPECT_TRUE(models->download(capable_device()).ok);
    EXPECT_EQ(fetcher->calls(), 1);
}

TEST_F(ModelArtifactManagerTest, SizeMismatchDiscardsFile) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes - 1}});
    auto models = make_manager(fetcher);

    DownloadResult result = models->download(capable_device());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DownloadError::size_mismatch);
    EXPECT_EQ(fetcher->calls(), 3);
    EXPECT_FALSE(models->are_models_present());
    EXPECT_FALSE(std::filesystem::exists(models->model_file()));
    EXPECT_FALSE(std::filesystem::exists(models->model_file() + ".part"));
}

TEST_F(ModelArtifactManagerTest, TimeoutsRetryWithExponentialBackoff) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::timeout, 0}});
    auto models = make_manager(fetcher);

    DownloadResult result = models->download(capable_device());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DownloadError::timeout);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(fetcher->calls(), 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));
    EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(4000));
    EXPECT_FALSE(models->are_models_present());
}

TEST_F(ModelArtifactManagerTest, RecoversOnSecondAttempt) {
    auto fetcher = std::make_shared<FakeFetcher>(std::vector<FakeFetcher::Step>{
        {FetchStatus::network_error, 0}, {FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    DownloadResult result = models->download(capable_device());

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.attempts, 2);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(2000));
}

TEST_F(ModelArtifactManagerTest, CorruptExistingFileIsReplaced) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    std::filesystem::create_directories(dir_.file("models"));
    write_bytes(models->model_file(), "truncated");
    EXPECT_FALSE(models->are_models_present());

    EXPECT_TRUE(models->download(capable_device()).ok);
    EXPECT_EQ(models->model_size_bytes(), kModelBytes);
}

TEST_F(ModelArtifactManagerTest, ConcurrentDownloadsShareOneTransfer) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    fetcher->set_delay(std::chrono::milliseconds(200));
    auto models = make_manager(fetcher);

    DownloadResult first;
    DownloadResult second;
    std::thread a([&] { first = models->download(capable_device()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread b([&] { second = models->download(capable_device()); });
    a.join();
    b.join();

    EXPECT_TRUE(first.ok);
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(fetcher->calls(), 1);
    EXPECT_FALSE(models->is_download_in_flight());
}

TEST_F(ModelArtifactManagerTest, DeleteModelsRemovesFile) {
    auto fetcher = std::make_shared<FakeFetcher>(
        std::vector<FakeFetcher::Step>{{FetchStatus::ok, kModelBytes}});
    auto models = make_manager(fetcher);

    ASSERT_TRUE(models->download(capable_device()).ok);
    ASSERT_TRUE(models->are_models_present());

    EXPECT_TRUE(models->delete_models());
    EXPECT_FALSE(models->are_models_present());
    EXPECT_EQ(models->model_size_bytes(), 0);
}

TEST(HttpArtifactFetcherTest, SplitUrl) {
    std::string base;
    std::string path;

    ASSERT_TRUE(HttpArtifactFetcher::split_url(
        "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin", base, path));
    EXPECT_EQ(base, "https://huggingface.co");
    EXPECT_EQ(path, "/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin");

    ASSERT_TRUE(HttpArtifactFetcher::split_url("http://localhost:8080", base, path));
    EXPECT_EQ(base, "http://localhost:8080");
    EXPECT_EQ(path, "/");

    EXPECT_FALSE(HttpArtifactFetcher::split_url("huggingface.co/model.bin", base, path));
    EXPECT_FALSE(HttpArtifactFetcher::split_url("https://", base, path));
}
