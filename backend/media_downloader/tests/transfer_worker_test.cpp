#include "application/transfer_worker.hpp"
#include "fake_media_provider.hpp"
#include <chrono>
#include <memory>
#include <gtest/gtest.h>

using namespace media_downloader;
using namespace media_downloader::test_support;
using namespace std::chrono_literals;

class TransferWorkerTest : public ::testing::Test {
protected:
  TransferWorkerTest()
    : dir_("worker"),
      ledger_(dir_.path() / "history.json"),
      limiter_(1000, 1s),
      provider_(std::make_shared<FakeMediaProvider>()) {}

  TransferWorker makeWorker(RetryPolicy policy = {}) {
    return TransferWorker(provider_, ledger_, limiter_, policy);
  }

  std::filesystem::path downloads() const { return dir_.path() / "downloads"; }

  void SetUp() override {
    std::filesystem::create_directories(downloads());
    ASSERT_TRUE(ledger_.load().has_value());
  }

  TempDir dir_;
  DownloadLedger ledger_;
  common::RateLimiter limiter_;
  std::shared_ptr<FakeMediaProvider> provider_;
};

TEST_F(TransferWorkerTest, DownloadsAndRecordsItem) {
  auto item = document("1", 300'000);
  provider_->add(item);

  std::uint64_t last_progress = 0;
  TransferWorker worker(provider_, ledger_, limiter_, RetryPolicy{},
    [&last_progress](const MediaDescriptor&, std::uint64_t so_far, std::uint64_t total) {
      EXPECT_LE(so_far, total);
      last_progress = so_far;
    });

  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);

  auto final_path = downloads() / "doc-1.bin";
  ASSERT_TRUE(std::filesystem::exists(final_path));
  EXPECT_EQ(std::filesystem::file_size(final_path), 300'000u);
  EXPECT_TRUE(matchesPattern(readFile(final_path)));
  EXPECT_FALSE(std::filesystem::exists(partialPath(final_path)));
  EXPECT_EQ(last_progress, 300'000u);

  auto entry = ledger_.find("chan", "1");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->filename, "doc-1.bin");
  EXPECT_EQ(entry->size_bytes, 300'000u);
  EXPECT_FALSE(entry->completed_at.empty());

  DownloadLedger persisted(ledger_.file());
  ASSERT_TRUE(persisted.load().has_value());
  EXPECT_TRUE(persisted.contains("chan", "1"));
}

TEST_F(TransferWorkerTest, SkipsItemsKnownToTheLedger) {
  auto item = document("2", 1000);
  provider_->add(item);
  ledger_.record("chan", "2", {"doc-2.bin", 1000, "2026-01-01T00:00:00Z"});

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Skipped);
  EXPECT_EQ(provider_->totalAttempts(), 0u);
  EXPECT_FALSE(std::filesystem::exists(downloads() / "doc-2.bin"));
}

TEST_F(TransferWorkerTest, SkipsItemsAlreadyOnDisk) {
  auto item = document("3", 1000);
  provider_->add(item);
  std::ofstream(downloads() / "doc-3.bin") << "user copy";

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Skipped);
  EXPECT_EQ(provider_->totalAttempts(), 0u);
  // no consistency repair: the ledger is left as it was
  EXPECT_FALSE(ledger_.contains("chan", "3"));
}

TEST_F(TransferWorkerTest, ResumesFromPartialFile) {
  constexpr std::uint64_t SIZE = 200'000;
  constexpr std::uint64_t ALREADY = 75'000;
  auto item = document("4", SIZE);
  provider_->add(item);

  auto final_path = downloads() / "doc-4.bin";
  {
    std::string head(ALREADY, '\0');
    for (std::uint64_t i = 0; i < ALREADY; ++i) {
      head[i] = patternByte(i);
    }
    std::ofstream(partialPath(final_path), std::ios::binary) << head;
  }

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);

  EXPECT_EQ(provider_->attemptOffsets("4"), std::vector<std::uint64_t>{ALREADY});
  EXPECT_EQ(provider_->bytesWritten(), SIZE - ALREADY);
  EXPECT_EQ(std::filesystem::file_size(final_path), SIZE);
  EXPECT_TRUE(matchesPattern(readFile(final_path)));
}

TEST_F(TransferWorkerTest, RetriesTimeoutsFromLatestOffset) {
  auto item = document("5", 10'000);
  provider_->add(item);
  provider_->script("5", {.bytes_before_error = 4'000, .error = TransferError::timeout("read timed out")});
  provider_->script("5", {.bytes_before_error = 0, .error = TransferError::timeout("read timed out")});
  provider_->script("5", {.bytes_before_error = 1'000, .error = TransferError::timeout("read timed out")});

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);

  EXPECT_EQ(provider_->attemptOffsets("5"), (std::vector<std::uint64_t>{0, 4'000, 4'000, 5'000}));
  EXPECT_EQ(provider_->bytesWritten(), 10'000u);
  EXPECT_TRUE(matchesPattern(readFile(downloads() / "doc-5.bin")));
}

TEST_F(TransferWorkerTest, EveryAttemptTakesARateToken) {
  common::RateLimiter tight(2, 300ms);
  auto item = document("6", 1'000);
  provider_->add(item);
  provider_->script("6", {.bytes_before_error = 0, .error = TransferError::timeout("timeout")});
  provider_->script("6", {.bytes_before_error = 0, .error = TransferError::timeout("timeout")});

  TransferWorker worker(provider_, ledger_, tight, RetryPolicy{});
  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);

  // three attempts through a bucket of two: the third waits for a refill
  EXPECT_EQ(provider_->totalAttempts(), 3u);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 250ms);
}

TEST_F(TransferWorkerTest, BoundedRetryPolicyGivesUp) {
  auto item = document("7", 1'000);
  provider_->add(item);
  for (int i = 0; i < 5; ++i) {
    provider_->script("7", {.bytes_before_error = 100, .error = TransferError::timeout("timeout")});
  }

  auto worker = makeWorker(RetryPolicy{.max_timeout_retries = 2, .backoff = 1ms});
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Failed);
  EXPECT_EQ(provider_->totalAttempts(), 3u);
  EXPECT_EQ(std::filesystem::file_size(partialPath(downloads() / "doc-7.bin")), 300u);
  EXPECT_FALSE(ledger_.contains("chan", "7"));
}

TEST_F(TransferWorkerTest, OtherFailuresAreNotRetriedAndKeepPartial) {
  auto item = document("8", 5'000);
  provider_->add(item);
  provider_->script("8", {.bytes_before_error = 1'234, .error = TransferError::failure("connection reset")});

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Failed);

  auto final_path = downloads() / "doc-8.bin";
  EXPECT_EQ(provider_->totalAttempts(), 1u);
  EXPECT_FALSE(std::filesystem::exists(final_path));
  EXPECT_EQ(std::filesystem::file_size(partialPath(final_path)), 1'234u);
  EXPECT_FALSE(ledger_.contains("chan", "8"));

  // the next run picks up where the failed one stopped
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);
  EXPECT_EQ(provider_->attemptOffsets("8").back(), 1'234u);
  EXPECT_EQ(std::filesystem::file_size(final_path), 5'000u);
}

TEST_F(TransferWorkerTest, ShortTransferIsNeverPromoted) {
  auto item = document("9", 8'000);
  provider_->add(item);
  // the stream "succeeds" but stops early
  provider_->script("9", {.bytes_before_error = 3'000, .error = std::nullopt});

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Failed);
  EXPECT_FALSE(std::filesystem::exists(downloads() / "doc-9.bin"));
  EXPECT_EQ(std::filesystem::file_size(partialPath(downloads() / "doc-9.bin")), 3'000u);
}

TEST_F(TransferWorkerTest, OversizedPartialIsRestarted) {
  auto item = document("10", 1'000);
  provider_->add(item);
  std::ofstream(partialPath(downloads() / "doc-10.bin"), std::ios::binary) << std::string(4'000, 'x');

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Downloaded);
  EXPECT_EQ(provider_->attemptOffsets("10"), std::vector<std::uint64_t>{0});
  EXPECT_TRUE(matchesPattern(readFile(downloads() / "doc-10.bin")));
}

TEST_F(TransferWorkerTest, ResolveFailureFailsItem) {
  auto item = document("11", 1'000);
  provider_->add(item);
  provider_->failResolve("11");

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads()), TransferOutcome::Failed);
  EXPECT_EQ(provider_->totalAttempts(), 0u);
}

TEST_F(TransferWorkerTest, PhotosAreStoredById) {
  MediaDescriptor photo;
  photo.id = "12";
  photo.collection_id = "chan";
  photo.size_bytes = 2'048;
  photo.payload = PhotoMedia{};
  provider_->add(photo);

  auto worker = makeWorker();
  EXPECT_EQ(worker.run(photo, downloads()), TransferOutcome::Downloaded);
  EXPECT_EQ(std::filesystem::file_size(downloads() / "12.jpg"), 2'048u);
  EXPECT_EQ(ledger_.find("chan", "12")->filename, "12.jpg");
}

TEST_F(TransferWorkerTest, StoppedBeforeFirstAttempt) {
  auto item = document("13", 1'000);
  provider_->add(item);

  std::stop_source stop;
  stop.request_stop();
  auto worker = makeWorker();
  EXPECT_EQ(worker.run(item, downloads(), stop.get_token()), TransferOutcome::Cancelled);
  EXPECT_EQ(provider_->totalAttempts(), 0u);
}
