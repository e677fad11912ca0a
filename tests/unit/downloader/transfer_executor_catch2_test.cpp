#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../../common/test_helpers_catch2.h"
#include "fake_http_adapter.h"

#include <modelfetch/downloader/transfer_executor.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace modelfetch::downloader;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using modelfetch::test::FakeHttpAdapter;
using modelfetch::test::make_payload;
using modelfetch::test::read_file;
using modelfetch::test::TempDirGuard;
using modelfetch::test::to_bytes;

namespace {

constexpr const char* kUrl = "https://models.example.com/weights.bin";

std::string sha256Of(const std::string& data) {
    auto v = makeIntegrityVerifier();
    v->reset(HashAlgo::Sha256);
    auto bytes = to_bytes(data);
    v->update(bytes);
    return v->finalize().hex;
}

// Pauses the task as soon as the finished artifact is synced, before it is hashed.
class PauseOnSyncDisk final : public IDiskWriter {
public:
    explicit PauseOnSyncDisk(std::unique_ptr<IDiskWriter> inner) : inner_(std::move(inner)) {}

    TaskEntryPtr target;

    Expected<void> openForResume(const fs::path& partial, std::uint64_t offset) override {
        return inner_->openForResume(partial, offset);
    }
    Expected<void> writeAt(const fs::path& partial, std::uint64_t offset,
                           std::span<const std::byte> data) override {
        return inner_->writeAt(partial, offset, data);
    }
    Expected<void> sync(const fs::path& partial) override {
        auto r = inner_->sync(partial);
        if (target) {
            std::lock_guard lk(target->mutex);
            target->transitionLocked(TaskState::Paused);
        }
        return r;
    }
    Expected<void> finalize(const fs::path& partial, const fs::path& destination) override {
        return inner_->finalize(partial, destination);
    }
    std::optional<std::uint64_t> sizeOf(const fs::path& file) noexcept override {
        return inner_->sizeOf(file);
    }
    std::uint64_t usedBytes(const fs::path& dir) noexcept override {
        return inner_->usedBytes(dir);
    }
    bool remove(const fs::path& file) noexcept override { return inner_->remove(file); }

private:
    std::unique_ptr<IDiskWriter> inner_;
};

struct ExecutorFixture {
    TempDirGuard dir;
    FakeHttpAdapter http;
    std::unique_ptr<IDiskWriter> disk = makeDiskWriter();
    TaskStore store;
    std::vector<DownloadTask> terminal;
    ExecutorConfig config;

    ExecutorFixture() {
        http.blockSize = 1024;
        config.chunkSizeBytes = 1024;
        config.progressInterval = 1h;
        config.fsyncOnComplete = false;
    }

    TransferExecutor executor() {
        return TransferExecutor(config, http, *disk,
                                [this](const DownloadTask& t) { terminal.push_back(t); });
    }

    TaskEntryPtr addTask(std::optional<std::uint64_t> total, int maxAttempts = 3) {
        DownloadTask t;
        t.id = "exec-" + std::to_string(store.size());
        t.sourceRef = kUrl;
        t.destinationPath = dir.path() / ("out" + std::to_string(store.size()) + ".bin");
        t.partialPath = t.destinationPath;
        t.partialPath += ".part";
        t.bytesTotal = total;
        t.retry.maxAttempts = maxAttempts;
        t.retry.initialBackoff = 1ms;
        t.retry.maxBackoff = 5ms;
        auto entry = store.tryInsert(std::move(t));
        REQUIRE(entry);
        return entry;
    }

    static std::uint64_t admit(const TaskEntryPtr& entry) {
        std::lock_guard lk(entry->mutex);
        REQUIRE(entry->transitionLocked(TaskState::Downloading));
        return entry->epoch.load();
    }

    static DownloadTask record(const TaskEntryPtr& entry) {
        std::lock_guard lk(entry->mutex);
        return entry->task;
    }
};

} // namespace

TEST_CASE_METHOD(ExecutorFixture, "TransferExecutor: completes a transfer",
                 "[downloader][executor]") {
    const auto payload = make_payload(5000);
    http.addObject(kUrl, payload);

    SECTION("known size skips the probe") {
        auto entry = addTask(payload.size());
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);

        auto task = record(entry);
        CHECK(task.state == TaskState::Completed);
        CHECK(task.bytesTransferred == payload.size());
        CHECK(task.checksum == "sha256:" + sha256Of(payload));
        CHECK(read_file(task.destinationPath) == payload);
        CHECK_FALSE(fs::exists(task.partialPath));
        CHECK(http.probeCalls() == 0);
        REQUIRE(terminal.size() == 1);
        CHECK(terminal[0].state == TaskState::Completed);
    }

    SECTION("unknown size is probed") {
        auto entry = addTask(std::nullopt);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);
        CHECK(http.probeCalls() == 1);
        CHECK(record(entry).bytesTotal == std::optional<std::uint64_t>{payload.size()});
    }

    SECTION("server without Content-Length streams to EOF") {
        http.advertiseLength = false;
        auto entry = addTask(std::nullopt);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);
        auto task = record(entry);
        CHECK(task.bytesTotal == std::optional<std::uint64_t>{payload.size()});
        CHECK(read_file(task.destinationPath) == payload);
    }

    SECTION("matching checksum") {
        auto entry = addTask(payload.size());
        {
            std::lock_guard lk(entry->mutex);
            entry->task.expectedChecksum = parseChecksum("sha256:" + sha256Of(payload));
        }
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);
    }

    SECTION("empty object") {
        http.addObject(kUrl, "");
        auto entry = addTask(0);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);
        auto task = record(entry);
        CHECK(fs::exists(task.destinationPath));
        CHECK(fs::file_size(task.destinationPath) == 0);
    }
}

TEST_CASE_METHOD(ExecutorFixture, "TransferExecutor: retries resume from the committed offset",
                 "[downloader][executor][retry]") {
    const auto payload = make_payload(5000);
    http.addObject(kUrl, payload);

    SECTION("transient failure mid-stream") {
        http.queueFailure({2048, Error{ErrorCode::NetworkError, "connection reset"}});
        auto entry = addTask(payload.size());
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Completed);

        auto task = record(entry);
        CHECK(task.attempt == 1);
        CHECK(http.fetchOffsets() == std::vector<std::uint64_t>{0, 2048});
        CHECK(read_file(task.destinationPath) == payload);
    }

    SECTION("attempts exhausted") {
        for (int i = 0; i < 3; ++i)
            http.queueFailure({0, Error{ErrorCode::ServerError, "HTTP error 503"}});
        auto entry = addTask(payload.size(), 3);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);

        auto task = record(entry);
        CHECK(task.state == TaskState::Failed);
        CHECK(task.attempt == 2);
        CHECK(task.lastError == "HTTP error 503");
        CHECK(http.fetchOffsets().size() == 3);
        REQUIRE(terminal.size() == 1);
        CHECK(terminal[0].state == TaskState::Failed);
    }

    SECTION("client errors are not retried") {
        auto entry = addTask(100);
        {
            std::lock_guard lk(entry->mutex);
            entry->task.sourceRef = "https://models.example.com/missing.bin";
        }
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);
        auto task = record(entry);
        CHECK(task.attempt == 0);
        CHECK(task.lastError == "HTTP error 404");
        CHECK(http.fetchOffsets().size() == 1);
    }

    SECTION("server that ignores Range fails instead of corrupting the file") {
        http.ignoreRange = true;
        http.queueFailure({2048, Error{ErrorCode::Timeout, "operation timed out"}});
        auto entry = addTask(payload.size());
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);
        auto task = record(entry);
        REQUIRE(task.lastError.has_value());
        CHECK_THAT(*task.lastError, ContainsSubstring("Range"));
        CHECK(task.bytesTransferred == 2048);
    }

    SECTION("short body is retried then fails") {
        auto entry = addTask(payload.size() + 1000, 2);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);
        auto task = record(entry);
        REQUIRE(task.lastError.has_value());
        CHECK_THAT(*task.lastError, ContainsSubstring("ended early"));
        CHECK(task.attempt == 1);
    }
}

TEST_CASE_METHOD(ExecutorFixture, "TransferExecutor: verification and limits",
                 "[downloader][executor]") {
    const auto payload = make_payload(3000);
    http.addObject(kUrl, payload);

    SECTION("checksum mismatch deletes the partial") {
        auto entry = addTask(payload.size());
        {
            std::lock_guard lk(entry->mutex);
            entry->task.expectedChecksum = parseChecksum("sha256:" + std::string(64, '0'));
        }
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);
        auto task = record(entry);
        REQUIRE(task.lastError.has_value());
        CHECK_THAT(*task.lastError, ContainsSubstring("Checksum mismatch"));
        CHECK_FALSE(fs::exists(task.partialPath));
        CHECK_FALSE(fs::exists(task.destinationPath));
    }

    SECTION("a pause during verification keeps the partial for resume") {
        auto pausing = std::make_unique<PauseOnSyncDisk>(makeDiskWriter());
        auto* hook = pausing.get();
        disk = std::move(pausing);
        config.fsyncOnComplete = true;

        auto entry = addTask(payload.size());
        {
            std::lock_guard lk(entry->mutex);
            entry->task.expectedChecksum = parseChecksum("sha256:" + std::string(64, '0'));
        }
        hook->target = entry;
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Stopped);

        auto task = record(entry);
        CHECK(task.state == TaskState::Paused);
        CHECK(task.resumeOffset == payload.size());
        CHECK(fs::exists(task.partialPath));
        CHECK(terminal.empty());
    }

    SECTION("max file size is enforced before transfer") {
        config.maxFileBytes = 1000;
        auto entry = addTask(std::nullopt);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);
        CHECK(http.fetchOffsets().empty());
        CHECK_THAT(record(entry).lastError.value_or(""), ContainsSubstring("max_file_bytes"));
    }

    SECTION("stale admission does nothing") {
        auto entry = addTask(payload.size());
        const auto epoch = admit(entry);
        auto exec = executor();
        CHECK(exec.run(entry, epoch + 1) == RunOutcome::Stopped);
        CHECK(http.fetchOffsets().empty());
        CHECK(record(entry).state == TaskState::Downloading);
    }
}

TEST_CASE_METHOD(ExecutorFixture, "TransferExecutor: transferred bytes never exceed the total",
                 "[downloader][executor]") {
    SECTION("server sends more than the expected size") {
        http.addObject(kUrl, make_payload(3000));
        http.ignoreRequestedSize = true;
        auto entry = addTask(2048);
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);

        auto task = record(entry);
        CHECK(task.state == TaskState::Failed);
        REQUIRE(task.bytesTotal.has_value());
        CHECK(task.bytesTransferred <= *task.bytesTotal);
        CHECK(task.bytesTransferred == 2048);
        CHECK_THAT(task.lastError.value_or(""),
                   ContainsSubstring("more than the expected 2048 bytes"));
        CHECK(fs::file_size(task.partialPath) == 2048);
        CHECK_FALSE(fs::exists(task.destinationPath));
    }

    SECTION("source shorter than the bytes already on disk") {
        http.addObject(kUrl, make_payload(3000));
        auto entry = addTask(std::nullopt);
        {
            std::lock_guard lk(entry->mutex);
            entry->task.bytesTransferred = 4096;
            entry->task.resumeOffset = 4096;
            modelfetch::test::write_file(entry->task.partialPath, make_payload(4096));
        }
        auto exec = executor();
        CHECK(exec.run(entry, admit(entry)) == RunOutcome::Failed);

        auto task = record(entry);
        CHECK_FALSE(task.bytesTotal.has_value());
        CHECK_THAT(task.lastError.value_or(""), ContainsSubstring("shrank"));
        CHECK(http.probeCalls() == 1);
        CHECK(http.fetchOffsets().empty());
    }
}

TEST_CASE("TransferExecutor: backoff schedule", "[downloader][executor][retry]") {
    RetryPolicy policy;
    policy.initialBackoff = 100ms;
    policy.multiplier = 2.0;
    policy.maxBackoff = 1000ms;

    CHECK(TransferExecutor::backoffFor(policy, 1) == 100ms);
    CHECK(TransferExecutor::backoffFor(policy, 2) == 200ms);
    CHECK(TransferExecutor::backoffFor(policy, 3) == 400ms);
    CHECK(TransferExecutor::backoffFor(policy, 5) == 1000ms);

    policy.multiplier = 0.5; // never shrinks below the initial delay
    CHECK(TransferExecutor::backoffFor(policy, 3) == 100ms);
}
