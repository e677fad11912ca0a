#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "../../common/test_helpers_catch2.h"
#include "fake_http_adapter.h"

#include <modelfetch/downloader/download_manager.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <future>
#include <memory>
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
using modelfetch::test::write_file;

namespace {

constexpr const char* kUrlA = "https://models.example.com/a.bin";
constexpr const char* kUrlB = "https://models.example.com/b.bin";
constexpr const char* kUrlC = "https://models.example.com/c.bin";

struct ManagerFixture {
    TempDirGuard dir;
    FakeHttpAdapter* http{nullptr};
    std::unique_ptr<DownloadManager> manager;

    modelfetch::config::ManagerConfig baseConfig() const {
        modelfetch::config::ManagerConfig cfg;
        cfg.cacheDir = dir.path() / "cache";
        cfg.maxConcurrentDownloads = 3;
        cfg.chunkSizeBytes = 1024;
        cfg.progressInterval = 1h;
        cfg.fsyncOnComplete = false;
        cfg.sweepInterval = 0ms;
        cfg.retry.maxAttempts = 3;
        cfg.retry.initialBackoff = 1ms;
        cfg.retry.maxBackoff = 5ms;
        return cfg;
    }

    void start(modelfetch::config::ManagerConfig cfg) {
        auto fake = std::make_unique<FakeHttpAdapter>();
        fake->blockSize = 1024;
        http = fake.get();
        manager = std::make_unique<DownloadManager>(std::move(cfg), std::move(fake),
                                                    makeDiskWriter());
    }

    ManagerFixture() { start(baseConfig()); }

    DownloadRequest request(const std::string& url, const std::string& dest) const {
        DownloadRequest r;
        r.sourceRef = url;
        r.destinationPath = dest;
        return r;
    }

    TaskId install(const DownloadRequest& r) {
        auto queued = manager->install(r);
        REQUIRE(queued);
        return queued.value();
    }

    TaskState stateOf(const TaskId& id) const {
        auto t = manager->getTask(id);
        REQUIRE(t.has_value());
        return t->state;
    }

    fs::path partialOf(const TaskId& id) const {
        auto t = manager->getTask(id);
        REQUIRE(t.has_value());
        auto p = t->destinationPath;
        p += ".part";
        return p;
    }
};

// Routes the default logger into a ring buffer for the lifetime of the guard.
class CapturedLog {
public:
    CapturedLog()
        : previous_(spdlog::default_logger()),
          sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
        sink_->set_pattern("%v");
        auto logger = std::make_shared<spdlog::logger>("captured", sink_);
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
    }
    ~CapturedLog() { spdlog::set_default_logger(previous_); }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    // Index of the first line containing needle, or -1.
    long indexOf(const std::string& needle) const {
        const auto lines = sink_->last_formatted();
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].find(needle) != std::string::npos)
                return static_cast<long>(i);
        }
        return -1;
    }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: queueing is logged before the transfer starts",
                 "[downloader][manager][scheduler]") {
    CapturedLog log;
    http->addObject(kUrlA, make_payload(1024));
    const auto id = install(request(kUrlA, "logged.bin"));
    REQUIRE(manager->waitForTask(id, 5000ms)->state == TaskState::Completed);
    manager->shutdown(); // joins the workers before the logger is swapped back

    const auto queued = log.indexOf("Queued download " + id);
    const auto started = log.indexOf("Transfer " + id + ": starting");
    REQUIRE(queued >= 0);
    REQUIRE(started >= 0);
    CHECK(queued < started);
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: fresh state and unknown ids",
                 "[downloader][manager]") {
    CHECK(manager->getActiveTasks().empty());
    auto stats = manager->getDownloadStats();
    CHECK(stats.totalDownloads == 0);
    CHECK(stats.averageSpeed == 0.0);

    CHECK_FALSE(manager->pause("no-such-task"));
    CHECK_FALSE(manager->resume("no-such-task"));
    CHECK_FALSE(manager->cancel("no-such-task"));
    CHECK_FALSE(manager->getTask("no-such-task").has_value());
    CHECK_FALSE(manager->getDownloadProgress("no-such-task").has_value());
    CHECK_FALSE(manager->waitForTask("no-such-task", 10ms).has_value());
    CHECK(fs::is_directory(dir.path() / "cache"));
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: request validation",
                 "[downloader][manager][scheduler]") {
    http->addObject(kUrlA, make_payload(4096));

    SECTION("missing source or destination") {
        auto r = manager->install(request("", "x.bin"));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == modelfetch::ErrorCode::InvalidArgument);

        auto d = manager->install(request(kUrlA, ""));
        REQUIRE_FALSE(d);
        CHECK(d.error().code == modelfetch::ErrorCode::InvalidArgument);
    }

    SECTION("malformed checksum") {
        auto req = request(kUrlA, "x.bin");
        req.checksum = "sha256:not-hex";
        auto r = manager->install(req);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == modelfetch::ErrorCode::InvalidArgument);
    }

    SECTION("retry policy without attempts") {
        auto req = request(kUrlA, "x.bin");
        RetryPolicy none;
        none.maxAttempts = 0;
        req.retry = none;
        auto r = manager->install(req);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == modelfetch::ErrorCode::InvalidArgument);
    }

    SECTION("a destination has one active owner") {
        http->holdAt(1024);
        const auto first = install(request(kUrlA, "same.bin"));
        REQUIRE(http->waitUntilHeld());

        auto dup = manager->install(request(kUrlB, "same.bin"));
        REQUIRE_FALSE(dup);
        CHECK(dup.error().code == modelfetch::ErrorCode::OperationInProgress);

        REQUIRE(manager->cancel(first));
        CHECK(manager->install(request(kUrlA, "same.bin")));
        http->release();
    }

    SECTION("tasks beyond the cache ceiling are refused") {
        auto cfg = baseConfig();
        cfg.maxCacheBytes = 10000;
        start(cfg);
        write_file(cfg.cacheDir / "existing.bin", std::string(6000, 'x'));

        auto req = request(kUrlA, "big.bin");
        req.expectedBytes = 5000;
        auto r = manager->install(req);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == modelfetch::ErrorCode::ResourceExhausted);

        req.expectedBytes = 3000;
        CHECK(manager->install(req));
    }
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: FIFO admission under the concurrency bound",
                 "[downloader][manager][scheduler]") {
    auto cfg = baseConfig();
    cfg.maxConcurrentDownloads = 1;
    start(cfg);
    for (auto* url : {kUrlA, kUrlB, kUrlC})
        http->addObject(url, make_payload(4096));

    http->holdAt(1024);
    const auto a = install(request(kUrlA, "a.bin"));
    const auto b = install(request(kUrlB, "b.bin"));
    const auto c = install(request(kUrlC, "c.bin"));
    REQUIRE(http->waitUntilHeld());

    auto active = manager->getActiveTasks();
    REQUIRE(active.size() == 3);
    CHECK(active[0].id == a);
    CHECK(active[0].state == TaskState::Downloading);
    CHECK(active[1].id == b);
    CHECK(active[1].state == TaskState::Queued);
    CHECK(active[2].id == c);
    CHECK(active[2].state == TaskState::Queued);

    SECTION("queued tasks run once the slot frees up") {
        http->release();
        for (const auto& id : {a, b, c}) {
            auto done = manager->waitForTask(id, 5000ms);
            REQUIRE(done.has_value());
            CHECK(done->state == TaskState::Completed);
        }
        CHECK(manager->getActiveTasks().empty());
        CHECK(manager->getDownloadStats().successfulDownloads == 3);
    }

    SECTION("a queued task can be cancelled before it starts") {
        REQUIRE(manager->cancel(b));
        CHECK(stateOf(b) == TaskState::Cancelled);
        http->release();
        REQUIRE(manager->waitForTask(c, 5000ms)->state == TaskState::Completed);
        CHECK(stateOf(b) == TaskState::Cancelled);
        CHECK(http->fetchOffsets().size() == 2);
    }
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: pause and resume continue at the committed byte",
                 "[downloader][manager][scheduler]") {
    const auto payload = make_payload(8192);
    http->addObject(kUrlA, payload);
    http->holdAt(3072);

    const auto id = install(request(kUrlA, "models/resumable.bin"));
    REQUIRE(http->waitUntilHeld());

    REQUIRE(manager->pause(id));
    CHECK_FALSE(manager->pause(id));
    auto paused = manager->getTask(id);
    REQUIRE(paused.has_value());
    CHECK(paused->state == TaskState::Paused);
    CHECK(paused->resumeOffset == 3072);
    CHECK(paused->bytesTransferred == 3072);
    CHECK(manager->getActiveTasks().empty());

    REQUIRE(http->waitUntilIdle());
    CHECK(fs::file_size(partialOf(id)) == 3072);

    REQUIRE(manager->resume(id));
    CHECK_FALSE(manager->resume(id));
    auto done = manager->waitForTask(id, 5000ms);
    REQUIRE(done.has_value());
    CHECK(done->state == TaskState::Completed);
    CHECK(http->fetchOffsets() == std::vector<std::uint64_t>{0, 3072});
    CHECK(read_file(done->destinationPath) == payload);
    CHECK(done->destinationPath == (dir.path() / "cache" / "models" / "resumable.bin"));

    CHECK_FALSE(manager->pause(id));
    CHECK_FALSE(manager->cancel(id));
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: cancel", "[downloader][manager][scheduler]") {
    http->addObject(kUrlA, make_payload(8192));
    http->holdAt(2048);

    SECTION("removes the partial artifact by default") {
        const auto id = install(request(kUrlA, "cancel.bin"));
        REQUIRE(http->waitUntilHeld());
        const auto partial = partialOf(id);
        REQUIRE(fs::exists(partial));

        REQUIRE(manager->cancel(id));
        CHECK(stateOf(id) == TaskState::Cancelled);
        CHECK_FALSE(fs::exists(partial));

        REQUIRE(http->waitUntilIdle());
        CHECK_FALSE(fs::exists(partial));
        CHECK_FALSE(manager->cancel(id));
        CHECK_FALSE(manager->resume(id));
        CHECK(manager->getTask(id)->bytesTransferred == 2048);

        auto stats = manager->getDownloadStats();
        CHECK(stats.totalDownloads == 1);
        CHECK(stats.failedDownloads == 0);
        CHECK(stats.successfulDownloads == 0);
    }

    SECTION("keeps the partial when asked") {
        const auto id = install(request(kUrlA, "keep.bin"));
        REQUIRE(http->waitUntilHeld());
        REQUIRE(manager->cancel(id, true));
        REQUIRE(http->waitUntilIdle());
        CHECK(fs::file_size(partialOf(id)) == 2048);
    }

    SECTION("a kept partial is picked up by the next install for the destination") {
        const auto payload = make_payload(8192);
        http->addObject(kUrlB, payload);
        http->holdAt(4096);
        const auto first = install(request(kUrlB, "kept.bin"));
        REQUIRE(http->waitUntilHeld());
        REQUIRE(manager->cancel(first, true));
        REQUIRE(http->waitUntilIdle());
        const auto partial = partialOf(first);
        REQUIRE(fs::file_size(partial) == 4096);

        const auto second = install(request(kUrlB, "kept.bin"));
        auto queued = manager->getTask(second);
        REQUIRE(queued.has_value());
        CHECK(queued->resumeOffset == 4096);

        auto done = manager->waitForTask(second, 5000ms);
        REQUIRE(done.has_value());
        CHECK(done->state == TaskState::Completed);
        CHECK(http->fetchOffsets() == std::vector<std::uint64_t>{0, 4096});
        CHECK(read_file(done->destinationPath) == payload);
        CHECK_FALSE(fs::exists(partial));
    }

    SECTION("a kept partial larger than the expected size starts over") {
        const auto id = install(request(kUrlA, "oversized.bin"));
        REQUIRE(http->waitUntilHeld());
        REQUIRE(manager->cancel(id, true));
        REQUIRE(http->waitUntilIdle());

        auto req = request(kUrlA, "oversized.bin");
        req.expectedBytes = 1024;
        const auto second = install(req);
        auto queued = manager->getTask(second);
        REQUIRE(queued.has_value());
        CHECK(queued->resumeOffset == 0);

        auto done = manager->waitForTask(second, 5000ms);
        REQUIRE(done.has_value());
        CHECK(done->state == TaskState::Completed);
        CHECK(http->fetchOffsets() == std::vector<std::uint64_t>{0, 0});
        CHECK(fs::file_size(done->destinationPath) == 1024);
    }

    SECTION("paused tasks can be cancelled") {
        const auto id = install(request(kUrlA, "paused.bin"));
        REQUIRE(http->waitUntilHeld());
        REQUIRE(manager->pause(id));
        REQUIRE(http->waitUntilIdle());
        REQUIRE(manager->cancel(id));
        CHECK(stateOf(id) == TaskState::Cancelled);
        CHECK_FALSE(fs::exists(partialOf(id)));
    }
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: progress of a running task",
                 "[downloader][manager][progress]") {
    http->addObject(kUrlA, make_payload(4096));
    http->holdAt(2048);
    const auto id = install(request(kUrlA, "progress.bin"));
    REQUIRE(http->waitUntilHeld());

    auto p = manager->getDownloadProgress(id);
    REQUIRE(p.has_value());
    CHECK(p->state == TaskState::Downloading);
    CHECK(p->bytesTransferred == 2048);
    REQUIRE(p->bytesTotal.has_value());
    CHECK(*p->bytesTotal == 4096);
    REQUIRE(p->percentComplete.has_value());
    CHECK(*p->percentComplete == 50.0);

    http->release();
    REQUIRE(manager->waitForTask(id, 5000ms)->state == TaskState::Completed);
    auto finished = manager->getDownloadProgress(id);
    REQUIRE(finished.has_value());
    CHECK(*finished->percentComplete == 100.0);
    CHECK(finished->currentSpeed == 0.0);
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: downloadModel", "[downloader][manager]") {
    const auto payload = make_payload(3000);
    http->addObject(kUrlA, payload);

    SECTION("success") {
        auto req = request(kUrlA, "model.bin");
        req.headers.push_back(Header{"Authorization", "Bearer token"});
        auto result = manager->downloadModel(req);
        CHECK(result.success);
        CHECK(result.filePath == dir.path() / "cache" / "model.bin");
        CHECK(result.fileSize == payload.size());
        REQUIRE(result.checksum.has_value());
        CHECK_THAT(*result.checksum, ContainsSubstring("sha256:"));
        CHECK_FALSE(result.error.has_value());
        CHECK(read_file(result.filePath) == payload);

        auto headers = http->lastHeaders();
        CHECK(std::any_of(headers.begin(), headers.end(), [](const Header& h) {
            return h.name == "Authorization" && h.value == "Bearer token";
        }));
        CHECK(manager->getDownloadStats().successfulDownloads == 1);
    }

    SECTION("failure carries the error") {
        auto result = manager->downloadModel(request("https://models.example.com/404", "x.bin"));
        CHECK_FALSE(result.success);
        CHECK(result.error == "HTTP error 404");
        CHECK(result.filePath.empty());
        CHECK(manager->getDownloadStats().failedDownloads == 1);
    }

    SECTION("rejected request") {
        auto result = manager->downloadModel(request(kUrlA, ""));
        CHECK_FALSE(result.success);
        CHECK(result.taskId.empty());
        CHECK(result.error.has_value());
    }

    SECTION("timeout cancels the task") {
        http->holdAt(1024);
        auto result = manager->downloadModel(request(kUrlA, "slow.bin"), 50ms);
        CHECK_FALSE(result.success);
        CHECK(result.error == "Download timed out");
        REQUIRE_FALSE(result.taskId.empty());
        CHECK(stateOf(result.taskId) == TaskState::Cancelled);
    }
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: batches", "[downloader][manager][batch]") {
    SECTION("empty batch") {
        CHECK(manager->downloadBatch({}).empty());
    }

    SECTION("one failure does not affect its siblings") {
        http->addObject(kUrlA, make_payload(2000));
        http->addObject(kUrlC, make_payload(1500));
        std::vector<DownloadRequest> requests{
            request(kUrlA, "batch/a.bin"),
            request("https://models.example.com/missing", "batch/b.bin"),
            request(kUrlC, ""),
            request(kUrlC, "batch/c.bin"),
        };

        auto outcomes = manager->downloadBatch(requests);
        REQUIRE(outcomes.size() == 4);

        CHECK(outcomes[0].state == TaskState::Completed);
        CHECK(outcomes[0].fileSize == 2000);
        CHECK(read_file(outcomes[0].filePath) == make_payload(2000));

        CHECK(outcomes[1].state == TaskState::Failed);
        CHECK(outcomes[1].error == "HTTP error 404");
        CHECK(outcomes[1].filePath.empty());
        CHECK_FALSE(outcomes[1].taskId.empty());

        CHECK(outcomes[2].state == TaskState::Failed);
        CHECK(outcomes[2].taskId.empty());
        CHECK(outcomes[2].error.has_value());

        CHECK(outcomes[3].state == TaskState::Completed);
        CHECK(outcomes[3].fileSize == 1500);

        auto stats = manager->getDownloadStats();
        CHECK(stats.successfulDownloads == 2);
        CHECK(stats.failedDownloads == 1);
        CHECK(stats.totalBytesDownloaded == 3500);
    }
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: verifyDownload", "[downloader][manager]") {
    const auto file = write_file(dir.path() / "abc.txt", "abc");
    const std::string good = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    auto ok = manager->verifyDownload(file, good);
    REQUIRE(ok);
    CHECK(ok.value());

    auto bad = manager->verifyDownload(file, "sha256:" + std::string(64, 'f'));
    REQUIRE(bad);
    CHECK_FALSE(bad.value());

    auto missing = manager->verifyDownload(dir.path() / "missing.bin", good);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == modelfetch::ErrorCode::FileNotFound);

    auto malformed = manager->verifyDownload(file, "sha256:xyz");
    REQUIRE_FALSE(malformed);
    CHECK(malformed.error().code == modelfetch::ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: shutdown pauses running transfers",
                 "[downloader][manager][scheduler]") {
    http->addObject(kUrlA, make_payload(4096));
    http->holdAt(1024);
    const auto id = install(request(kUrlA, "shutdown.bin"));
    REQUIRE(http->waitUntilHeld());

    manager->shutdown();
    auto t = manager->getTask(id);
    REQUIRE(t.has_value());
    CHECK(t->state == TaskState::Paused);
    CHECK(t->resumeOffset == 1024);
    CHECK(fs::exists(partialOf(id)));

    CHECK_FALSE(manager->resume(id));
    CHECK(stateOf(id) == TaskState::Paused);
    CHECK(manager->getActiveTasks().empty());

    auto late = manager->install(request(kUrlA, "late.bin"));
    REQUIRE_FALSE(late);
    CHECK(late.error().code == modelfetch::ErrorCode::SystemShutdown);
    CHECK(late.error().message == "Download scheduler is stopped");
    CHECK(std::string(modelfetch::errorToString(late.error().code)) == "System shutdown");
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: shutdown releases blocked waiters",
                 "[downloader][manager][batch]") {
    http->addObject(kUrlA, make_payload(4096));
    http->holdAt(1024);

    auto pending = std::async(std::launch::async, [this] {
        return manager->downloadBatch({request(kUrlA, "interrupted.bin")});
    });
    REQUIRE(http->waitUntilHeld());

    manager->shutdown();
    REQUIRE(pending.wait_for(3s) == std::future_status::ready);
    const auto outcomes = pending.get();
    REQUIRE(outcomes.size() == 1);
    CHECK(outcomes[0].state == TaskState::Paused);
    CHECK(outcomes[0].error == "Download manager shut down");
    CHECK(outcomes[0].filePath.empty());
    REQUIRE_FALSE(outcomes[0].taskId.empty());

    // Later waits return at once with the paused record.
    auto snapshot = manager->waitForTask(outcomes[0].taskId);
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->state == TaskState::Paused);
    CHECK(snapshot->resumeOffset == 1024);
}

TEST_CASE_METHOD(ManagerFixture, "DownloadManager: statistics reset and cleanup",
                 "[downloader][manager][cleanup]") {
    http->addObject(kUrlA, make_payload(1024));
    auto result = manager->downloadModel(request(kUrlA, "done.bin"));
    REQUIRE(result.success);
    CHECK(manager->getDownloadStats().totalDownloads == 1);

    manager->resetStats();
    CHECK(manager->getDownloadStats().totalDownloads == 0);

    // Within the retention window nothing goes
    CHECK(manager->cleanupTasks().tasksRemoved == 0);
    CHECK(manager->getTask(result.taskId).has_value());

    auto swept = manager->cleanupTasks(true);
    CHECK(swept.tasksRemoved == 1);
    CHECK_FALSE(manager->getTask(result.taskId).has_value());
    CHECK(fs::exists(dir.path() / "cache" / "done.bin"));
}
