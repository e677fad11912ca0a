#include <modelfetch/config/config_helpers.h>
#include <modelfetch/config/manager_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace modelfetch::config {

namespace {

constexpr const char* kSection = "downloader";

class SectionReader {
public:
    explicit SectionReader(std::filesystem::path path) : path_(std::move(path)) {}

    std::string raw(const std::string& key) const {
        if (path_.empty())
            return {};
        return parse_config_value(path_, kSection, key);
    }

    template <typename T, typename Parser>
    void read(const std::string& key, T& target, Parser parse) const {
        auto v = raw(key);
        if (v.empty())
            return;
        if (auto parsed = parse(v)) {
            target = static_cast<T>(*parsed);
        } else {
            spdlog::warn("Ignoring invalid value '{}' for {}.{} in {}", v, kSection, key,
                         path_.string());
        }
    }

    void readMs(const std::string& key, std::chrono::milliseconds& target) const {
        std::uint64_t ms = static_cast<std::uint64_t>(std::max<std::int64_t>(target.count(), 0));
        read(key, ms, parse_u64);
        target = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }

private:
    std::filesystem::path path_;
};

} // namespace

ManagerConfig loadManagerConfig(const std::filesystem::path& configPath) {
    ManagerConfig cfg;
    cfg.cacheDir = get_cache_dir();

    // 1) config file
    const auto path = configPath.empty() ? get_config_path() : configPath;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("Loading downloader config from {}", path.string());
        SectionReader r(path);

        if (auto v = r.raw("cache_dir"); !v.empty())
            cfg.cacheDir = expand_tilde(v);
        r.read("max_concurrent_downloads", cfg.maxConcurrentDownloads, parse_u64);
        r.read("chunk_size_bytes", cfg.chunkSizeBytes, parse_u64);
        r.readMs("progress_interval_ms", cfg.progressInterval);
        r.readMs("timeout_ms", cfg.requestTimeout);

        std::uint64_t attempts = static_cast<std::uint64_t>(cfg.retry.maxAttempts);
        r.read("max_attempts", attempts, parse_u64);
        cfg.retry.maxAttempts = static_cast<int>(std::max<std::uint64_t>(attempts, 1));
        r.readMs("initial_backoff_ms", cfg.retry.initialBackoff);
        r.read("backoff_multiplier", cfg.retry.multiplier, parse_double);
        r.readMs("max_backoff_ms", cfg.retry.maxBackoff);

        r.read("tls_insecure", cfg.tls.insecure, parse_bool);
        if (auto v = r.raw("ca_path"); !v.empty())
            cfg.tls.caPath = expand_tilde(v).string();
        if (auto v = r.raw("proxy"); !v.empty())
            cfg.proxy = v;
        r.read("fsync_on_complete", cfg.fsyncOnComplete, parse_bool);
        if (auto v = r.raw("partial_suffix"); !v.empty())
            cfg.partialSuffix = v;

        r.read("max_cache_bytes", cfg.maxCacheBytes, parse_u64);
        r.read("max_file_bytes", cfg.maxFileBytes, parse_u64);
        r.read("keep_partial_on_cancel", cfg.keepPartialOnCancel, parse_bool);
        r.readMs("speed_window_ms", cfg.speedWindow);

        std::uint64_t retentionSec = static_cast<std::uint64_t>(cfg.retention.count());
        r.read("retention_seconds", retentionSec, parse_u64);
        cfg.retention = std::chrono::seconds(static_cast<std::int64_t>(retentionSec));
        r.readMs("sweep_interval_ms", cfg.sweepInterval);
    }

    // 2) environment
    if (auto env = env_value("MODELFETCH_CACHE_DIR")) {
        cfg.cacheDir = expand_tilde(*env);
    } else if (auto legacy = env_value("MODEL_CACHE_PATH")) {
        cfg.cacheDir = expand_tilde(*legacy);
    }
    if (auto env = env_value("MODELFETCH_MAX_CONCURRENT")) {
        if (auto n = parse_u64(*env); n && *n > 0) {
            cfg.maxConcurrentDownloads = static_cast<std::size_t>(*n);
        } else {
            spdlog::warn("Ignoring invalid MODELFETCH_MAX_CONCURRENT='{}'", *env);
        }
    }

    if (cfg.maxConcurrentDownloads == 0)
        cfg.maxConcurrentDownloads = 1;
    if (cfg.chunkSizeBytes == 0)
        cfg.chunkSizeBytes = 64 * 1024;
    return cfg;
}

} // namespace modelfetch::config
