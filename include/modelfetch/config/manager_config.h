#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace modelfetch::config {

/**
 * Every tunable of the download manager. Defaults are usable as-is; loadManagerConfig()
 * layers the config file and the environment on top.
 */
struct ManagerConfig {
    std::filesystem::path cacheDir;
    std::size_t maxConcurrentDownloads{3};

    // Transfer
    std::size_t chunkSizeBytes{1024ull * 1024ull};
    std::chrono::milliseconds progressInterval{250};
    std::chrono::milliseconds requestTimeout{300000};
    downloader::RetryPolicy retry{};
    downloader::TlsConfig tls{};
    std::optional<std::string> proxy;
    bool fsyncOnComplete{true};
    std::string partialSuffix{".part"};

    // Limits
    std::uint64_t maxCacheBytes{0}; // 0 = no ceiling
    std::uint64_t maxFileBytes{0};  // 0 = unlimited

    // Cancel
    bool keepPartialOnCancel{false};

    // Progress
    std::chrono::milliseconds speedWindow{5000};

    // Cleanup
    std::chrono::seconds retention{std::chrono::hours(24)};
    std::chrono::milliseconds sweepInterval{std::chrono::minutes(10)}; // 0 disables
};

/**
 * Resolve configuration: defaults -> [downloader] section of the config file -> environment
 * (MODELFETCH_CACHE_DIR, MODEL_CACHE_PATH, MODELFETCH_MAX_CONCURRENT).
 * Malformed values are logged and ignored.
 */
ManagerConfig loadManagerConfig(const std::filesystem::path& configPath = {});

} // namespace modelfetch::config
