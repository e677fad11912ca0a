#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <modelfetch/config/manager_config.h>
#include <modelfetch/downloader/download_manager.hpp>
#include <modelfetch/downloader/json_codec.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace modelfetch::downloader;

struct GlobalOptions {
    std::string configPath;
    std::string cacheDir;
    std::size_t concurrency{0};
    bool verbose{false};
    bool quiet{false};
    bool json{false};
};

std::string humanBytes(double bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int u = 0;
    while (bytes >= 1024.0 && u < 4) {
        bytes /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", bytes, units[u]);
    return buf;
}

void printProgress(const ProgressSnapshot& p) {
    std::string line = "\r" + std::string(toString(p.state)) + " " +
                       humanBytes(static_cast<double>(p.bytesTransferred));
    if (p.bytesTotal)
        line += " / " + humanBytes(static_cast<double>(*p.bytesTotal));
    if (p.percentComplete) {
        char pct[16];
        std::snprintf(pct, sizeof(pct), " (%.1f%%)", *p.percentComplete);
        line += pct;
    }
    if (p.currentSpeed > 0.0)
        line += "  " + humanBytes(p.currentSpeed) + "/s";
    if (p.estimatedTimeRemaining)
        line += "  eta " + std::to_string(p.estimatedTimeRemaining->count()) + "s";
    std::cerr << line << "    " << std::flush;
}

modelfetch::config::ManagerConfig buildConfig(const GlobalOptions& g) {
    auto cfg = modelfetch::config::loadManagerConfig(g.configPath);
    if (!g.cacheDir.empty())
        cfg.cacheDir = g.cacheDir;
    if (g.concurrency > 0)
        cfg.maxConcurrentDownloads = g.concurrency;
    cfg.sweepInterval = std::chrono::milliseconds(0); // one-shot process
    return cfg;
}

std::vector<DownloadRequest> readManifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open manifest " + path.string());

    std::vector<DownloadRequest> out;
    if (path.extension() == ".json") {
        const auto doc = json::parse(in);
        for (const auto& item : doc)
            out.push_back(item.get<DownloadRequest>());
        return out;
    }

    // "<url> <destination> [algo:hex]" per line; '#' starts a comment
    std::string line;
    while (std::getline(in, line)) {
        if (auto hash = line.find('#'); hash != std::string::npos)
            line.erase(hash);
        std::istringstream ss(line);
        DownloadRequest r;
        std::string dest;
        std::string checksum;
        if (!(ss >> r.sourceRef >> dest))
            continue;
        r.destinationPath = dest;
        if (ss >> checksum)
            r.checksum = checksum;
        out.push_back(std::move(r));
    }
    return out;
}

int runGet(const GlobalOptions& g, const std::string& url, const std::string& dest,
           const std::string& checksum, const std::vector<std::string>& headers,
           std::uint64_t expectedBytes) {
    DownloadManager manager(buildConfig(g));

    DownloadRequest req;
    req.sourceRef = url;
    req.destinationPath = dest;
    if (!checksum.empty())
        req.checksum = checksum;
    if (expectedBytes > 0)
        req.expectedBytes = expectedBytes;
    for (const auto& h : headers) {
        auto colon = h.find(':');
        if (colon == std::string::npos) {
            spdlog::error("Ignoring malformed header '{}' (expected 'Name: value')", h);
            continue;
        }
        auto value = h.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        req.headers.push_back(Header{h.substr(0, colon), value});
    }

    auto queued = manager.install(req);
    if (!queued) {
        spdlog::error("{}", queued.error().message);
        return 2;
    }
    const auto id = queued.value();

    const bool showProgress = !g.quiet && !g.json;
    std::optional<TaskSnapshot> last;
    for (;;) {
        last = manager.waitForTask(id, std::chrono::milliseconds(500));
        if (!last || isTerminal(last->state))
            break;
        if (showProgress) {
            if (auto p = manager.getDownloadProgress(id))
                printProgress(*p);
        }
    }
    if (showProgress)
        std::cerr << "\n";

    if (!last) {
        spdlog::error("Task {} disappeared", id);
        return 1;
    }
    if (g.json) {
        std::cout << json(*last).dump(2) << "\n";
    } else if (last->state == TaskState::Completed) {
        std::cout << last->destinationPath.string() << "  "
                  << last->checksum.value_or("") << "\n";
    } else {
        std::cerr << "Download " << toString(last->state) << ": "
                  << last->lastError.value_or("") << "\n";
    }
    return last->state == TaskState::Completed ? 0 : 1;
}

int runBatch(const GlobalOptions& g, const std::string& manifest) {
    auto requests = readManifest(manifest);
    DownloadManager manager(buildConfig(g));
    const auto outcomes = manager.downloadBatch(requests);

    int failures = 0;
    for (const auto& o : outcomes) {
        if (o.state != TaskState::Completed)
            ++failures;
    }
    if (g.json) {
        json out = {{"outcomes", outcomes}, {"statistics", manager.getDownloadStats()}};
        std::cout << out.dump(2) << "\n";
    } else {
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            const auto& o = outcomes[i];
            std::cout << toString(o.state) << "\t" << requests[i].sourceRef << "\t"
                      << (o.state == TaskState::Completed ? o.filePath.string()
                                                          : o.error.value_or(""))
                      << "\n";
        }
        if (!g.quiet) {
            const auto stats = manager.getDownloadStats();
            std::cerr << stats.successfulDownloads << "/" << outcomes.size() << " completed, "
                      << humanBytes(static_cast<double>(stats.totalBytesDownloaded))
                      << " downloaded\n";
        }
    }
    return failures == 0 ? 0 : 1;
}

int runVerify(const GlobalOptions& g, const std::string& file, const std::string& checksum) {
    DownloadManager manager(buildConfig(g));
    auto r = manager.verifyDownload(file, checksum);
    if (!r) {
        spdlog::error("{}", r.error().message);
        return 2;
    }
    const bool ok = r.value();
    if (g.json) {
        std::cout << json{{"file", file}, {"valid", ok}}.dump(2) << "\n";
    } else if (!g.quiet) {
        std::cout << file << ": " << (ok ? "OK" : "MISMATCH") << "\n";
    }
    return ok ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"modelfetch - resumable model artifact downloader"};
    app.require_subcommand(1);

    GlobalOptions g;
    app.add_option("--config", g.configPath, "Config file (default $MODELFETCH_CONFIG or "
                                             "~/.config/modelfetch/config.toml)");
    app.add_option("--cache-dir", g.cacheDir, "Cache directory for relative destinations");
    app.add_option("-c,--concurrency", g.concurrency, "Concurrent downloads")
        ->check(CLI::Range(1, 64));
    app.add_flag("-v,--verbose", g.verbose, "Debug logging");
    app.add_flag("-q,--quiet", g.quiet, "Errors only, no progress");
    app.add_flag("--json", g.json, "Machine-readable output");

    auto* get = app.add_subcommand("get", "Download one artifact");
    std::string url;
    std::string dest;
    std::string checksum;
    std::vector<std::string> headers;
    std::uint64_t expectedBytes{0};
    get->add_option("url", url, "Source URL")->required();
    get->add_option("destination", dest, "Destination path")->required();
    get->add_option("--checksum", checksum, "Expected checksum '<algo>:<hex>'");
    get->add_option("-H,--header", headers, "Extra header 'Name: value' (repeatable)");
    get->add_option("--size", expectedBytes, "Expected size in bytes");

    auto* batch = app.add_subcommand("batch", "Download every entry of a manifest");
    std::string manifest;
    batch->add_option("manifest", manifest, "Lines of '<url> <dest> [algo:hex]' or a .json array")
        ->required()
        ->check(CLI::ExistingFile);

    auto* verify = app.add_subcommand("verify", "Check a file against a checksum");
    std::string file;
    std::string expected;
    verify->add_option("file", file, "File to hash")->required();
    verify->add_option("checksum", expected, "Expected '<algo>:<hex>'")->required();

    CLI11_PARSE(app, argc, argv);

    if (g.verbose)
        spdlog::set_level(spdlog::level::debug);
    else if (g.quiet || g.json)
        spdlog::set_level(spdlog::level::err);

    try {
        if (*get)
            return runGet(g, url, dest, checksum, headers, expectedBytes);
        if (*batch)
            return runBatch(g, manifest);
        if (*verify)
            return runVerify(g, file, expected);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
