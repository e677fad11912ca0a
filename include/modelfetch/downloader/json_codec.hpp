#pragma once

#include <modelfetch/downloader/cleanup_sweeper.hpp>
#include <modelfetch/downloader/download_task.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace modelfetch::downloader {

// JSON encodings of the manager's records. Field names are camelCase; byte counts are
// integers, timestamps ISO-8601 UTC with millisecond precision, absent optionals are null.

std::string formatTimestamp(TimePoint tp);

void to_json(nlohmann::json& j, const TaskSnapshot& s);
void to_json(nlohmann::json& j, const ProgressSnapshot& p);
void to_json(nlohmann::json& j, const DownloadStatistics& s);
void to_json(nlohmann::json& j, const BatchOutcome& o);
void to_json(nlohmann::json& j, const DownloadResult& r);
void to_json(nlohmann::json& j, const SweepStats& s);

/**
 * Decode a request object:
 *   {"url"|"sourceRef": str, "destination"|"destinationPath": str, "expectedBytes": n,
 *    "checksum": "sha256:<hex>", "headers": {name: value}, "timeoutMs": n,
 *    "keepPartialOnCancel": bool}
 * Throws nlohmann::json::exception on type errors or a missing source/destination.
 */
void from_json(const nlohmann::json& j, DownloadRequest& r);

} // namespace modelfetch::downloader
