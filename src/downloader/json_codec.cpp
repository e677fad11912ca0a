#include <modelfetch/downloader/json_codec.hpp>

#include <cstdio>
#include <ctime>

namespace modelfetch::downloader {

using nlohmann::json;

namespace {

template <typename T> json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

std::string formatTimestamp(TimePoint tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms < 0 ? 0 : ms));
    return out;
}

void to_json(json& j, const TaskSnapshot& s) {
    j = json{{"id", s.id},
             {"sourceRef", s.sourceRef},
             {"destinationPath", s.destinationPath.string()},
             {"state", toString(s.state)},
             {"bytesTotal", optionalToJson(s.bytesTotal)},
             {"bytesTransferred", s.bytesTransferred},
             {"resumeOffset", s.resumeOffset},
             {"attempt", s.attempt},
             {"lastError", optionalToJson(s.lastError)},
             {"createdAt", formatTimestamp(s.createdAt)},
             {"updatedAt", formatTimestamp(s.updatedAt)},
             {"completedAt",
              s.completedAt ? json(formatTimestamp(*s.completedAt)) : json(nullptr)},
             {"checksum", optionalToJson(s.checksum)}};
}

void to_json(json& j, const ProgressSnapshot& p) {
    j = json{{"state", toString(p.state)},
             {"bytesTransferred", p.bytesTransferred},
             {"bytesTotal", optionalToJson(p.bytesTotal)},
             {"percentComplete", optionalToJson(p.percentComplete)},
             {"currentSpeed", p.currentSpeed},
             {"estimatedTimeRemaining", p.estimatedTimeRemaining
                                            ? json(p.estimatedTimeRemaining->count())
                                            : json(nullptr)}};
}

void to_json(json& j, const DownloadStatistics& s) {
    j = json{{"totalDownloads", s.totalDownloads},
             {"successfulDownloads", s.successfulDownloads},
             {"failedDownloads", s.failedDownloads},
             {"totalBytesDownloaded", s.totalBytesDownloaded},
             {"averageSpeed", s.averageSpeed}};
}

void to_json(json& j, const BatchOutcome& o) {
    j = json{{"taskId", o.taskId.empty() ? json(nullptr) : json(o.taskId)},
             {"state", toString(o.state)},
             {"error", optionalToJson(o.error)},
             {"filePath", o.filePath.empty() ? json(nullptr) : json(o.filePath.string())},
             {"fileSize", o.fileSize},
             {"durationMs", o.duration.count()},
             {"checksum", optionalToJson(o.checksum)}};
}

void to_json(json& j, const DownloadResult& r) {
    j = json{{"success", r.success},
             {"taskId", r.taskId.empty() ? json(nullptr) : json(r.taskId)},
             {"filePath", r.filePath.empty() ? json(nullptr) : json(r.filePath.string())},
             {"fileSize", r.fileSize},
             {"durationMs", r.duration.count()},
             {"checksum", optionalToJson(r.checksum)},
             {"error", optionalToJson(r.error)}};
}

void to_json(json& j, const SweepStats& s) {
    j = json{{"tasksScanned", s.tasksScanned},
             {"tasksRemoved", s.tasksRemoved},
             {"partialsRemoved", s.partialsRemoved},
             {"bytesReclaimed", s.bytesReclaimed},
             {"durationMs", s.duration.count()}};
}

void from_json(const json& j, DownloadRequest& r) {
    r = DownloadRequest{};
    if (j.contains("url")) {
        r.sourceRef = j.at("url").get<std::string>();
    } else {
        r.sourceRef = j.at("sourceRef").get<std::string>();
    }
    if (j.contains("destination")) {
        r.destinationPath = j.at("destination").get<std::string>();
    } else {
        r.destinationPath = j.at("destinationPath").get<std::string>();
    }
    if (auto it = j.find("expectedBytes"); it != j.end() && !it->is_null())
        r.expectedBytes = it->get<std::uint64_t>();
    if (auto it = j.find("checksum"); it != j.end() && !it->is_null())
        r.checksum = it->get<std::string>();
    if (auto it = j.find("headers"); it != j.end() && it->is_object()) {
        for (const auto& item : it->items())
            r.headers.push_back(Header{item.key(), item.value().get<std::string>()});
    }
    if (auto it = j.find("timeoutMs"); it != j.end() && !it->is_null())
        r.timeout = std::chrono::milliseconds(it->get<std::int64_t>());
    if (auto it = j.find("keepPartialOnCancel"); it != j.end() && !it->is_null())
        r.keepPartialOnCancel = it->get<bool>();
}

} // namespace modelfetch::downloader
