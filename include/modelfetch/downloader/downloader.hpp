#pragma once

/*
 * modelfetch downloader - transfer-layer types and collaborator interfaces (C++20)
 *
 * This header defines the types shared by the transfer layer and the abstract
 * collaborators the task manager drives: the HTTP adapter (range fetches), the
 * integrity verifier (streaming hash) and the disk writer (partial artifacts with
 * byte-offset writes and atomic finalize). It contains no implementation details.
 *
 * Task-level types (states, records, snapshots) live in download_task.hpp.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Md5 // optional; discouraged for security-critical verification
};

/**
 * Canonical error codes for transfer-layer operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError, // 5xx, 408, 429: worth retrying
    ClientError, // remaining 4xx
    IoError,
    ChecksumMismatch,
    ResumeNotSupported,
    PolicyViolation,
    Cancelled,
    Unknown
};

constexpr const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::TlsVerificationFailed: return "tls_verification_failed";
        case ErrorCode::ServerError: return "server_error";
        case ErrorCode::ClientError: return "client_error";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ChecksumMismatch: return "checksum_mismatch";
        case ErrorCode::ResumeNotSupported: return "resume_not_supported";
        case ErrorCode::PolicyViolation: return "policy_violation";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * Transient errors are absorbed by the executor retry loop; everything else fails the task.
 */
constexpr bool isTransient(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::ServerError;
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Retry/backoff policy. maxAttempts counts the first attempt.
 */
struct RetryPolicy {
    int maxAttempts{4};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to abort ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * Server metadata captured by a probe.
 */
struct ProbeResult {
    bool resumeSupported{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> etag{};
    std::optional<std::string> lastModified{};
};

/**
 * Options applied to every request issued for one task.
 */
struct FetchOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{300000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * Implementations must support Range requests.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata (HEAD preferred) for resume capability and content length.
     */
    virtual Expected<ProbeResult> probe(std::string_view url, const FetchOptions& options) = 0;

    /**
     * Fetch [offset, offset+size) and stream data to the sink. size == 0 streams to EOF.
     * When offset > 0 and the server ignores the Range header, implementations must fail
     * with ResumeNotSupported before handing any byte to the sink.
     * Returns Cancelled when shouldCancel() turned true or the sink refused data.
     */
    virtual Expected<void> fetchRange(std::string_view url, const FetchOptions& options,
                                      std::uint64_t offset, std::uint64_t size,
                                      const ByteSink& sink, const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Storage collaborator for partial artifacts and finalized cache entries.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Open (creating parents and the file when missing) a partial artifact for a transfer
     * resuming at resumeOffset. A longer file is truncated to resumeOffset; a shorter one is
     * an IoError because bytes already accounted for are gone.
     */
    virtual Expected<void> openForResume(const std::filesystem::path& partialFile,
                                         std::uint64_t resumeOffset) = 0;

    /**
     * Write a contiguous block at a specific offset.
     */
    virtual Expected<void> writeAt(const std::filesystem::path& partialFile, std::uint64_t offset,
                                   std::span<const std::byte> data) = 0;

    /**
     * Ensure data durability (fsync file and its directory).
     */
    virtual Expected<void> sync(const std::filesystem::path& partialFile) = 0;

    /**
     * Move the partial artifact to its destination. Must attempt atomic rename; on EXDEV,
     * implementations may fall back to copy+fsync+rename.
     */
    virtual Expected<void> finalize(const std::filesystem::path& partialFile,
                                    const std::filesystem::path& destination) = 0;

    /**
     * Current size of a file, or nullopt when it does not exist.
     */
    virtual std::optional<std::uint64_t> sizeOf(const std::filesystem::path& file) noexcept = 0;

    /**
     * Total bytes of regular files below dir (0 when missing).
     */
    virtual std::uint64_t usedBytes(const std::filesystem::path& dir) noexcept = 0;

    /**
     * Best-effort removal. Returns true when a file was removed.
     */
    virtual bool remove(const std::filesystem::path& file) noexcept = 0;
};

// ======================
// Checksum helpers
// ======================

/**
 * Parse "<algo>:<hex>" (algo: sha256|sha512|md5, case-insensitive). A bare 64-char hex
 * string is accepted as SHA-256.
 */
std::optional<Checksum> parseChecksum(std::string_view text);

/**
 * Render a checksum as "<algo>:<hex>".
 */
std::string formatChecksum(const Checksum& checksum);

/**
 * Stream a file through a verifier. nullopt when the file cannot be read.
 */
std::optional<Checksum> computeFileChecksum(const std::filesystem::path& path, HashAlgo algo);

// ======================
// Factories
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();

} // namespace modelfetch::downloader
