/*
 * modelfetch/src/downloader/integrity_verifier.cpp
 *
 * Streaming digests over OpenSSL EVP (SHA-256, SHA-512, MD5) plus the checksum
 * string helpers used by requests ("sha256:<hex>") and by verifyDownload().
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <modelfetch/downloader/downloader.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modelfetch::downloader {

namespace {

struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

std::size_t digestHexLength(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return 64;
        case HashAlgo::Sha512:
            return 128;
        case HashAlgo::Md5:
            return 32;
    }
    return 64;
}

const char* algoName(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
        case HashAlgo::Md5:
            return "md5";
    }
    return "sha256";
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(HashAlgo::Sha256); }
    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx)
            return;
        if (EVP_DigestInit_ex(_ctx.ctx, resolve_algo(_algo), nullptr) != 1) {
            spdlog::warn("EVP_DigestInit_ex failed for {}", algoName(_algo));
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        (void)EVP_DigestUpdate(_ctx.ctx, data.data(), data.size());
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (!_ctx || _finalized)
            return out;

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1) {
            out.hex = to_hex_lower(md_buf.data(), md_len);
        }
        _finalized = true;
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

bool allHex(std::string_view s) {
    for (unsigned char c : s) {
        if (!std::isxdigit(c))
            return false;
    }
    return !s.empty();
}

std::string lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<Checksum> parseChecksum(std::string_view text) {
    text = trimView(text);
    Checksum out;
    std::string_view hex = text;

    auto colon = text.find(':');
    if (colon != std::string_view::npos) {
        const auto algo = lower(text.substr(0, colon));
        if (algo == "sha256") {
            out.algo = HashAlgo::Sha256;
        } else if (algo == "sha512") {
            out.algo = HashAlgo::Sha512;
        } else if (algo == "md5") {
            out.algo = HashAlgo::Md5;
        } else {
            return std::nullopt;
        }
        hex = text.substr(colon + 1);
    }

    if (!allHex(hex) || hex.size() != digestHexLength(out.algo))
        return std::nullopt;
    out.hex = lower(hex);
    return out;
}

std::string formatChecksum(const Checksum& checksum) {
    return std::string(algoName(checksum.algo)) + ":" + checksum.hex;
}

std::optional<Checksum> computeFileChecksum(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return std::nullopt;

    OpenSslIntegrityVerifier verifier;
    verifier.reset(algo);
    std::vector<char> buf(1 << 16);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = in.gcount();
        if (n > 0) {
            verifier.update(
                std::span<const std::byte>(reinterpret_cast<const std::byte*>(buf.data()),
                                           static_cast<std::size_t>(n)));
        }
    }
    if (in.bad())
        return std::nullopt;
    auto out = verifier.finalize();
    if (out.hex.empty())
        return std::nullopt;
    return out;
}

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

} // namespace modelfetch::downloader
