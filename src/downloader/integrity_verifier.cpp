/*
 * rangefetch/src/downloader/integrity_verifier.cpp
 *
 * IntegrityVerifier (SHA-256 via OpenSSL EVP)
 *
 * Implements rangefetch::downloader::IIntegrityVerifier using OpenSSL's EVP interface.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns the raw 32-byte digest and re-initializes the context.
 * - Backend failures surface as ErrorCode::Unknown instead of an empty digest.
 *
 * Dependencies:
 * - OpenSSL::Crypto (linked by CMake in rangefetch_downloader target)
 */

#include <rangefetch/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace rangefetch::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
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

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset() override {
        _ctx = EvpMdCtx{};
        _failed = !_ctx || EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) != 1;
    }

    void update(ByteSpan data) override {
        if (_failed || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1)
            _failed = true;
    }

    Expected<Digest> finalize() override {
        if (_failed) {
            reset();
            return Error{ErrorCode::Unknown, "SHA-256 context failure"};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        const bool ok = EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1;

        // Prepare for potential reuse
        reset();

        if (!ok || md_len != Digest{}.size()) {
            return Error{ErrorCode::Unknown, "SHA-256 finalize failed"};
        }
        Digest out{};
        std::copy_n(md_buf.begin(), out.size(), out.begin());
        return out;
    }

private:
    EvpMdCtx _ctx{};
    bool _failed{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Expected<Digest> computeDigest(const AssembledBuffer& buffer) {
    OpenSslIntegrityVerifier verifier;
    verifier.update(buffer.bytes());
    return verifier.finalize();
}

VerifyOutcome compareDigest(const Digest& computed, const std::optional<Digest>& expected) {
    VerifyOutcome out;
    out.computed = computed;
    out.expected = expected;
    if (!expected) {
        out.kind = VerifyOutcome::Kind::NoExpectedProvided;
    } else if (*expected == computed) {
        out.kind = VerifyOutcome::Kind::Match;
    } else {
        out.kind = VerifyOutcome::Kind::Mismatch;
    }
    return out;
}

Expected<Digest> parseDigestHex(std::string_view hex) {
    Digest out{};
    if (hex.size() != out.size() * 2) {
        return Error{ErrorCode::InvalidArgument,
                     "SHA-256 digest must be 64 hex characters, got " +
                         std::to_string(hex.size())};
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::InvalidArgument,
                         "invalid hex character in digest at position " + std::to_string(2 * i)};
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string digestToHex(const Digest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(digest.size() * 2);
    for (std::size_t i = 0; i < digest.size(); ++i) {
        unsigned v = digest[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

const char* outcomeName(VerifyOutcome::Kind kind) noexcept {
    switch (kind) {
        case VerifyOutcome::Kind::Match:
            return "match";
        case VerifyOutcome::Kind::Mismatch:
            return "mismatch";
        case VerifyOutcome::Kind::NoExpectedProvided:
            return "no_expected_provided";
    }
    return "unknown";
}

} // namespace rangefetch::downloader
