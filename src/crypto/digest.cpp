#include "crypto/digest.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace updsrv {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

const EVP_MD* ToEvp(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Md5: return EVP_md5();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitDigest(EvpCtx& ctx, DigestAlgorithm algo) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), ToEvp(algo), nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(out.data(), len));
}

} // namespace

std::string Sha256Hex(std::string_view text) {
    EvpCtx ctx;
    if (!InitDigest(ctx, DigestAlgorithm::Sha256)) return {};
    if (!UpdateDigest(ctx, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                                         text.size()))) {
        return {};
    }
    return FinalDigestHex(ctx);
}

std::string DigestHex(DigestAlgorithm algo, IReader& reader) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!UpdateDigest(ctx, std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }

    return FinalDigestHex(ctx);
}

Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;
    out_hex = DigestHex(algo, reader);
    if (out_hex.empty()) return Result::Fail(ErrorKind::Io, "digest failed: " + path);
    return Result::Ok();
}

} // namespace updsrv
