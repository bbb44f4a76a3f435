#include "crypto/digest.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <vector>

namespace fpack {

namespace {

constexpr size_t kSha1Size = 20;

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

bool InitSha1(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) == 1;
}

bool UpdateSha1(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalSha1(EvpCtx& ctx, std::array<std::uint8_t, kSha1Size>& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

std::string Base64Encode(std::span<const std::uint8_t> data) {
    std::string out;
    // 4 output chars per 3 input bytes, plus the terminating NUL EVP writes.
    out.resize(((data.size() + 2) / 3) * 4 + 1);
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    if (n < 0) return {};
    out.resize(static_cast<size_t>(n));
    return out;
}

struct Sha1Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

Sha1Hasher::Sha1Hasher() : impl_(std::make_unique<Impl>()) {
    if (impl_ && InitSha1(impl_->ctx)) {
        impl_->initialized = true;
    }
}

Sha1Hasher::Sha1Hasher(Sha1Hasher&&) noexcept = default;
Sha1Hasher& Sha1Hasher::operator=(Sha1Hasher&&) noexcept = default;
Sha1Hasher::~Sha1Hasher() = default;

bool Sha1Hasher::Ok() const { return impl_ && impl_->initialized && !impl_->finalized; }

void Sha1Hasher::Update(std::span<const std::uint8_t> data) {
    if (!Ok()) return;
    if (!UpdateSha1(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

std::string Sha1Hasher::FinalBase64() {
    if (!Ok()) return {};
    impl_->finalized = true;
    std::array<std::uint8_t, kSha1Size> digest{};
    if (!FinalSha1(impl_->ctx, digest)) return {};
    return Base64Encode(digest);
}

std::string Sha1Base64(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitSha1(ctx)) return {};
    if (!UpdateSha1(ctx, data)) return {};
    std::array<std::uint8_t, kSha1Size> digest{};
    if (!FinalSha1(ctx, digest)) return {};
    return Base64Encode(digest);
}

Result Sha1Base64File(const std::string& path, std::string& out_b64) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;

    Sha1Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno, "read failed: " + path);
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    out_b64 = hasher.FinalBase64();
    if (out_b64.empty()) return Result::Fail(EIO, "sha1 failed: " + path);
    return Result::Ok();
}

} // namespace fpack
