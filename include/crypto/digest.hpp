#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace fpack {

// Standard base64 with '=' padding, no line breaks.
std::string Base64Encode(std::span<const std::uint8_t> data);

std::string Sha1Base64(std::span<const std::uint8_t> data);
Result Sha1Base64File(const std::string& path, std::string& out_b64);

// Incremental SHA-1. Artifact digests identify payloads for the update
// server; they are not a security boundary.
class Sha1Hasher {
public:
    Sha1Hasher();
    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;
    Sha1Hasher(Sha1Hasher&&) noexcept;
    Sha1Hasher& operator=(Sha1Hasher&&) noexcept;
    ~Sha1Hasher();

    bool Ok() const;
    void Update(std::span<const std::uint8_t> data);
    // Empty string on failure or on a second call.
    std::string FinalBase64();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Tee: forwards every write to `inner` and feeds the same bytes to `hasher`.
class HashingWriter final : public IWriter {
public:
    HashingWriter(IWriter& inner, Sha1Hasher& hasher) : inner_(inner), hasher_(hasher) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = inner_.WriteAll(in);
        if (!r.is_ok()) return r;
        hasher_.Update(in);
        return Result::Ok();
    }
    Result FsyncNow() override { return inner_.FsyncNow(); }

private:
    IWriter& inner_;
    Sha1Hasher& hasher_;
};

} // namespace fpack
