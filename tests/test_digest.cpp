#include <gtest/gtest.h>

#include "crypto/digest.hpp"
#include "testing.hpp"

#include <string>

namespace fpack {
namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(DigestTest, Base64KnownVectors) {
    EXPECT_EQ(Base64Encode(Bytes("")), "");
    EXPECT_EQ(Base64Encode(Bytes("f")), "Zg==");
    EXPECT_EQ(Base64Encode(Bytes("fo")), "Zm8=");
    EXPECT_EQ(Base64Encode(Bytes("foo")), "Zm9v");
    EXPECT_EQ(Base64Encode(Bytes("hello")), "aGVsbG8=");
}

TEST(DigestTest, Sha1KnownVectors) {
    EXPECT_EQ(Sha1Base64(Bytes("abc")), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
    EXPECT_EQ(Sha1Base64(Bytes("")), "2jmj7l5rSw0yVb/vlWAYkK/YBwk=");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
    Sha1Hasher hasher;
    ASSERT_TRUE(hasher.Ok());
    hasher.Update(Bytes("a"));
    hasher.Update(Bytes("bc"));
    EXPECT_EQ(hasher.FinalBase64(), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
    EXPECT_EQ(hasher.FinalBase64(), "");
}

TEST(DigestTest, FileDigestMatchesContent) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("abc.txt");
    testutil::WriteFile(path, "abc");

    std::string digest;
    auto r = Sha1Base64File(path, digest);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(digest, "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
}

TEST(DigestTest, HashingWriterSeesForwardedBytes) {
    testutil::MemoryWriter sink;
    Sha1Hasher hasher;
    HashingWriter tee(sink, hasher);

    ASSERT_TRUE(tee.WriteAll(Bytes("ab")).is_ok());
    ASSERT_TRUE(tee.WriteAll(Bytes("c")).is_ok());
    EXPECT_EQ(sink.data, "abc");
    EXPECT_EQ(hasher.FinalBase64(), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
}

} // namespace
} // namespace fpack
