#include "crypto/digest.hpp"
#include "crypto/digesting_writer.hpp"
#include "io/memory_writer.hpp"
#include "pack/pack_metadata.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace packsmith {
namespace {

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(DigestHex(DigestAlgorithm::Sha256, std::string_view("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(DigestHex(DigestAlgorithm::Sha1, std::string_view("abc")),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(DigestHex(DigestAlgorithm::Sha256, std::string_view()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, FileDigestMatchesInMemoryDigest) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/payload.bin";
    ASSERT_TRUE(testutil::WriteTextFile(path, "abc"));

    std::string hex;
    auto res = DigestHexFile(DigestAlgorithm::Sha256, path, hex);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    res = DigestHexFile(DigestAlgorithm::Sha256, tmp.Path() + "/missing", hex);
    EXPECT_FALSE(res.is_ok());
}

TEST(DigestTest, DigestingWriterHashesWhatItForwards) {
    MemoryWriter mem;
    DigestingWriter w(mem, DigestAlgorithm::Sha256);

    const std::string a = "a", bc = "bc";
    ASSERT_TRUE(w.WriteAll(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(a.data()), a.size())).is_ok());
    ASSERT_TRUE(w.WriteAll(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(bc.data()), bc.size())).is_ok());

    EXPECT_EQ(mem.Data(), "abc");
    EXPECT_EQ(w.FinalHex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHashTest, SortedByIdWithPlaceholderForMissingVersion) {
    // sha1("alpha:v1.0beta:N/A") = cd45b0e...
    EXPECT_EQ(ComputeContentHash({{"beta", ""}, {"alpha", "v1.0"}}), "cd45b0e");
    EXPECT_EQ(ComputeContentHash({{"alpha", "v1.0"}, {"beta", ""}}), "cd45b0e");
    EXPECT_NE(ComputeContentHash({{"alpha", "v1.1"}, {"beta", ""}}), "cd45b0e");
    EXPECT_EQ(PackBaseName("HATS", "2026-10-19", "cd45b0e"), "HATS-2026-10-19-cd45b0e");
}

} // namespace
} // namespace packsmith
