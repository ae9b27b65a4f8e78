#include <gtest/gtest.h>

#include <string>
#include "infra/hash/checksum.hpp"
#include "test_support.hpp"

using smartmig::infra::Checksum;
using smartmig::infra::HashAlgorithm;
using smartmig::test::TempDir;
using smartmig::test::write_file;

namespace {

std::string patterned(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) % 251);
    }
    return data;
}

} // namespace

TEST(ChecksumTest, DigestIsStableHex)
{
    TempDir dir;
    write_file(dir / "a.txt", "hello world");

    const auto first = Checksum::digest(dir / "a.txt");
    EXPECT_EQ(first.size(), 16u);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(first, Checksum::digest(dir / "a.txt"));

    EXPECT_EQ(Checksum::digest(dir / "a.txt", HashAlgorithm::XXH32).size(), 8u);
    EXPECT_EQ(Checksum::digest(dir / "a.txt", HashAlgorithm::XXH3).size(), 16u);
}

TEST(ChecksumTest, UnreadableFileYieldsEmptySentinel)
{
    TempDir dir;
    EXPECT_EQ(Checksum::digest(dir / "missing.bin"), "");
    EXPECT_EQ(Checksum::digest(dir.path()), "");
}

TEST(ChecksumTest, VerifyCopyIsFalseWhenDestinationMissing)
{
    TempDir dir;
    write_file(dir / "src.bin", "payload");
    EXPECT_FALSE(Checksum::verify_copy(dir / "src.bin", dir / "dst.bin"));
}

TEST(ChecksumTest, VerifyCopyIsFalseWhenSourceUnreadable)
{
    TempDir dir;
    write_file(dir / "dst.bin", "payload");
    EXPECT_FALSE(Checksum::verify_copy(dir / "gone.bin", dir / "dst.bin"));
}

class ChecksumSizeTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(ChecksumSizeTest, IdenticalContentVerifiesAndMutationDoesNot)
{
    const auto size = GetParam();
    TempDir dir;
    const auto content = patterned(size);
    write_file(dir / "src.bin", content);
    write_file(dir / "same.bin", content);

    EXPECT_TRUE(Checksum::verify_copy(dir / "src.bin", dir / "same.bin"));

    auto mutated = content;
    if (mutated.empty()) {
        mutated = "x";                         // grow the empty file
    } else {
        mutated[mutated.size() / 2] ^= 0x01;   // flip one bit in the middle
    }
    write_file(dir / "changed.bin", mutated);
    EXPECT_FALSE(Checksum::verify_copy(dir / "src.bin", dir / "changed.bin"));

    if (!content.empty()) {
        write_file(dir / "short.bin", content.substr(0, content.size() - 1));
        EXPECT_FALSE(Checksum::verify_copy(dir / "src.bin", dir / "short.bin"));
    }
}

INSTANTIATE_TEST_SUITE_P(Sizes, ChecksumSizeTest,
                         ::testing::Values(std::size_t{0}, std::size_t{1}, std::size_t{1'000'000}));

TEST(ChecksumTest, ParsesAlgorithmNames)
{
    EXPECT_EQ(smartmig::infra::parse_hash_algorithm("xxh64"), HashAlgorithm::XXH64);
    EXPECT_EQ(smartmig::infra::parse_hash_algorithm("xxh32"), HashAlgorithm::XXH32);
    EXPECT_EQ(smartmig::infra::parse_hash_algorithm("xxh3"), HashAlgorithm::XXH3);
    EXPECT_FALSE(smartmig::infra::parse_hash_algorithm("md5").has_value());
    EXPECT_EQ(smartmig::infra::to_string(HashAlgorithm::XXH3), "xxh3");
}
