#include <gtest/gtest.h>

#include "bpm/crypto/sha256.hpp"

#include <cstdint>
#include <string>

namespace bpm {

namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

TEST(Sha256Test, KnownVector) {
    const std::string input = "abc";
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    EXPECT_EQ(Sha256Hex(Bytes(input)), expected);
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const std::string input = "the quick brown fox jumps over the lazy dog";

    Sha256Hasher hasher;
    hasher.Update(Bytes(input.substr(0, 10)));
    hasher.Update(Bytes(input.substr(10)));
    EXPECT_EQ(hasher.FinalHex(), Sha256Hex(Bytes(input)));
    EXPECT_TRUE(hasher.FinalHex().empty());
}

} // namespace bpm
