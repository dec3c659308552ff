#include <gtest/gtest.h>
#include "hash/hash_function.hpp"

using namespace authtree;

namespace {

HashValue hash_of(HashFunction f, const std::string& data) {
    Hasher h(f);
    h.update(data);
    return h.finalize();
}

} // namespace

TEST(HashFunctionTest, KnownAnswers) {
    EXPECT_EQ(hash_of(HashFunction::Sha256, "abc").to_hex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hash_of(HashFunction::Sha3_256, "abc").to_hex(),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
    EXPECT_EQ(hash_of(HashFunction::Blake2s256, "abc").to_hex(),
              "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
}

TEST(HashFunctionTest, StreamingMatchesOneShot) {
    Hasher h(HashFunction::Sha3_256);
    h.update("leaf:");
    h.update("hello world");
    EXPECT_EQ(h.finalize(), hash_with_prefix(HashFunction::Sha3_256, "leaf:", "hello world"));
    EXPECT_EQ(hash_of(HashFunction::Sha3_256, "leaf:hello world"),
              hash_with_prefix(HashFunction::Sha3_256, "leaf:", "hello world"));
}

TEST(HashFunctionTest, ResetsAfterFinalize) {
    Hasher h(HashFunction::Sha256);
    h.update("abc");
    HashValue first = h.finalize();
    h.update("abc");
    EXPECT_EQ(h.finalize(), first);
}

TEST(HashFunctionTest, WideOutput) {
    EXPECT_EQ(digest_size(HashFunction::Blake2b512), 64u);
    EXPECT_EQ(digest_size(HashFunction::Blake2s256), 32u);

    Hasher h(HashFunction::Blake2b512);
    h.update("abc");
    EXPECT_EQ(h.finalize_bytes().size(), 64u);

    h.update("abc");
    EXPECT_THROW(h.finalize(), std::logic_error);
}

TEST(HashFunctionTest, MovedHasherKeepsWorking) {
    Hasher a(HashFunction::Sha3_256);
    Hasher b(std::move(a));
    b.update("abc");
    EXPECT_EQ(b.finalize(), hash_of(HashFunction::Sha3_256, "abc"));
}

TEST(HashFunctionTest, MoveAssignmentTakesOverContext) {
    Hasher a(HashFunction::Sha256);
    a.update("ab");
    Hasher b(HashFunction::Blake2s256);
    b = std::move(a);
    EXPECT_EQ(b.function(), HashFunction::Sha256);
    b.update("c");
    EXPECT_EQ(b.finalize(), hash_of(HashFunction::Sha256, "abc"));
}

TEST(HashFunctionTest, Names) {
    EXPECT_EQ(hash_function_from_string("sha3-256"), HashFunction::Sha3_256);
    EXPECT_EQ(hash_function_from_string("sha256"), HashFunction::Sha256);
    EXPECT_EQ(hash_function_from_string("blake2s"), HashFunction::Blake2s256);
    EXPECT_EQ(hash_function_from_string(to_string(HashFunction::Blake2b512)), HashFunction::Blake2b512);
    EXPECT_THROW(hash_function_from_string("md5"), std::invalid_argument);
    EXPECT_THROW(hash_function_from_string("blake2b-256"), std::invalid_argument);
}

TEST(HashValueTest, HexRoundTrip) {
    HashValue v = hash_of(HashFunction::Sha256, "abc");
    EXPECT_EQ(HashValue::from_hex(v.to_hex()), v);
    EXPECT_THROW(HashValue::from_hex("abcd"), std::invalid_argument);
    EXPECT_TRUE(HashValue::zero().is_zero());
    EXPECT_FALSE(v.is_zero());
}
