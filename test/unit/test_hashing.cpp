// test/unit/test_hashing.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <string>

#include "util/hashing.hpp"

namespace {

TEST(HashingTest, Sha256KnownVectors) {
    EXPECT_EQ(piiguard::util::hashing::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(piiguard::util::hashing::sha256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingTest, FingerprintIsDigestPrefix) {
    EXPECT_EQ(piiguard::util::hashing::fingerprint("abc"), "ba7816bf8f01");
    EXPECT_EQ(piiguard::util::hashing::fingerprint("abc", 4), "ba78");
    EXPECT_NE(piiguard::util::hashing::fingerprint("Max Mustermann"),
              piiguard::util::hashing::fingerprint("Erika Musterfrau"));
}

} // namespace
