#include <gtest/gtest.h>
#include "chunkvault/checksum.h"
#include "test_support.h"

#include <algorithm>
#include <cctype>

using namespace chunkvault;
using chunkvault::testing::toBytes;

// SHA-256("abc") from FIPS 180-2.
static const std::string kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(ChecksumVerifier, ComputesKnownDigest) {
    EXPECT_EQ(ChecksumVerifier::compute(toBytes("abc")), kAbcDigest);
}

TEST(ChecksumVerifier, EmptyInput) {
    EXPECT_EQ(ChecksumVerifier::compute({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChecksumVerifier, AcceptsEitherCase) {
    std::string upper = kAbcDigest;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    auto bytes = toBytes("abc");
    EXPECT_TRUE(ChecksumVerifier::verify(bytes, kAbcDigest));
    EXPECT_TRUE(ChecksumVerifier::verify(bytes, upper));
}

TEST(ChecksumVerifier, RejectsWrongOrMalformedDigest) {
    auto bytes = toBytes("abd");
    EXPECT_FALSE(ChecksumVerifier::verify(bytes, kAbcDigest));
    EXPECT_FALSE(ChecksumVerifier::verify(toBytes("abc"), ""));
    EXPECT_FALSE(ChecksumVerifier::verify(toBytes("abc"), kAbcDigest.substr(0, 63)));
    EXPECT_FALSE(ChecksumVerifier::verify(toBytes("abc"), kAbcDigest + "0"));
    std::string bogus = kAbcDigest;
    bogus[0] = 'g';
    EXPECT_FALSE(ChecksumVerifier::verify(toBytes("abc"), bogus));
}
