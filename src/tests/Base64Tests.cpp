// SPDX-License-Identifier: Apache-2.0
#include <core/Base64.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;

TEST_CASE("base64::decode decodes padded input", "[base64]")
{
    CHECK(base64::decode("aGVsbG8gd29ybGQ=").value() == "hello world");
    CHECK(base64::decode("YQ==").value() == "a");
    CHECK(base64::decode("YWI=").value() == "ab");
    CHECK(base64::decode("YWJj").value() == "abc");
}

TEST_CASE("base64::decode accepts missing padding and whitespace", "[base64]")
{
    CHECK(base64::decode("YQ").value() == "a");
    CHECK(base64::decode("aGVs\nbG8=\r\n").value() == "hello");
    CHECK(base64::decode("").value().empty());
}

TEST_CASE("base64::decode keeps binary bytes", "[base64]")
{
    auto const decoded = base64::decode("AP8QgA==");
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->size() == 4);
    CHECK(static_cast<unsigned char>((*decoded)[0]) == 0x00);
    CHECK(static_cast<unsigned char>((*decoded)[1]) == 0xFF);
    CHECK(static_cast<unsigned char>((*decoded)[2]) == 0x10);
    CHECK(static_cast<unsigned char>((*decoded)[3]) == 0x80);
}

TEST_CASE("base64::decode rejects invalid input", "[base64]")
{
    auto invalidChar = base64::decode("aGV*bG8=");
    REQUIRE(!invalidChar.has_value());
    CHECK(invalidChar.error().code == ErrorCode::InvalidArgument);

    auto dataAfterPadding = base64::decode("YQ==YQ==");
    REQUIRE(!dataAfterPadding.has_value());
    CHECK(dataAfterPadding.error().code == ErrorCode::InvalidArgument);
}
