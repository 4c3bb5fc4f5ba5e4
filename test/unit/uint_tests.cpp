// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_all.hpp>
#include "util/uint.hpp"
#include <unordered_set>

TEST_CASE("uint256 basic operations", "[uint]")
{
    SECTION("Default constructor creates zero")
    {
        uint256 zero;
        REQUIRE(zero.IsNull());
        REQUIRE(zero == uint256::ZERO);
    }

    SECTION("Constructor with value sets first byte")
    {
        uint256 one(1);
        REQUIRE_FALSE(one.IsNull());
        REQUIRE(one == uint256::ONE);
        REQUIRE(one.data()[0] == 1);
        REQUIRE(one.data()[31] == 0);
    }

    SECTION("SetNull clears")
    {
        uint256 v(7);
        v.SetNull();
        REQUIRE(v.IsNull());
    }

    SECTION("Size is 32 bytes")
    {
        REQUIRE(uint256::size() == 32);
        uint256 v;
        REQUIRE(v.end() - v.begin() == 32);
    }
}

TEST_CASE("uint256 hex encoding", "[uint]")
{
    const std::string hex =
        "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

    SECTION("Hex is written in storage order")
    {
        uint256 v;
        REQUIRE(v.SetHex(hex));
        REQUIRE(v.data()[0] == 0x00);
        REQUIRE(v.data()[1] == 0x11);
        REQUIRE(v.data()[31] == 0xff);
        REQUIRE(v.GetHex() == hex);
        REQUIRE(v.ToString() == hex);
    }

    SECTION("0x prefix and upper case accepted")
    {
        uint256 a;
        uint256 b;
        REQUIRE(a.SetHex(hex));
        REQUIRE(b.SetHex("0x" + std::string(
            "00112233445566778899AABBCCDDEEFF00112233445566778899AABBCCDDEEFF")));
        REQUIRE(a == b);
    }

    SECTION("Wrong length rejected and leaves null")
    {
        uint256 v(5);
        REQUIRE_FALSE(v.SetHex("abcd"));
        REQUIRE(v.IsNull());
        REQUIRE_FALSE(v.SetHex(hex + "00"));
    }

    SECTION("Non-hex characters rejected")
    {
        std::string bad = hex;
        bad[10] = 'g';
        uint256 v;
        REQUIRE_FALSE(v.SetHex(bad));
        REQUIRE(v.IsNull());
    }

    SECTION("uint256S yields null on invalid input")
    {
        REQUIRE(uint256S("nothex").IsNull());
        REQUIRE(uint256S(hex).GetHex() == hex);
    }
}

TEST_CASE("uint256 comparison and hashing", "[uint]")
{
    uint256 a(1);
    uint256 b(2);

    SECTION("Ordering is bytewise")
    {
        REQUIRE(a < b);
        REQUIRE_FALSE(b < a);
        REQUIRE(a != b);
        REQUIRE(a.Compare(a) == 0);
    }

    SECTION("GetUint64 is little-endian")
    {
        uint256 v;
        v.data()[0] = 0x01;
        v.data()[1] = 0x02;
        REQUIRE(v.GetUint64(0) == 0x0201);
        REQUIRE(v.GetUint64(1) == 0);
        v.data()[8] = 0xff;
        REQUIRE(v.GetUint64(1) == 0xff);
    }

    SECTION("Usable in unordered containers")
    {
        std::unordered_set<uint256> set;
        set.insert(a);
        set.insert(b);
        set.insert(a);
        REQUIRE(set.size() == 2);
        REQUIRE(set.count(b) == 1);
    }

    SECTION("Span constructor copies and zero-fills")
    {
        std::vector<unsigned char> bytes = {9, 8, 7};
        uint256 v(bytes);
        REQUIRE(v.data()[0] == 9);
        REQUIRE(v.data()[2] == 7);
        REQUIRE(v.data()[3] == 0);
    }
}
