#include <gtest/gtest.h>

#include "filevault/env.hpp"
#include "filevault/error.hpp"

#include <cstdint>
#include <string>

namespace filevault::env {
namespace {

TEST(ParseByteSizeTest, AcceptsSuffixes) {
    EXPECT_EQ(ParseByteSize("0"), 0u);
    EXPECT_EQ(ParseByteSize("4096"), 4096u);
    EXPECT_EQ(ParseByteSize("64K"), 64u * 1024u);
    EXPECT_EQ(ParseByteSize("10m"), 10ull * 1024u * 1024u);
    EXPECT_EQ(ParseByteSize("2G"), 2ull * 1024u * 1024u * 1024u);
}

TEST(ParseByteSizeTest, RejectsGarbage) {
    for (const std::string raw : {"", "-1", "K", "12KB", "1.5M", " 5"}) {
        EXPECT_THROW(ParseByteSize(raw), Error) << raw;
    }
}

TEST(ParseByteSizeTest, RejectsOverflow) {
    EXPECT_EQ(ParseByteSize("18446744073709551615"), UINT64_MAX);
    EXPECT_EQ(ParseByteSize("17179869183G"), 17179869183ull * 1024u * 1024u * 1024u);
    for (const std::string raw : {"18446744073709551616", "99999999999999999999999", "17179869184G",
                                  "18014398509481984K"}) {
        try {
            ParseByteSize(raw);
            FAIL() << "accepted " << raw;
        } catch (const Error& err) {
            EXPECT_EQ(err.code(), ErrorCode::InvalidInput);
            EXPECT_NE(std::string(err.what()).find("too large"), std::string::npos) << raw;
        }
    }
}

}  // namespace
}  // namespace filevault::env
