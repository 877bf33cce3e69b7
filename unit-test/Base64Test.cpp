#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace executor;

TEST(Base64Test, EncodeWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("hello world\n"), "aGVsbG8gd29ybGQK");
}

TEST(Base64Test, DecodeSourceCode) {
    EXPECT_EQ(base64_decode("cHJpbnQoIkhlbGxvLCBXb3JsZCEiKQ=="), "print(\"Hello, World!\")");
    EXPECT_EQ(base64_decode(""), "");
    EXPECT_EQ(base64_decode("Zg=="), "f");
    EXPECT_EQ(base64_decode("Zm8="), "fo");
}

TEST(Base64Test, BinaryData) {
    string data;
    for (int i = 0; i < 256; ++i) data.push_back((char)i);
    EXPECT_EQ(base64_decode(base64_encode(data)), data);
}

TEST(Base64Test, RejectsInvalidCharacters) {
    EXPECT_THROW(base64_decode("not base64!"), decode_error);
    EXPECT_THROW(base64_decode("Zm9v!A=="), decode_error);
    EXPECT_THROW(base64_decode("Zm9v\nZm9v"), decode_error);
    EXPECT_THROW(base64_decode("Zm-_"), decode_error);
}

TEST(Base64Test, RejectsBadPadding) {
    EXPECT_THROW(base64_decode("Zg"), decode_error);
    EXPECT_THROW(base64_decode("Zg="), decode_error);
    EXPECT_THROW(base64_decode("Z==="), decode_error);
    EXPECT_THROW(base64_decode("Zg==Zm9v"), decode_error);
    EXPECT_THROW(base64_decode("Zm=v"), decode_error);
}
