#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "resumegen/utils/base64.hpp"

using resumegen::utils::encode_base64;
using resumegen::utils::make_data_uri;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST(UtilsBase64Test, EncodesWithPadding) {
  EXPECT_EQ(encode_base64(bytes_of("")), "");
  EXPECT_EQ(encode_base64(bytes_of("f")), "Zg==");
  EXPECT_EQ(encode_base64(bytes_of("fo")), "Zm8=");
  EXPECT_EQ(encode_base64(bytes_of("foo")), "Zm9v");
  EXPECT_EQ(encode_base64(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(UtilsBase64Test, EncodesBinaryBytes) {
  EXPECT_EQ(encode_base64({0xFF, 0xD8, 0xFF, 0xE0}), "/9j/4A==");
}

TEST(UtilsBase64Test, BuildsDataUri) {
  EXPECT_EQ(make_data_uri("image/png", bytes_of("Man")), "data:image/png;base64,TWFu");
}
