#include <gtest/gtest.h>

#include "token_keeper/utils/url_utils.hpp"

using token_keeper::utils::UrlUtils;

TEST(UrlUtilsTest, EncodesReservedCharacters) {
  EXPECT_EQ(UrlUtils::encode("alice@example.test"), "alice%40example.test");
  EXPECT_EQ(UrlUtils::encode("p&ss=word +"), "p%26ss%3Dword%20%2B");
  EXPECT_EQ(UrlUtils::encode("A-z_0.9~"), "A-z_0.9~");
}

TEST(UrlUtilsTest, FormBodyKeepsFieldOrder) {
  UrlUtils::Params params{{"grant_type", "password"},
                          {"username", "a@b"},
                          {"scope", "home.user"}};
  EXPECT_EQ(UrlUtils::build_query_string(params),
            "grant_type=password&username=a%40b&scope=home.user");
}

TEST(UrlUtilsTest, ValidatesSchemeAndHost) {
  EXPECT_TRUE(UrlUtils::is_valid_url("https://auth.tado.com/oauth/token"));
  EXPECT_TRUE(UrlUtils::is_valid_url("http://localhost:8080/token"));
  EXPECT_FALSE(UrlUtils::is_valid_url("ftp://example.test/token"));
  EXPECT_FALSE(UrlUtils::is_valid_url("https:///token"));
  EXPECT_FALSE(UrlUtils::is_valid_url("auth.tado.com/oauth/token"));

  EXPECT_EQ(UrlUtils::get_host("http://localhost:8080/token"), "localhost");
  EXPECT_EQ(UrlUtils::get_scheme("https://auth.tado.com"), "https");
}
