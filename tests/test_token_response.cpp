#include <gtest/gtest.h>

#include "token_keeper/services/auth/token_response.hpp"

using token_keeper::services::TokenResponse;

TEST(TokenResponseTest, DecodesFullTokenBody) {
  auto state = TokenResponse::parse_token_state(
      R"({"access_token":"AT1","token_type":"bearer","refresh_token":"RT1","expires_in":599,"scope":"home.user","jti":"x"})");
  ASSERT_TRUE(state.has_value()) << state.error();
  EXPECT_EQ(state->access_token, "AT1");
  EXPECT_EQ(state->refresh_token, "RT1");
  EXPECT_EQ(state->token_type, "bearer");
  ASSERT_TRUE(state->expires_in.has_value());
  EXPECT_EQ(state->expires_in->count(), 599);
}

TEST(TokenResponseTest, OptionalFieldsMayBeAbsentOrMistyped) {
  auto state = TokenResponse::parse_token_state(
      R"({"access_token":"AT","refresh_token":"RT","expires_in":"soon"})");
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->token_type.empty());
  EXPECT_FALSE(state->expires_in.has_value());
}

TEST(TokenResponseTest, RejectsMissingOrEmptyTokens) {
  EXPECT_FALSE(TokenResponse::parse_token_state(R"({"refresh_token":"RT"})"));
  EXPECT_FALSE(TokenResponse::parse_token_state(R"({"access_token":"AT"})"));
  EXPECT_FALSE(TokenResponse::parse_token_state(R"({"access_token":"","refresh_token":"RT"})"));
  EXPECT_FALSE(TokenResponse::parse_token_state(R"({"access_token":"AT","refresh_token":""})"));
  EXPECT_FALSE(TokenResponse::parse_token_state(R"({"access_token":42,"refresh_token":"RT"})"));
}

TEST(TokenResponseTest, RejectsNonObjectBodies) {
  EXPECT_FALSE(TokenResponse::parse_token_state(""));
  EXPECT_FALSE(TokenResponse::parse_token_state("<html>oops</html>"));
  EXPECT_FALSE(TokenResponse::parse_token_state(R"(["access_token"])"));
  EXPECT_FALSE(TokenResponse::parse_token_state("null"));
}

TEST(TokenResponseTest, ErrorOnlyBodyIsNotAToken) {
  const std::string body =
      R"({"error":"invalid_grant","error_description":"Bad credentials"})";
  EXPECT_FALSE(TokenResponse::parse_token_state(body));

  auto server_error = TokenResponse::parse_server_error(body);
  ASSERT_TRUE(server_error.has_value());
  EXPECT_EQ(server_error->error, "invalid_grant");
  EXPECT_EQ(server_error->description, "Bad credentials");
}

TEST(TokenResponseTest, ServerErrorProbeIgnoresBodiesWithoutError) {
  EXPECT_FALSE(TokenResponse::parse_server_error(""));
  EXPECT_FALSE(TokenResponse::parse_server_error("not json"));
  EXPECT_FALSE(TokenResponse::parse_server_error(R"({"access_token":"AT","refresh_token":"RT"})"));
  EXPECT_FALSE(TokenResponse::parse_server_error(R"({"error":""})"));
}

TEST(TokenResponseTest, ErrorAndTokenCanCoexist) {
  const std::string body =
      R"({"error":"deprecated_client","access_token":"AT","refresh_token":"RT"})";
  auto server_error = TokenResponse::parse_server_error(body);
  ASSERT_TRUE(server_error.has_value());
  EXPECT_TRUE(server_error->description.empty());
  EXPECT_TRUE(TokenResponse::parse_token_state(body).has_value());
}
