#include <gtest/gtest.h>

#include <curl/curl.h>

#include "token_keeper/services/network/http_client.hpp"

using token_keeper::services::HttpClientConfig;
using token_keeper::services::HttpRequest;
using token_keeper::services::NetworkError;
using token_keeper::services::network_error_from_curl_code;

namespace {
NetworkError map(CURLcode code) {
  return network_error_from_curl_code(static_cast<int>(code));
}
}  // namespace

TEST(CurlErrorMappingTest, OnlyTruncatedBodiesAreReadErrors) {
  EXPECT_EQ(map(CURLE_RECV_ERROR), NetworkError::BadResponse);
  EXPECT_EQ(map(CURLE_PARTIAL_FILE), NetworkError::BadResponse);
  EXPECT_EQ(map(CURLE_WRITE_ERROR), NetworkError::BadResponse);
  EXPECT_EQ(map(CURLE_BAD_CONTENT_ENCODING), NetworkError::BadResponse);
}

TEST(CurlErrorMappingTest, NoResponseAtAllIsAConnectionFailure) {
  EXPECT_EQ(map(CURLE_GOT_NOTHING), NetworkError::ConnectionFailed);
  EXPECT_EQ(map(CURLE_COULDNT_CONNECT), NetworkError::ConnectionFailed);
  EXPECT_EQ(map(CURLE_SEND_ERROR), NetworkError::ConnectionFailed);
  EXPECT_EQ(map(CURLE_INTERFACE_FAILED), NetworkError::ConnectionFailed);
  EXPECT_EQ(map(CURLE_FAILED_INIT), NetworkError::ConnectionFailed);
}

TEST(CurlErrorMappingTest, NamedTransportFailures) {
  EXPECT_EQ(map(CURLE_COULDNT_RESOLVE_HOST), NetworkError::DNSResolutionFailed);
  EXPECT_EQ(map(CURLE_COULDNT_RESOLVE_PROXY), NetworkError::DNSResolutionFailed);
  EXPECT_EQ(map(CURLE_OPERATION_TIMEDOUT), NetworkError::Timeout);
  EXPECT_EQ(map(CURLE_PEER_FAILED_VERIFICATION), NetworkError::SSLError);
  EXPECT_EQ(map(CURLE_SSL_CACERT_BADFILE), NetworkError::SSLError);
  EXPECT_EQ(map(CURLE_SSL_CONNECT_ERROR), NetworkError::SSLError);
  EXPECT_EQ(map(CURLE_URL_MALFORMAT), NetworkError::InvalidUrl);
  EXPECT_EQ(map(CURLE_ABORTED_BY_CALLBACK), NetworkError::Cancelled);
}

TEST(HttpClientConfigTest, RejectsEmptyCaBundleAndZeroTimeouts) {
  HttpClientConfig config;
  EXPECT_TRUE(config.is_valid());

  config.ca_cert_path = "";
  EXPECT_FALSE(config.is_valid());
  config.ca_cert_path = "/etc/ssl/certs/ca-certificates.crt";
  EXPECT_TRUE(config.is_valid());

  config.connect_timeout = std::chrono::seconds{0};
  EXPECT_FALSE(config.is_valid());
}

TEST(HttpRequestTest, RequiresHttpUrl) {
  HttpRequest request;
  EXPECT_FALSE(request.is_valid());
  request.url = "https://auth.example.test/oauth/token";
  EXPECT_TRUE(request.is_valid());
  request.url = "file:///etc/passwd";
  EXPECT_FALSE(request.is_valid());
}
