#include <gtest/gtest.h>

#include "test_support.hpp"
#include "token_keeper/core/application.hpp"
#include "token_keeper/utils/config_validator.hpp"
#include "token_keeper/utils/yaml_config.hpp"

using token_keeper::core::ApplicationConfig;
using token_keeper::core::ConfigError;
using token_keeper::core::ConfigManager;
using token_keeper::utils::ConfigValidator;
using token_keeper::utils::LogLevel;
using token_keeper::utils::ValidationError;
using token_keeper::utils::YamlConfigHelper;

namespace {

const char *kValidConfig = R"(
log_level: debug
auth:
  url: https://auth.example.test/oauth/token
  username: alice@example.test
  password: pw
  client_secret: secret
token:
  path: /var/run/bearer.dat
  refresh_interval: 300
http:
  timeout: 15
  verify_ssl: false
)";

ApplicationConfig valid_config() {
  ApplicationConfig config;
  config.auth.username = "alice@example.test";
  config.auth.password = "pw";
  config.auth.client_secret = "secret";
  return config;
}

bool has_error(const token_keeper::utils::ValidationResult &result, ValidationError error) {
  for (const auto &[kind, message] : result.errors) {
    if (kind == error) return true;
  }
  return false;
}

}  // namespace

TEST(YamlConfigTest, DefaultsMatchTheReferenceDeployment) {
  ApplicationConfig config;
  EXPECT_EQ(config.auth.url, "https://auth.tado.com/oauth/token");
  EXPECT_EQ(config.auth.client_id, "public-api-preview");
  EXPECT_EQ(config.auth.scope, "home.user");
  EXPECT_EQ(config.token.path, "/tmp/bearer.dat");
  EXPECT_EQ(config.token.refresh_interval, std::chrono::seconds{540});
  EXPECT_EQ(config.http.timeout, std::chrono::seconds{30});
  EXPECT_TRUE(config.http.verify_ssl);
}

TEST(YamlConfigTest, LoadsAllSections) {
  testinfra::capture_logs();
  auto config = YamlConfigHelper::load_from_string(kValidConfig);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->log_level, LogLevel::Debug);
  EXPECT_EQ(config->auth.username, "alice@example.test");
  EXPECT_EQ(config->auth.client_id, "public-api-preview");
  EXPECT_EQ(config->token.path, "/var/run/bearer.dat");
  EXPECT_EQ(config->token.refresh_interval, std::chrono::seconds{300});
  EXPECT_EQ(config->http.timeout, std::chrono::seconds{15});
  EXPECT_FALSE(config->http.verify_ssl);

  auto identity = config->identity();
  EXPECT_EQ(identity.endpoint_url, "https://auth.example.test/oauth/token");
  EXPECT_EQ(identity.client_secret, "secret");
}

TEST(YamlConfigTest, BearerTokenKeyIsAcceptedForPath) {
  testinfra::capture_logs();
  auto config = YamlConfigHelper::load_from_string("token:\n  bearer_token: /srv/token\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->token.path, "/srv/token");
}

TEST(YamlConfigTest, RejectsMalformedDocuments) {
  testinfra::capture_logs();
  auto not_a_map = YamlConfigHelper::load_from_string("- a\n- b\n");
  ASSERT_FALSE(not_a_map.has_value());
  EXPECT_EQ(not_a_map.error(), ConfigError::InvalidFormat);

  auto bad_number = YamlConfigHelper::load_from_string("token:\n  refresh_interval: soon\n");
  ASSERT_FALSE(bad_number.has_value());
  EXPECT_EQ(bad_number.error(), ConfigError::InvalidFormat);
}

TEST(YamlConfigTest, MissingFileIsReported) {
  testinfra::capture_logs();
  testinfra::TempDir dir;
  auto result = YamlConfigHelper::load_from_file(dir.path() / "absent.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ConfigError::FileNotFound);
}

TEST(ConfigValidatorTest, AcceptsCompleteConfig) {
  auto result = ConfigValidator::validate_application_config(valid_config());
  EXPECT_TRUE(result.is_valid) << result.get_error_summary();
  EXPECT_TRUE(valid_config().is_valid());
}

TEST(ConfigValidatorTest, RequiresCredentials) {
  auto config = valid_config();
  config.auth.username.clear();
  config.auth.password.clear();
  auto result = ConfigValidator::validate_application_config(config);
  EXPECT_FALSE(result.is_valid);
  EXPECT_EQ(result.errors.size(), 2u);
  EXPECT_TRUE(has_error(result, ValidationError::MissingRequiredField));
}

TEST(ConfigValidatorTest, RejectsBadUrlAndRanges) {
  auto config = valid_config();
  config.auth.url = "auth.example.test/token";
  config.token.refresh_interval = std::chrono::seconds{0};
  config.http.timeout = std::chrono::seconds{301};
  auto result = ConfigValidator::validate_application_config(config);
  EXPECT_FALSE(result.is_valid);
  EXPECT_TRUE(has_error(result, ValidationError::InvalidUrl));
  EXPECT_TRUE(has_error(result, ValidationError::InvalidRefreshInterval));
  EXPECT_TRUE(has_error(result, ValidationError::InvalidTimeout));
}

TEST(ConfigValidatorTest, WarnsWithoutFailing) {
  auto config = valid_config();
  config.auth.url = "http://auth.example.test/token";
  config.auth.client_secret.clear();
  config.token.refresh_interval = std::chrono::seconds{600};
  config.http.verify_ssl = false;
  auto result = ConfigValidator::validate_application_config(config);
  EXPECT_TRUE(result.is_valid);
  EXPECT_EQ(result.warnings.size(), 4u);
}

TEST(ConfigManagerTest, LoadsAndValidatesFile) {
  testinfra::capture_logs();
  testinfra::TempDir dir;
  auto path = dir.path() / "config.yaml";
  testinfra::write_file(path, kValidConfig);

  ConfigManager manager(path);
  ASSERT_TRUE(manager.load().has_value());
  EXPECT_EQ(manager.path().string(), path.string());
  EXPECT_EQ(manager.get().token.path, "/var/run/bearer.dat");
}

TEST(ConfigManagerTest, InvalidFileKeepsPreviousConfig) {
  testinfra::capture_logs();
  testinfra::TempDir dir;
  auto path = dir.path() / "config.yaml";
  testinfra::write_file(path, "auth:\n  username: alice\n");

  ConfigManager manager(path);
  auto loaded = manager.load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), ConfigError::ValidationError);
  EXPECT_TRUE(manager.get().auth.username.empty());
}

TEST(ConfigManagerTest, SampleConfigParsesBack) {
  testinfra::capture_logs();
  auto config = YamlConfigHelper::load_from_string(ConfigManager::sample_config());
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->auth.url, ApplicationConfig{}.auth.url);
  EXPECT_EQ(config->token.refresh_interval, ApplicationConfig{}.token.refresh_interval);
}

TEST(YamlConfigTest, CaBundleIsReadFromHttpSection) {
  testinfra::capture_logs();
  auto config = YamlConfigHelper::load_from_string("http:\n  ca_cert: /etc/token-keeper/ca.pem\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->http.ca_cert, "/etc/token-keeper/ca.pem");
  EXPECT_TRUE(ApplicationConfig{}.http.ca_cert.empty());
}

TEST(ConfigValidatorTest, CaBundleMustExist) {
  testinfra::TempDir dir;
  auto config = valid_config();
  config.http.ca_cert = (dir.path() / "missing.pem").string();
  auto result = ConfigValidator::validate_application_config(config);
  EXPECT_FALSE(result.is_valid);
  EXPECT_TRUE(has_error(result, ValidationError::InvalidCaCertificate));

  testinfra::write_file(dir.path() / "ca.pem", "-----BEGIN CERTIFICATE-----\n");
  config.http.ca_cert = (dir.path() / "ca.pem").string();
  EXPECT_TRUE(ConfigValidator::validate_application_config(config).is_valid);
}
