#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace relay;

namespace {

constexpr const char* kKeys[] = {
    "N8N_WEBHOOK_URL",       "N8N_WEBHOOK_AUTH_TOKEN",  "N8N_MODEL_NAME",     "N8N_MODEL_DESCRIPTION",
    "N8N_TIMEOUT",           "N8N_MAX_RETRIES",         "N8N_DEFAULT_TEMPERATURE", "N8N_DEFAULT_MAX_TOKENS",
    "N8N_DEFAULT_TOP_P",     "N8N_DEBUG",               "N8N_TLS_VERIFY",     "RELAY_LISTEN_HOST",
    "RELAY_LISTEN_PORT",     "RELAY_API_PREFIX_MODE",
};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kKeys) ::unsetenv(key);
  }
};

}  // namespace

TEST_F(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
  auto s = LoadSettingsFromEnv();
  EXPECT_EQ(s.webhook_url, kWebhookUrlPlaceholder);
  EXPECT_FALSE(s.IsConfigured());
  EXPECT_TRUE(s.auth_token.empty());
  EXPECT_EQ(s.model_name, "n8n-agent");
  EXPECT_EQ(s.model_description, "n8n Webhook Agent for AI interactions");
  EXPECT_EQ(s.timeout.count(), 120);
  EXPECT_EQ(s.max_retries, 3);
  EXPECT_DOUBLE_EQ(s.default_temperature, 0.7);
  EXPECT_EQ(s.default_max_tokens, 2048);
  EXPECT_DOUBLE_EQ(s.default_top_p, 1.0);
  EXPECT_FALSE(s.debug);
  EXPECT_TRUE(s.verify_tls);
  EXPECT_EQ(s.listen.port, 8080);
}

TEST_F(ConfigTest, ReadsEveryKey) {
  ::setenv("N8N_WEBHOOK_URL", "https://n8n.internal:5678/webhook/abc", 1);
  ::setenv("N8N_WEBHOOK_AUTH_TOKEN", "tok", 1);
  ::setenv("N8N_MODEL_NAME", "my-flow", 1);
  ::setenv("N8N_MODEL_DESCRIPTION", "Flow", 1);
  ::setenv("N8N_TIMEOUT", "30", 1);
  ::setenv("N8N_MAX_RETRIES", "0", 1);
  ::setenv("N8N_DEFAULT_TEMPERATURE", "0.2", 1);
  ::setenv("N8N_DEFAULT_MAX_TOKENS", "512", 1);
  ::setenv("N8N_DEFAULT_TOP_P", "0.9", 1);
  ::setenv("N8N_DEBUG", "TRUE", 1);
  ::setenv("N8N_TLS_VERIFY", "false", 1);
  ::setenv("RELAY_LISTEN_PORT", "9090", 1);

  auto s = LoadSettingsFromEnv();
  EXPECT_TRUE(s.IsConfigured());
  EXPECT_EQ(s.auth_token, "tok");
  EXPECT_EQ(s.model_name, "my-flow");
  EXPECT_EQ(s.model_description, "Flow");
  EXPECT_EQ(s.timeout.count(), 30);
  EXPECT_EQ(s.max_retries, 0);
  EXPECT_DOUBLE_EQ(s.default_temperature, 0.2);
  EXPECT_EQ(s.default_max_tokens, 512);
  EXPECT_DOUBLE_EQ(s.default_top_p, 0.9);
  EXPECT_TRUE(s.debug);
  EXPECT_FALSE(s.verify_tls);
  EXPECT_EQ(s.listen.port, 9090);
}

TEST_F(ConfigTest, MalformedValuesFallBackToDefaults) {
  ::setenv("N8N_TIMEOUT", "soon", 1);
  ::setenv("N8N_MAX_RETRIES", "-4", 1);
  ::setenv("N8N_DEFAULT_TEMPERATURE", "warm", 1);
  ::setenv("N8N_DEFAULT_MAX_TOKENS", "12abc", 1);
  ::setenv("N8N_DEBUG", "maybe", 1);
  ::setenv("RELAY_LISTEN_PORT", "70000", 1);

  auto s = LoadSettingsFromEnv();
  EXPECT_EQ(s.timeout.count(), 120);
  EXPECT_EQ(s.max_retries, 3);
  EXPECT_DOUBLE_EQ(s.default_temperature, 0.7);
  EXPECT_EQ(s.default_max_tokens, 2048);
  EXPECT_FALSE(s.debug);
  EXPECT_EQ(s.listen.port, 8080);
}

TEST_F(ConfigTest, AuthTokenPlaceholderMeansNoToken) {
  ::setenv("N8N_WEBHOOK_AUTH_TOKEN", kAuthTokenPlaceholder, 1);
  EXPECT_TRUE(LoadSettingsFromEnv().auth_token.empty());
}

TEST_F(ConfigTest, EmptyOrPlaceholderUrlIsNotConfigured) {
  Settings s;
  s.webhook_url = "";
  EXPECT_FALSE(s.IsConfigured());
  s.webhook_url = kWebhookUrlPlaceholder;
  EXPECT_FALSE(s.IsConfigured());
  s.webhook_url = "http://localhost:5678/webhook/x";
  EXPECT_TRUE(s.IsConfigured());
}

TEST_F(ConfigTest, ParsesWebhookEndpoint) {
  auto ep = ParseHttpEndpoint("https://n8n.example.com/webhook/chat?x=1");
  EXPECT_EQ(ep.scheme, "https");
  EXPECT_EQ(ep.host, "n8n.example.com");
  EXPECT_EQ(ep.port, 443);
  EXPECT_EQ(ep.path, "/webhook/chat?x=1");

  ep = ParseHttpEndpoint("http://127.0.0.1:5678");
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.port, 5678);
  EXPECT_EQ(ep.path, "/");
  EXPECT_EQ(ep.SchemeHostPort(), "http://127.0.0.1:5678");
}

TEST_F(ConfigTest, RoutePrefixModes) {
  Settings s;
  EXPECT_EQ(s.RoutePrefixes(), (std::vector<std::string>{"", "/n8n"}));
  s.api_prefix_mode = "root";
  EXPECT_EQ(s.RoutePrefixes(), (std::vector<std::string>{""}));
  s.api_prefix_mode = "n8n";
  EXPECT_EQ(s.RoutePrefixes(), (std::vector<std::string>{"/n8n"}));
}
