#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include "../../src/core/config/provider_config.hpp"
#include "../../src/core/errors/errors.hpp"

using namespace Conduit::Core;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

}  // namespace

TEST(ProviderConfigTest, ParsesDescriptors) {
    std::string yaml = R"(
        providers:
          - name: static-us
            type: static_list
            price_per_gb: 0.5
            concurrency_limit: 2
            options:
              entries: ["user:pass@1.2.3.4:8000", "5.6.7.8:9000"]
          - name: bd-resi
            type: brightdata
            price_per_gb: 12
            options:
              username: bd-user
              password: bd-pass
              port: 22225
    )";
    auto configs = parse_provider_configs(yaml, fake_env({}));
    ASSERT_EQ(configs.size(), 2);

    EXPECT_EQ(configs[0].name, "static-us");
    EXPECT_EQ(configs[0].type, "static_list");
    EXPECT_DOUBLE_EQ(*configs[0].price_per_gb, 0.5);
    EXPECT_EQ(*configs[0].concurrency_limit, 2);
    EXPECT_EQ(configs[0].options.at("entries"), "user:pass@1.2.3.4:8000\n5.6.7.8:9000");

    EXPECT_TRUE(configs[1].unlimited());
    EXPECT_EQ(configs[1].option("port"), "22225");
}

TEST(ProviderConfigTest, TopLevelSequenceAccepted) {
    std::string yaml = R"(
        - name: p1
          type: static_list
          options: {entries: "a:1"}
    )";
    auto configs = parse_provider_configs(yaml, fake_env({}));
    ASSERT_EQ(configs.size(), 1);
    EXPECT_EQ(configs[0].name, "p1");
}

TEST(ProviderConfigTest, ZeroLimitMeansUnlimited) {
    std::string yaml = "providers: [{name: p1, type: static_list, concurrency_limit: 0}]";
    auto        configs = parse_provider_configs(yaml, fake_env({}));
    EXPECT_TRUE(configs[0].unlimited());
    EXPECT_FALSE(configs[0].price_per_gb.has_value());
    EXPECT_DOUBLE_EQ(configs[0].price_or_zero(), 0.0);
}

TEST(ProviderConfigTest, ResolvesEnvSecretsAtLoad) {
    std::string yaml = R"(
        providers:
          - name: bd
            type: brightdata
            options:
              username: env:BD_USER
              password: env:BD_PASS
    )";
    auto configs = parse_provider_configs(yaml, fake_env({{"BD_USER", "alice"}, {"BD_PASS", "s3cret"}}));
    EXPECT_EQ(configs[0].options.at("username"), "alice");
    EXPECT_EQ(configs[0].options.at("password"), "s3cret");
}

TEST(ProviderConfigTest, MissingEnvVarNamesTheVariable) {
    std::string yaml = R"(
        providers:
          - name: bd
            type: brightdata
            options:
              password: "env:MISSING_VAR"
    )";
    try {
        parse_provider_configs(yaml, fake_env({}));
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("MISSING_VAR"), std::string::npos);
    }
}

TEST(ProviderConfigTest, ProcessEnvironmentLookup) {
    ::unsetenv("CONDUIT_TEST_UNSET_VAR");
    ::setenv("CONDUIT_TEST_SET_VAR", "value", 1);
    EXPECT_EQ(resolve_secret("env:CONDUIT_TEST_SET_VAR", process_env()), "value");
    EXPECT_THROW(resolve_secret("env:CONDUIT_TEST_UNSET_VAR", process_env()), ConfigurationError);
    ::unsetenv("CONDUIT_TEST_SET_VAR");
}

TEST(ProviderConfigTest, PlainValuesPassThrough) {
    EXPECT_EQ(resolve_secret("plain", fake_env({})), "plain");
    EXPECT_EQ(resolve_secret("environment:X", fake_env({})), "environment:X");
}

TEST(ProviderConfigTest, RejectsInvalidDescriptors) {
    EXPECT_THROW(parse_provider_configs("providers: [{type: static_list}]", fake_env({})),
                 ConfigurationError);
    EXPECT_THROW(parse_provider_configs("providers: [{name: p1}]", fake_env({})),
                 ConfigurationError);
    EXPECT_THROW(
        parse_provider_configs("providers: [{name: p1, type: static_list, price_per_gb: -1}]",
                               fake_env({})),
        ConfigurationError);
    EXPECT_THROW(
        parse_provider_configs("providers: [{name: p1, type: static_list, concurrency_limit: -3}]",
                               fake_env({})),
        ConfigurationError);
    EXPECT_THROW(parse_provider_configs(
                     "providers: [{name: p1, type: static_list}, {name: p1, type: mooproxy}]",
                     fake_env({})),
                 ConfigurationError);
    EXPECT_THROW(parse_provider_configs("providers: {name: p1}", fake_env({})),
                 ConfigurationError);
    EXPECT_THROW(parse_provider_configs("providers: [{name: p1, type: x, price_per_gb: cheap}]",
                                        fake_env({})),
                 ConfigurationError);
}

TEST(ProviderConfigTest, RejectsNonFinitePrice) {
    EXPECT_THROW(
        parse_provider_configs("providers: [{name: p1, type: static_list, price_per_gb: .nan}]",
                               fake_env({})),
        ConfigurationError);
    EXPECT_THROW(
        parse_provider_configs("providers: [{name: p1, type: static_list, price_per_gb: .inf}]",
                               fake_env({})),
        ConfigurationError);
}

TEST(ProviderConfigTest, MalformedYaml) {
    EXPECT_THROW(parse_provider_configs("providers: [unclosed", fake_env({})), ConfigurationError);
}

TEST(ProviderConfigTest, LoadFromFile) {
    std::ofstream ofs("test_providers.yaml");
    ofs << "providers:\n  - name: p1\n    type: static_list\n    options:\n      entries: a:1\n";
    ofs.close();

    auto configs = load_provider_configs("test_providers.yaml", fake_env({}));
    ASSERT_EQ(configs.size(), 1);
    EXPECT_EQ(configs[0].option("entries"), "a:1");
    std::remove("test_providers.yaml");
}

TEST(ProviderConfigTest, NonExistentFile) {
    EXPECT_THROW(load_provider_configs("does_not_exist.yaml", fake_env({})), ConfigurationError);
}
