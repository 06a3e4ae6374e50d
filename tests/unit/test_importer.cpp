#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/proxy/importer/proxy_importer.hpp"
#include "../../src/proxy/manager/manager.hpp"
#include "../../src/proxy/providers/mooproxy_provider.hpp"

using namespace Conduit::Core;
using namespace Conduit::Proxy;
using namespace Conduit::Proxy::Importer;

namespace {

class ImporterTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(LOG_NONE); }
    void TearDown() override { Logger::set_level(LOG_ALL); }
};

}  // namespace

TEST_F(ImporterTest, ParsesHostPort) {
    auto result = Detector::parse("  1.2.3.4:8080 ");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->scheme, "http");
    EXPECT_EQ(result->host, "1.2.3.4");
    EXPECT_EQ(result->port, 8080);
    EXPECT_TRUE(result->username.empty());
    EXPECT_FALSE(result->provider.has_value());
    EXPECT_EQ(result->proxy_type, ProxyType::Datacenter);
    EXPECT_DOUBLE_EQ(result->confidence, 0.7);
}

TEST_F(ImporterTest, ParsesCredentialsAndScheme) {
    auto result = Detector::parse("SOCKS5://alice:pa:ss@gate.smartproxy.com:7000");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->scheme, "socks5");
    EXPECT_EQ(result->host, "gate.smartproxy.com");
    EXPECT_EQ(result->port, 7000);
    EXPECT_EQ(result->username, "alice");
    EXPECT_EQ(result->password, "pa:ss");
    EXPECT_EQ(*result->provider, "smartproxy");
    EXPECT_DOUBLE_EQ(result->confidence, 1.0);
}

TEST_F(ImporterTest, ParsesMooProxyColonForm) {
    auto result = Detector::parse("us.mooproxy.net:12000:bob:secret_country-GB_session-Ab12Cd");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->host, "us.mooproxy.net");
    EXPECT_EQ(result->port, 12000);
    EXPECT_EQ(result->username, "bob");
    EXPECT_EQ(result->password, "secret_country-GB_session-Ab12Cd");
    EXPECT_EQ(*result->provider, "mooproxy");
    EXPECT_EQ(*result->session, "Ab12Cd");
    EXPECT_EQ(*result->region, "GB");
    EXPECT_EQ(result->rotation_type, RotationType::Sticky);
}

TEST_F(ImporterTest, ColonFormKeepsAtSignInPassword) {
    auto result = Detector::parse("10.0.0.1:3128:user:p@ss");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->host, "10.0.0.1");
    EXPECT_EQ(result->port, 3128);
    EXPECT_EQ(result->password, "p@ss");
}

TEST_F(ImporterTest, RejectsUnparseable) {
    EXPECT_FALSE(Detector::parse("").has_value());
    EXPECT_FALSE(Detector::parse("just-a-host").has_value());
    EXPECT_FALSE(Detector::parse("host:notaport").has_value());
    EXPECT_FALSE(Detector::parse("host:70000").has_value());
    EXPECT_FALSE(Detector::parse("user:pass@:8080").has_value());
}

TEST_F(ImporterTest, DetectsProviders) {
    EXPECT_EQ(*Detector::detect_provider("zproxy.lum-superproxy.io", "", ""), "brightdata");
    EXPECT_EQ(*Detector::detect_provider("PR.OXYLABS.IO", "", ""), "oxylabs");
    EXPECT_EQ(*Detector::detect_provider("geo.iproyal.com", "", ""), "iproyal");
    EXPECT_EQ(*Detector::detect_provider("1.2.3.4", "u", "x_session-abc"), "mooproxy");
    EXPECT_FALSE(Detector::detect_provider("proxy.example.com", "u", "p").has_value());
}

TEST_F(ImporterTest, DetectsProxyType) {
    EXPECT_EQ(Detector::detect_proxy_type("resi.example.com", ""), ProxyType::Residential);
    EXPECT_EQ(Detector::detect_proxy_type("x.example.com", "pw-home"), ProxyType::Residential);
    EXPECT_EQ(Detector::detect_proxy_type("static-residential.example.com", ""), ProxyType::Isp);
    EXPECT_EQ(Detector::detect_proxy_type("isp1.example.com", ""), ProxyType::Isp);
    EXPECT_EQ(Detector::detect_proxy_type("4g.example.com", ""), ProxyType::Mobile);
    EXPECT_EQ(Detector::detect_proxy_type("dc.example.com", ""), ProxyType::Datacenter);
}

TEST_F(ImporterTest, DetectsIpVersion) {
    EXPECT_EQ(Detector::detect_ip_version("2001:db8::1"), IpVersion::V6);
    EXPECT_EQ(Detector::detect_ip_version("ipv6.example.com"), IpVersion::V6);
    EXPECT_EQ(Detector::detect_ip_version("1.2.3.4"), IpVersion::V4);

    auto result = Detector::parse("[2001:db8::1]:3128");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->host, "2001:db8::1");
    EXPECT_EQ(result->ip_version, IpVersion::V6);
}

TEST_F(ImporterTest, ImportFromListSkipsInvalidAndTagsMetadata) {
    auto endpoints = BatchImporter::import_from_list(
        {"1.1.1.1:80", "garbage", "u:p@zproxy.lum-superproxy.io:22225"}, "my-batch");

    ASSERT_EQ(endpoints.size(), 2);
    EXPECT_EQ(endpoints[0].provider, "my-batch");
    EXPECT_EQ(endpoints[0].metadata.at("imported"), "true");
    EXPECT_EQ(endpoints[0].metadata.at("detection_confidence"), "0.7");
    EXPECT_EQ(endpoints[0].metadata.at("batch_index"), "1");

    EXPECT_EQ(endpoints[1].provider, "brightdata");
    EXPECT_EQ(endpoints[1].metadata.at("detection_confidence"), "1");
    EXPECT_EQ(endpoints[1].metadata.at("batch_index"), "3");
}

TEST_F(ImporterTest, ImportFromListAppliesTypeOverride) {
    auto endpoints = BatchImporter::import_from_list({"4g.example.com:80"},
                                                     BatchImporter::DEFAULT_PROVIDER_NAME,
                                                     ProxyType::Residential);
    ASSERT_EQ(endpoints.size(), 1);
    EXPECT_EQ(endpoints[0].proxy_type, ProxyType::Residential);
    EXPECT_EQ(endpoints[0].provider, "auto-imported");
}

TEST_F(ImporterTest, ImportFromFile) {
    {
        std::ofstream out("test_import.txt");
        out << "# exported list\n\n1.1.1.1:80\n  user:pa#ss@2.2.2.2:8080  \n";
    }

    auto endpoints = BatchImporter::import_from_file("test_import.txt");
    ASSERT_EQ(endpoints.size(), 2);
    EXPECT_EQ(endpoints[1].password, "pa#ss");
    EXPECT_EQ(endpoints[1].metadata.at("batch_index"), "2");

    std::remove("test_import.txt");
}

TEST_F(ImporterTest, ImportFromMissingFileThrows) {
    EXPECT_THROW(BatchImporter::import_from_file("no_such_import.txt"), ConfigurationError);
}

TEST_F(ImporterTest, StaticListConfigLoadsIntoManager) {
    auto endpoints = BatchImporter::import_from_list(
        {"user:pass@1.1.1.1:80", "socks5://2.2.2.2:1080", "[2001:db8::1]:3128"});
    auto cfg = BatchImporter::create_provider_config(endpoints, "imported", 2.5, 4);

    EXPECT_EQ(cfg.type, "static_list");
    EXPECT_EQ(*cfg.price_per_gb, 2.5);
    EXPECT_EQ(*cfg.concurrency_limit, 4);
    EXPECT_EQ(cfg.option("proxy_type"), "datacenter");
    EXPECT_EQ(cfg.option("ip_version"), "ipv4");

    Manager manager(std::vector<ProviderConfig>{cfg});
    auto    first = manager.acquire(std::string("imported"));
    EXPECT_EQ(first.host, "1.1.1.1");
    EXPECT_EQ(first.username, "user");
    EXPECT_EQ(first.password, "pass");
    EXPECT_EQ(manager.acquire(std::string("imported")).scheme, "socks5");
    EXPECT_EQ(manager.acquire(std::string("imported")).host, "2001:db8::1");
}

TEST_F(ImporterTest, MooProxyHostsBecomeMooProxyConfig) {
    auto endpoints = BatchImporter::import_from_list(
        {"us.mooproxy.net:12000:bob:secret_country-US_session-one",
         "us.mooproxy.net:12000:bob:secret_country-US_session-two"});
    auto cfg = BatchImporter::create_provider_config(endpoints, "moo");

    EXPECT_EQ(cfg.type, "mooproxy");
    EXPECT_EQ(*cfg.price_per_gb, BatchImporter::DEFAULT_PRICE_PER_GB);
    EXPECT_TRUE(cfg.unlimited());

    Providers::MooProxyProvider provider(cfg);
    auto                        ep = provider.acquire(std::nullopt, std::nullopt);
    EXPECT_EQ(ep.host, "us.mooproxy.net");
    EXPECT_EQ(*ep.session, "one");
}

TEST_F(ImporterTest, MooProxyHostWithoutCredentialsFallsBackToStaticList) {
    auto endpoints = BatchImporter::import_from_list({"us.mooproxy.net:12000"});
    auto cfg       = BatchImporter::create_provider_config(endpoints, "moo");
    EXPECT_EQ(cfg.type, "static_list");
}

TEST_F(ImporterTest, EmptyImportCannotBecomeProvider) {
    EXPECT_THROW(BatchImporter::create_provider_config({}, "empty"), ConfigurationError);
}
