#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Spinner::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"spinner", (char*)"https://test.com"};
    auto  config = Config::parse(2, argv);

    ASSERT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.urls[0], "https://test.com");
    EXPECT_EQ(config.max_pages, 100);
    EXPECT_TRUE(config.allowed_domains.empty());
    EXPECT_FALSE(config.same_domain);
    EXPECT_EQ(config.output_dir, "crawl_output");
    EXPECT_EQ(config.output_file, "crawl.jsonl");
    EXPECT_EQ(config.format, "jsonl");
    EXPECT_FALSE(config.include_html);
    EXPECT_EQ(config.timeout, 10);
    EXPECT_EQ(config.user_agent, "Spinner/0.1.0");
    EXPECT_EQ(config.log_level(), LOG_DEFAULT);
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"spinner",
                    (char*)"https://test.com",
                    (char*)"example.org",
                    (char*)"--max-pages",
                    (char*)"0",
                    (char*)"-a",
                    (char*)"test.com",
                    (char*)"--allow-domain",
                    (char*)"example.org",
                    (char*)"--format",
                    (char*)"json",
                    (char*)"--include-html",
                    (char*)"-t",
                    (char*)"3",
                    (char*)"-v"};
    auto  config = Config::parse(15, argv);

    ASSERT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.urls[1], "http://example.org");
    EXPECT_EQ(config.max_pages, 0);
    ASSERT_EQ(config.allowed_domains.size(), 2u);
    EXPECT_EQ(config.allowed_domains[1], "example.org");
    EXPECT_EQ(config.format, "json");
    EXPECT_EQ(config.output_file, "crawl.json");
    EXPECT_TRUE(config.include_html);
    EXPECT_EQ(config.timeout, 3);
    EXPECT_EQ(config.log_level(), LOG_ALL);
}

TEST(ConfigTest, QuietLogLevel) {
    char* argv[] = {(char*)"spinner", (char*)"-q", (char*)"http://a.com"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.log_level(), LOG_WARN | LOG_ERROR);
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        max_pages: 25
        same_domain: true
        output: "custom_output"
        output_file: "pages.jsonl"
        include_html: true
        timeout: 5
        user_agent: "TestAgent/1.0"
        urls:
          - "http://yaml1.com"
          - "yaml2.com"
        allowed_domains:
          - "yaml1.com"
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"spinner", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.max_pages, 25);
    EXPECT_TRUE(config.same_domain);
    EXPECT_EQ(config.output_dir, "custom_output");
    EXPECT_EQ(config.output_file, "pages.jsonl");
    EXPECT_TRUE(config.include_html);
    EXPECT_EQ(config.timeout, 5);
    EXPECT_EQ(config.user_agent, "TestAgent/1.0");
    ASSERT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.urls[1], "http://yaml2.com");
    ASSERT_EQ(config.allowed_domains.size(), 1u);

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "max_pages: 20\ntimeout: 7\nurls:\n  - http://from-yaml.com\n";
    ofs.close();

    char* argv[] = {(char*)"spinner",
                    (char*)"--config",
                    (char*)"test_ovr.yaml",
                    (char*)"--max-pages",
                    (char*)"30",
                    (char*)"http://from-cli.com"};
    auto  config = Config::parse(6, argv);

    EXPECT_EQ(config.max_pages, 30);
    EXPECT_EQ(config.timeout, 7);
    ASSERT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.urls[0], "http://from-yaml.com");
    EXPECT_EQ(config.urls[1], "http://from-cli.com");

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, InvalidYamlThrows) {
    std::ofstream ofs("test_bad.yaml");
    ofs << "max_pages: [unclosed";
    ofs.close();

    char* argv[] = {(char*)"spinner", (char*)"--config", (char*)"test_bad.yaml"};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);

    std::remove("test_bad.yaml");
}

TEST(ConfigTest, MissingYamlThrows) {
    char* argv[] = {(char*)"spinner", (char*)"--config", (char*)"does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);
}

TEST(ConfigTest, YamlValuesAreValidated) {
    std::ofstream ofs("test_invalid.yaml");
    ofs << "format: xml\n";
    ofs.close();

    char* argv[] = {(char*)"spinner", (char*)"--config", (char*)"test_invalid.yaml"};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);

    std::remove("test_invalid.yaml");
}

TEST(ConfigTest, SeedsAreTrimmed) {
    char* argv[] = {(char*)"spinner", (char*)" https://a.com "};
    auto  config = Config::parse(2, argv);
    ASSERT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.urls[0], "https://a.com");
}

TEST(ConfigTest, BlankSeedIsRejected) {
    char* argv[] = {(char*)"spinner", (char*)"  ", (char*)" https://a.com "};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);
}

TEST(ConfigTest, BlankYamlSeedIsRejected) {
    std::ofstream ofs("test_blank_seed.yaml");
    ofs << "urls:\n  - \"   \"\n";
    ofs.close();

    char* argv[] = {(char*)"spinner", (char*)"--config", (char*)"test_blank_seed.yaml"};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);

    std::remove("test_blank_seed.yaml");
}
