#include <gtest/gtest.h>
#include "../../src/engine/frontier/frontier.hpp"

using namespace Spinner::Engine;

TEST(FrontierTest, SeedIsAdmittedAndQueued) {
    Frontier frontier("HTTP://Example.com/");
    EXPECT_TRUE(frontier.has_pending());
    EXPECT_EQ(frontier.seen_count(), 1u);
    EXPECT_TRUE(frontier.is_seen("http://example.com"));
    EXPECT_EQ(frontier.next(), "http://example.com/");
    EXPECT_FALSE(frontier.has_pending());
    EXPECT_EQ(frontier.next(), std::nullopt);
}

TEST(FrontierTest, FifoOrder) {
    Frontier frontier("http://example.com/");
    EXPECT_TRUE(frontier.add("http://example.com/a"));
    EXPECT_TRUE(frontier.add("http://example.com/b"));
    EXPECT_TRUE(frontier.add("http://example.com/c"));

    EXPECT_EQ(frontier.next(), "http://example.com/");
    EXPECT_EQ(frontier.next(), "http://example.com/a");
    EXPECT_EQ(frontier.next(), "http://example.com/b");
    EXPECT_EQ(frontier.next(), "http://example.com/c");
    EXPECT_EQ(frontier.next(), std::nullopt);
}

TEST(FrontierTest, DeduplicatesCanonicalForms) {
    Frontier frontier("http://example.com/");
    EXPECT_TRUE(frontier.add("http://example.com/a"));
    EXPECT_FALSE(frontier.add("http://example.com/a"));
    EXPECT_FALSE(frontier.add("HTTP://EXAMPLE.COM/A/"));
    EXPECT_FALSE(frontier.add("http://example.com:80/a#frag"));
    EXPECT_FALSE(frontier.add("http://example.com"));
    EXPECT_EQ(frontier.seen_count(), 2u);
    EXPECT_EQ(frontier.queue_size(), 2u);
}

TEST(FrontierTest, DedupSurvivesDequeue) {
    Frontier frontier("http://example.com/");
    ASSERT_TRUE(frontier.next());
    EXPECT_FALSE(frontier.add("http://example.com/"));
    EXPECT_FALSE(frontier.has_pending());
}

TEST(FrontierTest, DomainFilter) {
    FrontierLimits limits;
    limits.allowed_domains = std::vector<std::string>{"example.com"};
    Frontier frontier("http://example.com/", limits);

    EXPECT_FALSE(frontier.add("http://other.com/x"));
    EXPECT_TRUE(frontier.add("http://example.com/x"));
    EXPECT_FALSE(frontier.add("http://other.com/y"));
    EXPECT_TRUE(frontier.add("http://EXAMPLE.com:8080/y"));
    EXPECT_FALSE(frontier.add("http://sub.example.com/z"));
    EXPECT_FALSE(frontier.add("/relative/path"));
}

TEST(FrontierTest, DomainFilterNormalizesEntries) {
    FrontierLimits limits;
    limits.allowed_domains = std::vector<std::string>{"  Example.COM:443 "};
    Frontier frontier("https://example.com/", limits);
    EXPECT_TRUE(frontier.add("https://example.com/x"));
}

TEST(FrontierTest, SeedBypassesLimits) {
    FrontierLimits limits;
    limits.allowed_domains = std::vector<std::string>{"example.com"};
    limits.max_pages       = 0;
    Frontier frontier("http://elsewhere.org/", limits);
    EXPECT_EQ(frontier.seen_count(), 1u);
    EXPECT_TRUE(frontier.has_pending());
}

TEST(FrontierTest, ZeroCapWithholdsSeedFromNext) {
    FrontierLimits limits;
    limits.max_pages = 0;
    Frontier frontier("http://example.com/", limits);

    EXPECT_EQ(frontier.next(), std::nullopt);
    EXPECT_TRUE(frontier.has_pending());
    EXPECT_EQ(frontier.queue_size(), 1u);
}

TEST(FrontierTest, RejectsEmptyUrl) {
    Frontier frontier("http://example.com/");
    EXPECT_FALSE(frontier.add(""));
    EXPECT_FALSE(frontier.add("   "));
    EXPECT_FALSE(frontier.add("#only-fragment"));
    EXPECT_EQ(frontier.seen_count(), 1u);
    EXPECT_EQ(frontier.queue_size(), 1u);
}

TEST(FrontierTest, CapEnforcement) {
    FrontierLimits limits;
    limits.max_pages = 2;
    Frontier frontier("http://example.com/", limits);

    EXPECT_TRUE(frontier.add("http://example.com/a"));
    EXPECT_FALSE(frontier.add("http://example.com/b"));
    EXPECT_EQ(frontier.seen_count(), 2u);

    EXPECT_TRUE(frontier.next());
    EXPECT_TRUE(frontier.next());
    EXPECT_EQ(frontier.next(), std::nullopt);
}

TEST(FrontierTest, DedupCheckedBeforeCap) {
    FrontierLimits limits;
    limits.max_pages = 1;
    Frontier frontier("http://example.com/", limits);
    EXPECT_FALSE(frontier.add("http://example.com/"));
    EXPECT_FALSE(frontier.add("http://example.com/new"));
    EXPECT_FALSE(frontier.is_seen("http://example.com/new"));
}

TEST(FrontierTest, Stats) {
    Frontier frontier("http://example.com/");
    frontier.add("http://example.com/a");
    frontier.add("http://example.com/b");
    frontier.next();

    FrontierStats stats = frontier.stats();
    EXPECT_EQ(stats.total_seen, 3u);
    EXPECT_EQ(stats.queued, 2u);
    EXPECT_EQ(stats.processed, 1u);
}
