#include "url_utils.h"

#include <gtest/gtest.h>

TEST(UrlUtilsTest, RecognizesAddresses)
{
    EXPECT_TRUE(url::isUrl("example.com"));
    EXPECT_TRUE(url::isUrl("https://news.ycombinator.com/item?id=1"));
    EXPECT_TRUE(url::isUrl("http://localhost.localdomain"));
    EXPECT_TRUE(url::isUrl("sub-domain.example.co.uk/path"));
    EXPECT_TRUE(url::isUrl("browser://settings"));
    EXPECT_TRUE(url::isUrl("my site.io"));

    EXPECT_FALSE(url::isUrl("funny cats"));
    EXPECT_FALSE(url::isUrl("localhost"));
    EXPECT_FALSE(url::isUrl("what is 3 . 5"));
}

TEST(UrlUtilsTest, EnsureSchemeOnlyAddsWhenMissing)
{
    EXPECT_EQ(url::ensureScheme("example.com"), "https://example.com");
    EXPECT_EQ(url::ensureScheme("http://example.com"), "http://example.com");
    EXPECT_EQ(url::ensureScheme("https://example.com"), "https://example.com");
    EXPECT_EQ(url::ensureScheme("browser://settings"), "browser://settings");
}

TEST(UrlUtilsTest, EncodeUriComponentKeepsUnreservedCharacters)
{
    EXPECT_EQ(url::encodeUriComponent("AZaz09-_.!~*'()"), "AZaz09-_.!~*'()");
    EXPECT_EQ(url::encodeUriComponent("a b&c=d/e?"), "a%20b%26c%3Dd%2Fe%3F");
    EXPECT_EQ(url::encodeUriComponent("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(UrlUtilsTest, ResolveNavigationTarget)
{
    const std::string prefix = url::DEFAULT_SEARCH_PREFIX;

    EXPECT_EQ(url::resolveNavigationTarget("  example.com ", prefix), "https://example.com");
    EXPECT_EQ(url::resolveNavigationTarget("cats", prefix), prefix + "cats");
    EXPECT_EQ(url::resolveNavigationTarget("c++ tips", prefix), prefix + "c%2B%2B%20tips");
    EXPECT_EQ(url::resolveNavigationTarget("   ", prefix), "");
    EXPECT_EQ(url::resolveNavigationTarget("", prefix), "");
}
