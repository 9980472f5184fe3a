// ═══════════════════════════════════════════════════════════════════
//  test_validator.cpp — URL acceptance rules
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <shorturl/validator.h>

using namespace shorturl;

TEST(ValidatorTest, RejectsEmptyString) {
    EXPECT_FALSE(validator::isValid(""));
}

TEST(ValidatorTest, RejectsPlainWords) {
    EXPECT_FALSE(validator::isValid("not a url"));
}

TEST(ValidatorTest, RejectsSchemeWithoutHost) {
    EXPECT_FALSE(validator::isValid("http://"));
    EXPECT_FALSE(validator::isValid("https://"));
}

TEST(ValidatorTest, RejectsFtp) {
    // Prefixed to http://ftp://example.com, whose host is "ftp"
    EXPECT_FALSE(validator::isValid("ftp://example.com"));
}

TEST(ValidatorTest, AcceptsHttpsUrl) {
    EXPECT_TRUE(validator::isValid("https://example.com"));
}

TEST(ValidatorTest, AcceptsBareDomain) {
    EXPECT_TRUE(validator::isValid("freecodecamp.org"));
    EXPECT_EQ(validator::normalize("freecodecamp.org"), "http://freecodecamp.org");
}

TEST(ValidatorTest, RejectsHostWithoutDot) {
    EXPECT_FALSE(validator::isValid("http://localhost"));
    EXPECT_FALSE(validator::isValid("http://localhost:3000/api"));
}

TEST(ValidatorTest, AcceptsPathQueryAndPort) {
    EXPECT_TRUE(validator::isValid("https://www.example.com:8443/a/b?c=d#top"));
}

TEST(ValidatorTest, RejectsBadPort) {
    EXPECT_FALSE(validator::isValid("http://example.com:99999"));
    EXPECT_FALSE(validator::isValid("http://example.com:80a"));
}

TEST(ValidatorTest, RejectsMalformedIpv4) {
    EXPECT_TRUE(validator::isValid("http://192.168.1.10"));
    EXPECT_FALSE(validator::isValid("http://192.168.1.300"));
}

TEST(ValidatorTest, NormalizeLeavesHttpPrefixedInputAlone) {
    EXPECT_EQ(validator::normalize("https://example.com"), "https://example.com");
    EXPECT_EQ(validator::normalize("httpbin.org"), "httpbin.org");
    EXPECT_EQ(validator::normalize("example.com/x"), "http://example.com/x");
}

TEST(ValidatorTest, HttpPrefixedWithoutSchemeIsRejected) {
    // Starts with "http" so it is not prefixed, and has no scheme
    EXPECT_FALSE(validator::isValid("httpbin.org"));
}

TEST(ValidatorTest, ParseSplitsComponents) {
    auto url = validator::parse("HTTPS://User@Example.COM:8080/path/x?q=1#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->path, "/path/x");
    EXPECT_EQ(url->query, "?q=1");
    EXPECT_EQ(url->fragment, "#frag");
}

TEST(ValidatorTest, ParseDefaultsPathForHttp) {
    auto url = validator::parse("http://example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/");
    EXPECT_TRUE(url->port.empty());
}

TEST(ValidatorTest, ParseRejectsMissingScheme) {
    EXPECT_FALSE(validator::parse("example.com").has_value());
    EXPECT_FALSE(validator::parse("://example.com").has_value());
}

TEST(ValidatorTest, ParseKeepsNonHttpSchemes) {
    auto url = validator::parse("mailto:someone@example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "mailto");
    EXPECT_TRUE(url->host.empty());
}

TEST(ValidatorTest, ProbeHostStripsLeadingWww) {
    EXPECT_EQ(validator::probeHost("https://www.freecodecamp.org/news"), "freecodecamp.org");
    EXPECT_EQ(validator::probeHost("http://docs.example.com"), "docs.example.com");
    EXPECT_FALSE(validator::probeHost("http://").has_value());
}

TEST(ValidatorTest, ShortAndRadixIpv4Forms) {
    auto shortForm = validator::parse("http://1.2.3/");
    ASSERT_TRUE(shortForm.has_value());
    EXPECT_EQ(shortForm->host, "1.2.0.3");

    auto hexForm = validator::parse("http://0x7f.1");
    ASSERT_TRUE(hexForm.has_value());
    EXPECT_EQ(hexForm->host, "127.0.0.1");

    auto octalForm = validator::parse("http://0300.0250.01.012");
    ASSERT_TRUE(octalForm.has_value());
    EXPECT_EQ(octalForm->host, "192.168.1.10");

    auto single = validator::parse("http://2130706433");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->host, "127.0.0.1");

    EXPECT_TRUE(validator::isValid("http://1.2.3"));
}

TEST(ValidatorTest, OutOfRangeIpv4FormsAreRejected) {
    EXPECT_FALSE(validator::parse("http://256.1.1.1").has_value());
    EXPECT_FALSE(validator::parse("http://1.2.65536").has_value());
    EXPECT_FALSE(validator::parse("http://1.2.3.4.5").has_value());
    EXPECT_FALSE(validator::parse("http://1.2.3.09").has_value());
    EXPECT_FALSE(validator::parse("http://4294967296").has_value());
}

TEST(ValidatorTest, DomainsWithDigitsAreNotIpv4) {
    auto url = validator::parse("http://web2.example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "web2.example.com");
    EXPECT_TRUE(validator::isValid("http://123.example.com"));
}

TEST(ValidatorTest, TabAndNewlinesAreDropped) {
    auto url = validator::parse("https://exa\tmple.com/a\r\nb");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->path, "/ab");
    EXPECT_TRUE(validator::isValid("https://example.com/a\r\nSet-Cookie: x"));
}
