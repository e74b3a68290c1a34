#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>
#include "../../src/utils/url/link_resolver.hpp"
#include "../../src/utils/url/scope.hpp"

using namespace Spindle;
using namespace Spindle::Utils;

namespace {

Url url(const std::string& text) {
    return *Url::parse(text);
}

LinkResolver resolver_for(const std::string& seed, ScopePolicy policy = ScopePolicy::SameDomain) {
    return LinkResolver(Scope(policy, {url(seed)}));
}

}  // namespace

TEST(LinkResolverTest, ParentDirectoryReference) {
    auto resolver = resolver_for("http://x.test/");
    auto result   = resolver.resolve(url("http://x.test/a/b"), "../y");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.url.str(), "http://x.test/y");
}

TEST(LinkResolverTest, Rfc3986Examples) {
    Url base = url("http://a.test/b/c/d;p?q");
    auto resolve = [&](const std::string& raw) {
        auto result = LinkResolver::resolve_reference(base, raw);
        return result.ok() ? result.url.str() : std::string("<") + to_string(result.error) + ">";
    };

    EXPECT_EQ(resolve("g"), "http://a.test/b/c/g");
    EXPECT_EQ(resolve("./g"), "http://a.test/b/c/g");
    EXPECT_EQ(resolve("g/"), "http://a.test/b/c/g/");
    EXPECT_EQ(resolve("/g"), "http://a.test/g");
    EXPECT_EQ(resolve("//g.test"), "http://g.test/");
    EXPECT_EQ(resolve("?y"), "http://a.test/b/c/d;p?y");
    EXPECT_EQ(resolve("g?y"), "http://a.test/b/c/g?y");
    EXPECT_EQ(resolve("#s"), "http://a.test/b/c/d;p?q");
    EXPECT_EQ(resolve("g#s"), "http://a.test/b/c/g");
    EXPECT_EQ(resolve(""), "http://a.test/b/c/d;p?q");
    EXPECT_EQ(resolve("."), "http://a.test/b/c/");
    EXPECT_EQ(resolve(".."), "http://a.test/b/");
    EXPECT_EQ(resolve("../g"), "http://a.test/b/g");
    EXPECT_EQ(resolve("../../../g"), "http://a.test/g");
    EXPECT_EQ(resolve("https://Other.test:443/x"), "https://other.test/x");
}

TEST(LinkResolverTest, UnsupportedSchemes) {
    Url base = url("http://x.test/");
    for (const auto& raw : {"mailto:a@x.test", "javascript:void(0)", "ftp://x.test/file",
                            "tel:+123456", "data:text/plain,hi"}) {
        auto result = LinkResolver::resolve_reference(base, raw);
        EXPECT_EQ(result.error, LinkError::Unsupported) << raw;
    }
}

TEST(LinkResolverTest, MalformedReferences) {
    Url base = url("http://x.test/");
    for (const std::string& raw : {std::string("http://"), std::string("http:no-authority"),
                                   std::string("//bad host/"), std::string("http://x.test:70000/"),
                                   std::string(9000, 'a')}) {
        auto result = LinkResolver::resolve_reference(base, raw);
        EXPECT_EQ(result.error, LinkError::Malformed) << raw;
    }
}

TEST(LinkResolverTest, ScopePolicies) {
    Url base = url("http://www.x.test/");

    auto domain = resolver_for("http://www.x.test/", ScopePolicy::SameDomain);
    EXPECT_TRUE(domain.resolve(base, "http://blog.x.test/").ok());
    EXPECT_EQ(domain.resolve(base, "http://y.test/").error, LinkError::OutOfScope);

    auto host = resolver_for("http://www.x.test/", ScopePolicy::SameHost);
    EXPECT_TRUE(host.resolve(base, "/a").ok());
    EXPECT_EQ(host.resolve(base, "http://blog.x.test/").error, LinkError::OutOfScope);

    auto any = resolver_for("http://www.x.test/", ScopePolicy::Any);
    EXPECT_TRUE(any.resolve(base, "https://elsewhere.example/").ok());
}

TEST(LinkResolverTest, CustomPredicateOverridesPolicy) {
    Scope scope(ScopePolicy::SameHost, {url("http://x.test/")},
                [](const Url& u) { return u.path().rfind("/docs/", 0) == 0; });
    LinkResolver resolver(scope);
    Url          base = url("http://x.test/docs/index");

    EXPECT_TRUE(resolver.resolve(base, "intro").ok());
    EXPECT_TRUE(resolver.resolve(base, "http://other.test/docs/a").ok());
    EXPECT_EQ(resolver.resolve(base, "/blog/").error, LinkError::OutOfScope);
}

TEST(LinkResolverTest, ResolutionIsIdempotent) {
    auto resolver = LinkResolver(Scope::unrestricted());
    Url  base     = url("http://x.test/a/b/");
    for (const auto& raw : {"../c/./d", "e f", "%7efoo", "?q=1", "//X.TEST:80/g/..", "h#frag",
                            "https://x.test/a%2fb", "http://a.test./p", "//a.test./p"}) {
        auto first = resolver.resolve(base, raw);
        ASSERT_TRUE(first.ok()) << raw;
        auto again = resolver.resolve(first.url, first.url.str());
        ASSERT_TRUE(again.ok()) << raw;
        EXPECT_EQ(first.url, again.url) << raw;
    }

    EXPECT_EQ(resolver.resolve(base, "http://a.test../p").error, LinkError::Malformed);
    EXPECT_EQ(resolver.resolve(base, "//a.test../p").error, LinkError::Malformed);
}

TEST(LinkResolverTest, GeneratedReferencesResolveIdempotently) {
    // Fragments chosen to hit host dots, escapes, dot segments, ports,
    // brackets, whitespace and non-ASCII bytes in random combinations.
    const std::vector<std::string> pieces = {
        "http:", "https:", "//", "/", "a", "B", ".", "..", "./", "../", ":", ":80", ":8080",
        "?", "#", "@", "%", "%2", "%2e", "%7E", "%zz", " ", "\t", "\n", "[", "]", "::1",
        "x.test", "x.test.", "\x80", "\xff", "\xc3\xa9", "-", "_", "~", "=", "&", "\x7f"};

    auto         resolver = LinkResolver(Scope::unrestricted());
    Url          base     = url("http://x.test/a/b/?q");
    std::mt19937 rng(20261019);
    std::uniform_int_distribution<size_t> pick(0, pieces.size() - 1);
    std::uniform_int_distribution<int>    length(1, 12);

    int accepted = 0;
    for (int i = 0; i < 20000; ++i) {
        std::string raw;
        for (int n = length(rng); n > 0; --n)
            raw += pieces[pick(rng)];

        auto first = resolver.resolve(base, raw);
        if (!first.ok())
            continue;
        ++accepted;

        for (unsigned char c : first.url.str())
            ASSERT_TRUE(c > 0x20 && c < 0x7F) << first.url.str();

        auto again = resolver.resolve(first.url, first.url.str());
        ASSERT_TRUE(again.ok()) << raw;
        ASSERT_EQ(first.url, again.url) << raw;

        auto reparsed = Url::parse(first.url.str());
        ASSERT_TRUE(reparsed) << raw;
        ASSERT_EQ(*reparsed, first.url) << raw;
    }
    EXPECT_GT(accepted, 1000);
}
