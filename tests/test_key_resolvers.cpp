#include <gtest/gtest.h>
#include "resolvers/composite_key_resolver.hpp"
#include "resolvers/header_key_resolver.hpp"
#include "resolvers/ip_key_resolver.hpp"
#include "resolvers/user_key_resolver.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace turnstile;
using turnstile::testing::make_request;

namespace {

class FixedKeyResolver : public KeyResolver {
public:
    explicit FixedKeyResolver(std::string key) : key_(std::move(key)) {}
    std::string resolve(const ClientRequest&) const override { return key_; }
    std::string name() const override { return "fixed"; }

private:
    std::string key_;
};

}

// --- IP ---

TEST(IpKeyResolverTest, UsesFirstForwardedAddress) {
    auto req = make_request("/", {{"X-Forwarded-For", "93.184.216.34, 10.0.0.1"}});
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "10.0.0.2")), "ip:93.184.216.34");
}

TEST(IpKeyResolverTest, IgnoresPrivateForwardedValues) {
    auto req = make_request("/", {
        {"X-Forwarded-For", "10.1.2.3"},
        {"X-Real-IP", "127.0.0.1"},
        {"CF-Connecting-IP", "1.1.1.1"}
    });
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "192.168.1.10")), "ip:1.1.1.1");

    auto spoofed = make_request("/", {{"X-Forwarded-For", "192.168.0.1"}});
    EXPECT_EQ(resolver.resolve(ClientRequest(spoofed, "192.168.1.10")), "ip:192.168.1.10");
}

TEST(IpKeyResolverTest, RejectsGarbageHeaders) {
    auto req = make_request("/", {{"X-Forwarded-For", "not-an-ip"}, {"X-Real-IP", "999.1.1.1"}});
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "8.8.4.4")), "ip:8.8.4.4");
}

TEST(IpKeyResolverTest, FallsBackToUnknown) {
    auto req = make_request();
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "")), "unknown");
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "garbage")), "unknown");
}

TEST(IpKeyResolverTest, CanonicalizesIpv6) {
    auto req = make_request();
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "2001:0DB8:0000:0000:0000:0000:0000:0001")), "ip:2001:db8::1");
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "::ffff:93.184.216.34")), "ip:93.184.216.34");
}

TEST(IpKeyResolverTest, AcceptsBracketsAndPorts) {
    auto req = make_request("/", {{"X-Forwarded-For", "93.184.216.34:443"}});
    IpKeyResolver resolver;
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "")), "ip:93.184.216.34");

    auto v6 = make_request("/", {{"X-Real-IP", "[2606:4700:4700::1111]:443"}});
    EXPECT_EQ(resolver.resolve(ClientRequest(v6, "")), "ip:2606:4700:4700::1111");
}

TEST(IpKeyResolverTest, SubnetAggregation) {
    IpResolverOptions opts;
    opts.ipv4_prefix = 24;
    opts.ipv6_prefix = 64;
    IpKeyResolver resolver(opts);

    auto req = make_request();
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "93.184.216.34")), "ip:93.184.216.0");
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "2606:4700:4700:12:aaaa::1111")), "ip:2606:4700:4700:12::");
}

TEST(IpKeyResolverTest, PublicRangeClassification) {
    auto is_pub = [](const char* text) {
        return IpKeyResolver::is_public(*IpKeyResolver::parse_address(text));
    };
    EXPECT_TRUE(is_pub("93.184.216.34"));
    EXPECT_TRUE(is_pub("2606:4700:4700::1111"));
    EXPECT_FALSE(is_pub("10.0.0.1"));
    EXPECT_FALSE(is_pub("172.20.0.1"));
    EXPECT_FALSE(is_pub("100.64.0.1"));
    EXPECT_FALSE(is_pub("169.254.1.1"));
    EXPECT_FALSE(is_pub("224.0.0.1"));
    EXPECT_FALSE(is_pub("::1"));
    EXPECT_FALSE(is_pub("fe80::1"));
    EXPECT_FALSE(is_pub("fd00::1"));
    EXPECT_FALSE(is_pub("::ffff:192.168.1.1"));
}

TEST(IpKeyResolverTest, RejectsBadPrefixes) {
    IpResolverOptions opts;
    opts.ipv4_prefix = 33;
    EXPECT_THROW(IpKeyResolver{opts}, ConfigError);
}

// --- User ---

TEST(UserKeyResolverTest, FallbackChain) {
    UserKeyResolver resolver(nullptr, "session_id");

    auto req = make_request("/", {{"Cookie", "theme=dark; session_id=abc123"}});
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "93.184.216.34", std::string("42"))), "user:42");
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "93.184.216.34")), "session:abc123");

    auto anon = make_request();
    EXPECT_EQ(resolver.resolve(ClientRequest(anon, "93.184.216.34")), "ip:93.184.216.34");
}

TEST(UserKeyResolverTest, InjectedLookup) {
    UserKeyResolver resolver([](const ClientRequest& r) -> std::optional<std::string> {
        auto token = r.header("X-Test-User");
        return token;
    }, "session_id");

    auto req = make_request("/", {{"X-Test-User", "7"}});
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "1.1.1.1")), "user:7");
}

TEST(UserKeyResolverTest, ThrowingLookupMeansAnonymous) {
    UserKeyResolver resolver([](const ClientRequest&) -> std::optional<std::string> {
        throw std::runtime_error("auth backend down");
    }, "sid");

    auto req = make_request("/", {{"Cookie", "sid=s1"}});
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "1.1.1.1")), "session:s1");
}

// --- Header ---

TEST(HeaderKeyResolverTest, HashesTokenWithSalt) {
    HeaderKeyResolver resolver("X-API-Key", "salt-a");
    auto req = make_request("/", {{"X-API-Key", "secret-token"}});

    std::string key = resolver.resolve(ClientRequest(req, "1.1.1.1"));
    ASSERT_EQ(key.rfind("header:", 0), 0u);
    EXPECT_EQ(key.size(), std::string("header:").size() + 64);
    EXPECT_EQ(key.find("secret-token"), std::string::npos);
    EXPECT_EQ(key, resolver.resolve(ClientRequest(req, "2.2.2.2")));

    HeaderKeyResolver other_salt("X-API-Key", "salt-b");
    EXPECT_NE(key, other_salt.resolve(ClientRequest(req, "1.1.1.1")));
}

TEST(HeaderKeyResolverTest, BearerFallbackMatchesPrimaryHeader) {
    HeaderKeyResolver resolver("X-API-Key", "salt", {"Authorization", "X-Auth-Token", "X-Client-ID"});

    auto primary = make_request("/", {{"X-API-Key", "tok"}});
    auto bearer = make_request("/", {{"Authorization", "bearer   tok"}});
    auto client_id = make_request("/", {{"X-Client-ID", " tok "}});

    const std::string expected = resolver.resolve(ClientRequest(primary, "1.1.1.1"));
    EXPECT_EQ(resolver.resolve(ClientRequest(bearer, "1.1.1.1")), expected);
    EXPECT_EQ(resolver.resolve(ClientRequest(client_id, "1.1.1.1")), expected);
    EXPECT_EQ(expected, "header:" + resolver.fingerprint("tok"));
}

TEST(HeaderKeyResolverTest, NoTokenFallsBackToIp) {
    HeaderKeyResolver resolver("X-API-Key", "salt");
    auto req = make_request("/", {{"X-API-Key", "   "}});
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "93.184.216.34")), "ip:93.184.216.34");
}

// --- Composite ---

TEST(CompositeKeyResolverTest, JoinsChildrenInOrder) {
    ResolverDeps deps;
    RateLimitConfig cfg(10, 60, StrategyKind::Fixed, IdentifierKind::Composite);
    auto resolver = make_resolver(cfg, deps);

    auto req = make_request();
    EXPECT_EQ(resolver->resolve(ClientRequest(req, "93.184.216.34", std::string("1"))),
              "composite:ip:93.184.216.34|user:1");
    EXPECT_NE(resolver->resolve(ClientRequest(req, "93.184.216.34", std::string("2"))),
              resolver->resolve(ClientRequest(req, "93.184.216.34", std::string("1"))));
    EXPECT_EQ(resolver->name(), "ip+user");
}

TEST(CompositeKeyResolverTest, EscapesSeparator) {
    std::vector<std::unique_ptr<KeyResolver>> children;
    children.push_back(std::make_unique<FixedKeyResolver>("a|b"));
    children.push_back(std::make_unique<FixedKeyResolver>("c%"));
    CompositeKeyResolver resolver(std::move(children));

    auto req = make_request();
    EXPECT_EQ(resolver.resolve(ClientRequest(req, "")), "composite:a%7Cb|c%25");
}

TEST(CompositeKeyResolverTest, NeedsTwoChildren) {
    std::vector<std::unique_ptr<KeyResolver>> one;
    one.push_back(std::make_unique<FixedKeyResolver>("a"));
    EXPECT_THROW(CompositeKeyResolver{std::move(one)}, ConfigError);
}

TEST(KeyResolverFactoryTest, BuildsEachKind) {
    ResolverDeps deps;
    EXPECT_EQ(make_resolver(RateLimitConfig(1, 60, StrategyKind::Fixed, IdentifierKind::Ip), deps)->name(), "ip");
    EXPECT_EQ(make_resolver(RateLimitConfig(1, 60, StrategyKind::Fixed, IdentifierKind::User), deps)->name(), "user");
    EXPECT_EQ(make_resolver(RateLimitConfig(1, 60, StrategyKind::Fixed, IdentifierKind::Header), deps)->name(), "header");
}

// --- Request view ---

TEST(ClientRequestTest, CookiesAcrossFields) {
    auto req = make_request("/", {{"Cookie", "a=1"}, {"Accept", "*/*"}, {"Cookie", "b=\"two\""}});
    ClientRequest request(req, "1.1.1.1");
    EXPECT_EQ(request.cookie("a").value_or(""), "1");
    EXPECT_EQ(request.cookie("b").value_or(""), "two");
    EXPECT_FALSE(request.cookie("c").has_value());
    EXPECT_EQ(request.header("accept").value_or(""), "*/*");
}
