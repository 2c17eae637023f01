#include "net/target.hpp"
#include "net/tcp_connect.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace net = reconkit::net;

TEST_CASE("ExpandTemplate replaces every placeholder", "[net][target]") {
  REQUIRE(net::ExpandTemplate("https://github.com/{}", "alice") == "https://github.com/alice");
  REQUIRE(net::ExpandTemplate("https://{}.tumblr.com/{}", "bob") ==
          "https://bob.tumblr.com/bob");
  REQUIRE(net::ExpandTemplate("https://static.example/", "x") == "https://static.example/");
}

TEST_CASE("NormalizeHttpUrl adds http scheme only when missing", "[net][target]") {
  std::string url;
  bool added = false;
  std::string error;

  REQUIRE(net::NormalizeHttpUrl("example.com", url, added, error));
  REQUIRE(url == "http://example.com");
  REQUIRE(added);

  REQUIRE(net::NormalizeHttpUrl("  https://example.com/app  ", url, added, error));
  REQUIRE(url == "https://example.com/app");
  REQUIRE_FALSE(added);

  REQUIRE_FALSE(net::NormalizeHttpUrl("", url, added, error));
  REQUIRE(error.find("empty") != std::string::npos);

  REQUIRE_FALSE(net::NormalizeHttpUrl("ftp://example.com", url, added, error));
  REQUIRE(error.find("scheme") != std::string::npos);
}

TEST_CASE("ExtractHost strips IPv6 brackets", "[net][target]") {
  std::string host;
  std::string error;
  REQUIRE(net::ExtractHost("http://example.com:8080/x", host, error));
  REQUIRE(host == "example.com");
  REQUIRE(net::ExtractHost("http://[::1]:8080/", host, error));
  REQUIRE(host == "::1");
}

TEST_CASE("ResolveUrlReference follows relative reference rules", "[net][target]") {
  std::string resolved;
  std::string error;

  REQUIRE(net::ResolveUrlReference("http://example.com", "admin", resolved, error));
  REQUIRE(resolved == "http://example.com/admin");

  REQUIRE(net::ResolveUrlReference("http://example.com/app/index", "admin", resolved, error));
  REQUIRE(resolved == "http://example.com/app/admin");

  REQUIRE(net::ResolveUrlReference("http://example.com/app/", "/robots.txt", resolved, error));
  REQUIRE(resolved == "http://example.com/robots.txt");

  REQUIRE_FALSE(net::ResolveUrlReference("not a url", "admin", resolved, error));
}

TEST_CASE("ValidateUsername rejects URL-altering input", "[net][target]") {
  std::string error;
  REQUIRE(net::ValidateUsername("john_doe-99.x", error));
  REQUIRE_FALSE(net::ValidateUsername("", error));
  REQUIRE_FALSE(net::ValidateUsername("   ", error));
  REQUIRE_FALSE(net::ValidateUsername(" alice", error));
  REQUIRE_FALSE(net::ValidateUsername("a b", error));
  REQUIRE_FALSE(net::ValidateUsername("../etc", error));
  REQUIRE_FALSE(net::ValidateUsername("a?b=1", error));
  REQUIRE_FALSE(net::ValidateUsername("a#frag", error));
  REQUIRE_FALSE(net::ValidateUsername("a%2f", error));
}

TEST_CASE("NormalizeHostTarget accepts hosts, addresses and URLs", "[net][target]") {
  std::string host;
  std::string error;
  REQUIRE(net::NormalizeHostTarget("example.com", host, error));
  REQUIRE(host == "example.com");
  REQUIRE(net::NormalizeHostTarget("10.0.0.1", host, error));
  REQUIRE(host == "10.0.0.1");
  REQUIRE(net::NormalizeHostTarget("https://example.com/login", host, error));
  REQUIRE(host == "example.com");
  REQUIRE_FALSE(net::NormalizeHostTarget("", host, error));
  REQUIRE_FALSE(net::NormalizeHostTarget("bad host", host, error));
  REQUIRE_FALSE(net::NormalizeHostTarget("example.com/path", host, error));
}

TEST_CASE("SanitizeBanner keeps the first printable line", "[net][banner]") {
  REQUIRE(net::SanitizeBanner("SSH-2.0-OpenSSH_9.6\r\nextra") == "SSH-2.0-OpenSSH_9.6");
  REQUIRE(net::SanitizeBanner("\r\n  220 mail ready \x01\r\n") == "220 mail ready");
  REQUIRE(net::SanitizeBanner(std::string(300, 'a')).size() == 200U);
  REQUIRE(net::SanitizeBanner("").empty());
}

TEST_CASE("BannerProbeFor speaks first only where services wait", "[net][banner]") {
  REQUIRE(net::BannerProbeFor(80).find("HEAD / HTTP/1.0") == 0U);
  REQUIRE(net::BannerProbeFor(443).find("HEAD") == 0U);
  REQUIRE(net::BannerProbeFor(22).find("SSH-2.0") == 0U);
  REQUIRE(net::BannerProbeFor(21).empty());
  REQUIRE(net::BannerProbeFor(25).empty());
}
