#include "probe/classifier.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <utility>

namespace probe = reconkit::probe;
namespace net = reconkit::net;

namespace {

probe::ProbeOutcome HttpOutcome(long status, std::string body) {
  probe::ProbeOutcome outcome;
  outcome.outcome = probe::OutcomeKind::kSuccessWithBody;
  outcome.failure = probe::FailureCategory::kNone;
  outcome.status_code = status;
  outcome.body_bytes = body.size();
  outcome.body = std::move(body);
  return outcome;
}

probe::ProbeOutcome StatusOnlyOutcome(long status) {
  probe::ProbeOutcome outcome;
  outcome.outcome = probe::OutcomeKind::kSuccessWithStatusOnly;
  outcome.failure = probe::FailureCategory::kNone;
  outcome.status_code = status;
  return outcome;
}

probe::ProbeOutcome Failure(net::TransportFailure failure) {
  return probe::MakeFailureOutcome(failure, "endpoint", "scripted");
}

probe::ProbeSpec GithubSpec() {
  return probe::MakeHttpExistenceSpec("GitHub", "https://github.com/{}",
                                      {"Page not found", "Not Found"});
}

} // namespace

TEST_CASE("http existence is present only on 200 without absence marker",
          "[probe][classifier]") {
  const probe::ProbeSpec spec = GithubSpec();

  const probe::Verdict found = probe::Classify(spec, HttpOutcome(200, "<html>profile</html>"));
  REQUIRE(found.state == probe::VerdictState::kPresent);
  REQUIRE(found.spec_id == "GitHub");
  REQUIRE(found.kind == probe::ProbeKind::kHttpExistence);

  const probe::Verdict marked =
      probe::Classify(spec, HttpOutcome(200, "<h1>page NOT found</h1>"));
  REQUIRE(marked.state == probe::VerdictState::kAbsent);
  REQUIRE(marked.reason.find("Page not found") != std::string::npos);

  REQUIRE(probe::Classify(spec, HttpOutcome(404, "")).state == probe::VerdictState::kAbsent);
  REQUIRE(probe::Classify(spec, HttpOutcome(500, "")).state == probe::VerdictState::kAbsent);
}

TEST_CASE("http existence transport failures are indeterminate", "[probe][classifier]") {
  const probe::ProbeSpec spec = GithubSpec();
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTimeout)).state ==
          probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kDnsResolution)).state ==
          probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kConnectionRefused)).state ==
          probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTransport)).state ==
          probe::VerdictState::kIndeterminate);
}

TEST_CASE("absence marker match is case-insensitive and order-independent",
          "[probe][classifier]") {
  const std::string body = "Sorry, this PAGE isn't available.";
  const auto forward = probe::FindAbsenceMarker(body, {"page isn't available", "missing"});
  const auto reverse = probe::FindAbsenceMarker(body, {"missing", "page isn't available"});
  REQUIRE(forward.has_value());
  REQUIRE(reverse.has_value());
  REQUIRE_FALSE(probe::FindAbsenceMarker(body, {}).has_value());
  REQUIRE_FALSE(probe::FindAbsenceMarker("", {"missing"}).has_value());
}

TEST_CASE("tcp connect maps refusal and timeout to absent", "[probe][classifier]") {
  const probe::ProbeSpec spec = probe::MakeTcpConnectSpec(443);
  REQUIRE(spec.id == "443/tcp");

  probe::ProbeOutcome open;
  open.outcome = probe::OutcomeKind::kConnectSuccess;
  open.failure = probe::FailureCategory::kNone;
  REQUIRE(probe::Classify(spec, open).state == probe::VerdictState::kPresent);

  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kConnectionRefused)).state ==
          probe::VerdictState::kAbsent);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTimeout)).state ==
          probe::VerdictState::kAbsent);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTransport)).state ==
          probe::VerdictState::kAbsent);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kDnsResolution)).state ==
          probe::VerdictState::kIndeterminate);
}

TEST_CASE("header fetch is present on any response", "[probe][classifier]") {
  const probe::ProbeSpec spec =
      probe::MakeHeaderFetchSpec("web", "http://{}", std::string("https://{}"), false);
  REQUIRE(probe::Classify(spec, StatusOnlyOutcome(200)).state == probe::VerdictState::kPresent);
  REQUIRE(probe::Classify(spec, StatusOnlyOutcome(503)).state == probe::VerdictState::kPresent);
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTimeout)).state ==
          probe::VerdictState::kIndeterminate);
}

TEST_CASE("path probe hits are 200, 301, 302 and 403", "[probe][classifier]") {
  const probe::ProbeSpec spec = probe::MakePathProbeSpec("admin");
  for (const long status : {200L, 301L, 302L, 403L}) {
    REQUIRE(probe::Classify(spec, StatusOnlyOutcome(status)).state ==
            probe::VerdictState::kPresent);
  }
  for (const long status : {204L, 401L, 404L, 500L}) {
    REQUIRE(probe::Classify(spec, StatusOnlyOutcome(status)).state ==
            probe::VerdictState::kAbsent);
  }
  REQUIRE(probe::Classify(spec, Failure(net::TransportFailure::kTimeout)).state ==
          probe::VerdictState::kAbsent);
}

TEST_CASE("malformed target is indeterminate for every kind", "[probe][classifier]") {
  const probe::ProbeOutcome malformed = probe::MakeMalformedTargetOutcome("x", "bad url");
  REQUIRE(malformed.failure == probe::FailureCategory::kMalformedTarget);

  REQUIRE(probe::Classify(GithubSpec(), malformed).state == probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(probe::MakeTcpConnectSpec(22), malformed).state ==
          probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(probe::MakePathProbeSpec("admin"), malformed).state ==
          probe::VerdictState::kIndeterminate);
  REQUIRE(probe::Classify(probe::MakeHeaderFetchSpec("web", "http://{}", std::nullopt, false),
                          malformed)
              .state == probe::VerdictState::kIndeterminate);
}

TEST_CASE("verdict keeps the outcome submission index", "[probe][classifier]") {
  probe::ProbeOutcome outcome = HttpOutcome(200, "ok");
  outcome.spec_index = 7;
  REQUIRE(probe::Classify(GithubSpec(), outcome).spec_index == 7U);
}
