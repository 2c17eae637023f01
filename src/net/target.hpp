#pragma once

#include <string>
#include <string_view>

namespace reconkit::net {

// Target normalization and URL composition helpers.
//
// All URL work goes through libcurl's URL API so that probe URLs are parsed
// exactly the way the transport will parse them later.

// Replaces every `{}` placeholder in `url_template` with `value`.
std::string ExpandTemplate(std::string_view url_template, std::string_view value);

// Checks that `url` parses as an absolute http/https URL with a host.
bool ValidateHttpUrl(std::string_view url, std::string& error);

// Prefixes `http://` when the input carries no scheme. `added_scheme` reports
// whether the prefix was applied so callers can tell the user.
bool NormalizeHttpUrl(std::string_view raw, std::string& url, bool& added_scheme,
                      std::string& error);

// Extracts the host component (without brackets for IPv6 literals).
bool ExtractHost(std::string_view url, std::string& host, std::string& error);

// Resolves `reference` against `base` with browser/redirect semantics:
// "admin" replaces the last path segment, "/robots.txt" replaces the path.
bool ResolveUrlReference(std::string_view base, std::string_view reference,
                         std::string& resolved, std::string& error);

// Username targets are substituted into URL paths; reject anything that
// would change the URL structure.
bool ValidateUsername(std::string_view username, std::string& error);

// Accepts a bare hostname, an IP literal, or a URL (the host is extracted).
bool NormalizeHostTarget(std::string_view raw, std::string& host, std::string& error);

} // namespace reconkit::net
