#include "tools/username_search.hpp"

#include "core/json_dom.hpp"
#include "net/target.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <utility>

namespace reconkit::tools {

namespace {

bool ParsePlatformEntry(const core::json::Value& node, std::size_t index, PlatformEntry& entry,
                        std::string& error) {
  const std::string where = "platforms[" + std::to_string(index) + "]";
  if (!node.is_object()) {
    error = where + " must be an object";
    return false;
  }

  const core::json::Value* name = core::json::FindField(node, "name");
  if (name == nullptr || !name->is_string() || name->string_value.empty()) {
    error = where + ".name must be a non-empty string";
    return false;
  }
  const core::json::Value* url = core::json::FindField(node, "url");
  if (url == nullptr || !url->is_string()) {
    error = where + ".url must be a string";
    return false;
  }
  if (url->string_value.find("{}") == std::string::npos) {
    error = where + ".url must contain a {} placeholder for the username";
    return false;
  }

  entry.name = name->string_value;
  entry.url_template = url->string_value;
  entry.absence_markers.clear();

  const core::json::Value* markers = core::json::FindField(node, "markers");
  if (markers == nullptr) {
    return true;
  }
  if (!markers->is_array()) {
    error = where + ".markers must be an array of strings";
    return false;
  }
  for (std::size_t i = 0; i < markers->array_value.size(); ++i) {
    const core::json::Value& marker = markers->array_value[i];
    if (!marker.is_string() || marker.string_value.empty()) {
      error = where + ".markers[" + std::to_string(i) + "] must be a non-empty string";
      return false;
    }
    entry.absence_markers.push_back(marker.string_value);
  }
  return true;
}

} // namespace

const std::vector<PlatformEntry>& DefaultPlatformCatalog() {
  static const std::vector<PlatformEntry> kPlatforms = {
      {"Facebook", "https://www.facebook.com/{}", {"content-login-button", "login_form"}},
      {"Instagram", "https://www.instagram.com/{}/", {"The link you followed may be broken"}},
      {"Twitter", "https://twitter.com/{}", {"This account doesn't exist"}},
      {"GitHub", "https://github.com/{}", {"This is not the web page you are looking for"}},
      {"YouTube", "https://www.youtube.com/@{}", {"This channel doesn't exist"}},
      {"Reddit", "https://www.reddit.com/user/{}", {"Sorry, nobody on Reddit goes by that name"}},
      {"Pinterest", "https://www.pinterest.com/{}/", {"Sorry, we couldn't find"}},
      {"TikTok", "https://www.tiktok.com/@{}", {"Couldn't find this account"}},
      {"LinkedIn", "https://www.linkedin.com/in/{}", {"This page doesn't exist"}},
      {"Twitch", "https://www.twitch.tv/{}", {"the page you are looking for is unavailable"}},
      {"Telegram", "https://t.me/{}", {"If you have Telegram, you can contact"}},
      {"VK", "https://vk.com/{}", {"Error 404"}},
      {"Medium", "https://medium.com/@{}", {"404"}},
      {"DeviantArt", "https://{}.deviantart.com", {"404"}},
      {"Spotify", "https://open.spotify.com/user/{}", {"Page not found"}},
  };
  return kPlatforms;
}

bool ParsePlatformCatalog(std::string_view json, std::vector<PlatformEntry>& platforms,
                          std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(json, root, error)) {
    return false;
  }

  const core::json::Value* list = core::json::FindField(root, "platforms");
  if (list == nullptr || !list->is_array()) {
    error = "catalog must be an object with a 'platforms' array";
    return false;
  }
  if (list->array_value.empty()) {
    error = "catalog 'platforms' array is empty";
    return false;
  }

  std::vector<PlatformEntry> parsed;
  std::set<std::string> names;
  parsed.reserve(list->array_value.size());
  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    PlatformEntry entry;
    if (!ParsePlatformEntry(list->array_value[i], i, entry, error)) {
      return false;
    }
    if (!names.insert(entry.name).second) {
      error = "duplicate platform name '" + entry.name + "'";
      return false;
    }
    parsed.push_back(std::move(entry));
  }

  platforms = std::move(parsed);
  return true;
}

bool LoadPlatformCatalogFile(const std::filesystem::path& path,
                             std::vector<PlatformEntry>& platforms, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open platform catalog: " + path.string();
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(input)),
                             std::istreambuf_iterator<char>());
  if (!ParsePlatformCatalog(contents, platforms, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

std::vector<probe::ProbeSpec> BuildUsernameProbeSpecs(const std::vector<PlatformEntry>& platforms) {
  std::vector<probe::ProbeSpec> specs;
  specs.reserve(platforms.size());
  for (const auto& platform : platforms) {
    specs.push_back(probe::MakeHttpExistenceSpec(platform.name, platform.url_template,
                                                 platform.absence_markers));
  }
  return specs;
}

bool RunUsernameSearch(probe::ScanSession& session, const std::string& username,
                       const UsernameSearchOptions& options,
                       const probe::ScanEntryCallback& on_entry, probe::ScanReport& report,
                       std::string& error) {
  if (!net::ValidateUsername(username, error)) {
    return false;
  }
  if (options.platforms.empty()) {
    error = "no platforms to check";
    return false;
  }

  probe::ScanRequest request;
  request.target = username;
  request.specs = BuildUsernameProbeSpecs(options.platforms);
  request.options = options.dispatch;
  return session.RunScan(std::move(request), on_entry, report, error);
}

} // namespace reconkit::tools
