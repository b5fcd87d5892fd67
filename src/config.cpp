#include "sensestream/config.hpp"
#include "sensestream/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sys/stat.h>

using json = nlohmann::json;

namespace sensestream {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string required_string(const json &j, const char *key) {
  if (!j.contains(key))
    throw ConfigurationError(std::string("missing required field '") + key + "'");
  if (!j[key].is_string())
    throw ConfigurationError(std::string("field '") + key + "' must be a string");
  auto v = j[key].get<std::string>();
  if (v.empty())
    throw ConfigurationError(std::string("field '") + key + "' must not be empty");
  return v;
}

std::string optional_string(const json &j, const char *key,
                            const std::string &def) {
  if (!j.contains(key) || j[key].is_null())
    return def;
  if (!j[key].is_string())
    throw ConfigurationError(std::string("field '") + key + "' must be a string");
  return j[key].get<std::string>();
}

bool file_exists(const std::string &path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

std::string StreamConfig::control_url() const {
  std::string u = url.empty()
                      ? "https://" + to_lower(account) + ".snowflakecomputing.com"
                      : url;
  while (!u.empty() && u.back() == '/')
    u.pop_back();
  if (u.find("://") == std::string::npos)
    u = "https://" + u;
  return u;
}

StreamConfig parse_config(const json &j) {
  if (!j.is_object())
    throw ConfigurationError("config root must be a JSON object");

  StreamConfig c;
  c.account = required_string(j, "account");
  c.user = required_string(j, "user");
  c.database = required_string(j, "database");
  c.schema = required_string(j, "schema");
  c.pipe = required_string(j, "pipe");

  c.url = optional_string(j, "url", c.url);
  c.channel_name = optional_string(j, "channel_name", c.channel_name);
  if (c.channel_name.empty())
    throw ConfigurationError("field 'channel_name' must not be empty");

  c.private_key_file = optional_string(j, "private_key_file", "");
  c.private_key_passphrase = optional_string(j, "private_key_passphrase", "");
  c.pat_token = optional_string(j, "pat_token", "");

  if (j.contains("request_timeout_ms")) {
    const json &v = j["request_timeout_ms"];
    // unsigned сверх int64 тоже сюда: get<int64_t> даёт отрицательное
    if (!v.is_number_integer() || v.get<std::int64_t>() <= 0 ||
        v.get<std::int64_t>() > std::numeric_limits<int>::max())
      throw ConfigurationError("field 'request_timeout_ms' must be a positive integer "
                               "no larger than " +
                               std::to_string(std::numeric_limits<int>::max()));
    c.request_timeout_ms = static_cast<int>(v.get<std::int64_t>());
  }

  const bool has_key = !c.private_key_file.empty();
  const bool has_pat = !c.pat_token.empty();
  if (has_key && has_pat)
    throw ConfigurationError(
        "both 'private_key_file' and 'pat_token' are set, configure exactly one");
  if (!has_key && !has_pat)
    throw ConfigurationError(
        "either 'private_key_file' or 'pat_token' must be provided");
  if (has_key && !file_exists(c.private_key_file))
    throw ConfigurationError("private key file not found: " + c.private_key_file);

  return c;
}

StreamConfig load_config(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    throw ConfigurationError("cannot open config file: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw ConfigurationError("malformed config " + path + ": " + e.what());
  }
  return parse_config(j);
}

} // namespace sensestream
