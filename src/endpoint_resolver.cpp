#include "sensestream/endpoint_resolver.hpp"
#include "sensestream/errors.hpp"
#include "sensestream/log.hpp"

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sensestream {

std::string normalize_host(const std::string &raw) {
  std::string host = boost::algorithm::trim_copy(raw);
  if (host.find('_') != std::string::npos) {
    boost::algorithm::replace_all(host, "_", "-");
    log_info("HOST", "replaced underscores with dashes in ingest host");
  }
  return host;
}

std::string parse_hostname_response(const HttpResponse &res) {
  const std::string body = boost::algorithm::trim_copy(res.body);
  const bool looks_json = boost::algorithm::icontains(res.content_type, "json") ||
                          boost::algorithm::starts_with(body, "{");

  std::string host;
  if (looks_json) {
    json j;
    try {
      j = json::parse(body);
    } catch (const json::parse_error &e) {
      throw ResolutionError(std::string("malformed hostname response: ") + e.what());
    }
    for (const char *key : {"hostname", "ingest_host"}) {
      if (j.is_object() && j.contains(key) && j[key].is_string() &&
          !j[key].get<std::string>().empty()) {
        host = j[key].get<std::string>();
        break;
      }
    }
    if (host.empty())
      throw ResolutionError("hostname response has no 'hostname' or 'ingest_host': " +
                            body);
  } else {
    host = body;
  }

  host = normalize_host(host);
  if (host.empty())
    throw ResolutionError("empty hostname response");
  return host;
}

EndpointResolver::EndpointResolver(HttpTransport &http, std::string control_url,
                                   BearerSource &auth)
    : http_(http), control_url_(std::move(control_url)), auth_(auth) {}

const std::string &EndpointResolver::resolve_ingest_host() {
  if (host_)
    return *host_;

  log_info("HOST", "discovering ingest host via " + control_url_);

  HttpRequest req;
  req.method = "GET";
  req.url = control_url_ + "/v2/streaming/hostname";
  req.headers = {{"Authorization", "Bearer " + auth_.bearer_token()},
                 {"X-Snowflake-Authorization-Token-Type", auth_.token_type()}};

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError &e) {
    throw ResolutionError(std::string("hostname discovery failed: ") + e.what());
  }
  if (!res.ok())
    throw ResolutionError("hostname discovery failed: HTTP " +
                          std::to_string(res.status) + " " + res.body);

  host_ = parse_hostname_response(res);
  log_info("HOST", "ingest host: " + *host_);
  return *host_;
}

} // namespace sensestream
