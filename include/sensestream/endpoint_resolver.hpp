#pragma once
#include "http_client.hpp"
#include <optional>
#include <string>

namespace sensestream {

// Anything that can authenticate a control plane request.
class BearerSource {
public:
  virtual ~BearerSource() = default;
  virtual std::string bearer_token() = 0;
  // Value of X-Snowflake-Authorization-Token-Type.
  virtual std::string token_type() const = 0;
};

// Discovers the per-account ingest (data plane) host once per process.
class EndpointResolver {
public:
  EndpointResolver(HttpTransport &http, std::string control_url,
                   BearerSource &auth);

  // GET {control}/v2/streaming/hostname on the first call, cached afterwards.
  // Throws ResolutionError on non-2xx or an empty/malformed body.
  const std::string &resolve_ingest_host();

  bool resolved() const noexcept { return host_.has_value(); }

private:
  HttpTransport &http_;
  const std::string control_url_;
  BearerSource &auth_;
  std::optional<std::string> host_;
};

// Hostnames must be DNS-safe: every '_' becomes '-'.
std::string normalize_host(const std::string &raw);

// Accepts {"hostname": ...}, {"ingest_host": ...} or a plain-text host.
// Returns the normalized host, throws ResolutionError if none is present.
std::string parse_hostname_response(const HttpResponse &res);

} // namespace sensestream
