#include "sensestream/credential_provider.hpp"
#include "sensestream/errors.hpp"
#include "sensestream/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sensestream {

CredentialProvider::CredentialProvider(const StreamConfig &cfg,
                                       HttpTransport &http, Clock clock)
    : mode_(cfg.auth_mode()),
      account_(boost::algorithm::to_upper_copy(cfg.account)),
      user_(boost::algorithm::to_upper_copy(cfg.user)), pat_(cfg.pat_token),
      control_url_(cfg.control_url()), http_(http), clock_(std::move(clock)) {
  if (mode_ == AuthMode::KeyPair) {
    log_info("AUTH", "using key-pair JWT authentication");
    signer_ = std::make_unique<KeyPairSigner>(cfg.private_key_file,
                                              cfg.private_key_passphrase);
    log_info("AUTH", "private key loaded, fingerprint " + signer_->fingerprint());
  } else {
    log_info("AUTH", "using PAT authentication");
  }
  resolver_ = std::make_unique<EndpointResolver>(http_, control_url_, *this);
}

std::string CredentialProvider::token_type() const {
  return mode_ == AuthMode::KeyPair ? "KEYPAIR_JWT" : "PROGRAMMATIC_ACCESS_TOKEN";
}

std::string CredentialProvider::generate_jwt(std::int64_t now) {
  const std::string qualified = account_ + "." + user_;
  json claims = {{"iss", qualified + "." + signer_->fingerprint()},
                 {"sub", qualified},
                 {"iat", now},
                 {"exp", now + kTokenLifetime}};
  jwt_ = signer_->sign_jwt(claims);
  jwt_expiry_ = now + kTokenLifetime;
  log_dbg("AUTH", "JWT generated, expires at " + std::to_string(jwt_expiry_));
  return jwt_;
}

std::string CredentialProvider::bearer_token() {
  if (mode_ == AuthMode::ProgrammaticToken)
    return pat_;

  const std::int64_t now = clock_();
  if (jwt_.empty() || now >= jwt_expiry_ - kRefreshMargin)
    return generate_jwt(now);
  return jwt_;
}

std::string CredentialProvider::scoped_token() {
  if (!scoped_.empty() && clock_() < scoped_expiry_)
    return scoped_;

  const std::string &host = resolver_->resolve_ingest_host();
  log_info("AUTH", "obtaining scoped token for " + host);

  HttpRequest req;
  req.method = "POST";
  req.url = control_url_ + "/oauth/token";
  req.headers = {{"Content-Type", "application/x-www-form-urlencoded"},
                 {"Authorization", "Bearer " + bearer_token()},
                 {"X-Snowflake-Authorization-Token-Type", token_type()}};
  req.body = form_encode(
      {{"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
       {"scope", host}});

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError &e) {
    throw CredentialError(std::string("token exchange failed: ") + e.what());
  }
  if (!res.ok())
    throw CredentialError("token exchange failed: HTTP " +
                          std::to_string(res.status) + " " + res.body);

  json j;
  try {
    j = json::parse(res.body);
  } catch (const json::parse_error &e) {
    throw CredentialError(std::string("malformed token exchange response: ") +
                          e.what());
  }
  if (!j.is_object() || !j.contains("access_token") ||
      !j["access_token"].is_string() ||
      j["access_token"].get<std::string>().empty())
    throw CredentialError("no access_token in scoped token response");

  std::int64_t expires_in = kTokenLifetime;
  if (j.contains("expires_in") && j["expires_in"].is_number())
    expires_in = j["expires_in"].get<std::int64_t>();

  scoped_ = j["access_token"].get<std::string>();
  scoped_expiry_ = clock_() + expires_in - kRefreshMargin;
  log_info("AUTH", "scoped token obtained, valid for " +
                       std::to_string(expires_in - kRefreshMargin) + "s");
  return scoped_;
}

} // namespace sensestream
