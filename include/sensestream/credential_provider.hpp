#pragma once
#include "endpoint_resolver.hpp"
#include "http_client.hpp"
#include "jwt.hpp"
#include "time_utils.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace sensestream {

// JWT или PAT -> scoped token для ingest-хоста. Не потокобезопасен.
class CredentialProvider : public BearerSource {
public:
  static constexpr std::int64_t kTokenLifetime = 3600;
  static constexpr std::int64_t kRefreshMargin = 60;

  CredentialProvider(const StreamConfig &cfg, HttpTransport &http,
                     Clock clock = system_clock_seconds);

  std::string bearer_token() override;
  std::string token_type() const override;

  // кэшируется до expires_in - kRefreshMargin
  std::string scoped_token();

  const std::string &ingest_host() { return resolver_->resolve_ingest_host(); }
  EndpointResolver &resolver() noexcept { return *resolver_; }

  const std::string &control_url() const noexcept { return control_url_; }
  const KeyPairSigner *signer() const noexcept { return signer_.get(); }

private:
  std::string generate_jwt(std::int64_t now);

  const AuthMode mode_;
  const std::string account_; // upper-case
  const std::string user_;    // upper-case
  const std::string pat_;
  const std::string control_url_;
  HttpTransport &http_;
  Clock clock_;

  std::unique_ptr<KeyPairSigner> signer_;
  std::unique_ptr<EndpointResolver> resolver_;

  std::string jwt_;
  std::int64_t jwt_expiry_ = 0;
  std::string scoped_;
  std::int64_t scoped_expiry_ = 0;
};

} // namespace sensestream
