#pragma once
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <openssl/evp.h>
#include <string>

namespace sensestream {

std::string base64_encode(const std::string &bytes);
// RFC 7515 base64url, no padding.
std::string base64url_encode(const std::string &bytes);
// Throws std::invalid_argument on malformed input.
std::string base64url_decode(const std::string &text);

// RSA private key (PEM, PKCS#8 or traditional, optionally encrypted) used to
// sign RS256 identity assertions. Throws CredentialError if the file is
// missing, unreadable, not an RSA key or the passphrase is wrong.
class KeyPairSigner {
public:
  KeyPairSigner(const std::string &key_file, const std::string &passphrase);

  // "SHA256:" + base64(sha256(DER SubjectPublicKeyInfo))
  const std::string &fingerprint() const noexcept { return fingerprint_; }

  // header.payload.signature, RS256.
  std::string sign_jwt(const nlohmann::json &claims) const;

  // Raw RSASSA-PKCS1-v1_5 / SHA-256 signature.
  std::string sign(const std::string &data) const;

  // DER SubjectPublicKeyInfo of the public half.
  std::string public_key_der() const;

private:
  struct PkeyDeleter {
    void operator()(EVP_PKEY *k) const noexcept { EVP_PKEY_free(k); }
  };
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key_;
  std::string fingerprint_;
};

} // namespace sensestream
