#include "sensestream/jwt.hpp"
#include "sensestream/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace sensestream {

namespace {

std::string openssl_error(const char *context) {
  const unsigned long err = ERR_get_error();
  ERR_clear_error();
  if (err == 0)
    return std::string(context) + ": unknown OpenSSL error";
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(context) + ": " + buf;
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

struct FileCloser {
  void operator()(std::FILE *f) const noexcept { std::fclose(f); }
};

// Без пароля возвращаем 0, иначе OpenSSL полезет спрашивать его с терминала.
int passphrase_cb(char *buf, int size, int, void *u) {
  const auto *pass = static_cast<const std::string *>(u);
  if (!pass || pass->empty())
    return 0;
  const int n = std::min<int>(size, static_cast<int>(pass->size()));
  std::memcpy(buf, pass->data(), static_cast<std::size_t>(n));
  return n;
}

} // namespace

std::string base64_encode(const std::string &bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(&out[0]),
      reinterpret_cast<const unsigned char *>(bytes.data()),
      static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string base64url_encode(const std::string &bytes) {
  std::string s = base64_encode(bytes);
  for (auto &c : s) {
    if (c == '+')
      c = '-';
    else if (c == '/')
      c = '_';
  }
  while (!s.empty() && s.back() == '=')
    s.pop_back();
  return s;
}

std::string base64url_decode(const std::string &text) {
  std::string s = text;
  for (auto &c : s) {
    if (c == '-')
      c = '+';
    else if (c == '_')
      c = '/';
  }
  if (s.size() % 4 == 1)
    throw std::invalid_argument("invalid base64url length");
  while (s.size() % 4 != 0)
    s.push_back('=');

  std::string out(3 * s.size() / 4, '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                reinterpret_cast<const unsigned char *>(s.data()),
                                static_cast<int>(s.size()));
  if (n < 0)
    throw std::invalid_argument("invalid base64url data");

  // EVP_DecodeBlock считает padding как нулевые байты
  std::size_t pad = 0;
  for (auto it = s.rbegin(); it != s.rend() && *it == '='; ++it)
    ++pad;
  out.resize(static_cast<std::size_t>(n) - std::min<std::size_t>(pad, 2));
  return out;
}

KeyPairSigner::KeyPairSigner(const std::string &key_file,
                             const std::string &passphrase) {
  std::unique_ptr<std::FILE, FileCloser> f(std::fopen(key_file.c_str(), "rb"));
  if (!f)
    throw CredentialError("private key file not found or unreadable: " + key_file);

  std::string pass = passphrase;
  EVP_PKEY *raw = PEM_read_PrivateKey(f.get(), nullptr, passphrase_cb, &pass);
  std::fill(pass.begin(), pass.end(), '\0');
  if (!raw)
    throw CredentialError(openssl_error(
        ("cannot load private key " + key_file + " (wrong passphrase?)").c_str()));
  key_.reset(raw);

  if (EVP_PKEY_base_id(key_.get()) != EVP_PKEY_RSA)
    throw CredentialError("private key " + key_file + " is not an RSA key");

  const std::string der = public_key_der();
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(der.data(), der.size(), md, &md_len, EVP_sha256(), nullptr) != 1)
    throw CredentialError(openssl_error("EVP_Digest"));
  fingerprint_ = "SHA256:" +
                 base64_encode(std::string(reinterpret_cast<char *>(md), md_len));
}

std::string KeyPairSigner::public_key_der() const {
  const int len = i2d_PUBKEY(key_.get(), nullptr);
  if (len <= 0)
    throw CredentialError(openssl_error("i2d_PUBKEY"));
  std::string der(static_cast<std::size_t>(len), '\0');
  auto *p = reinterpret_cast<unsigned char *>(&der[0]);
  if (i2d_PUBKEY(key_.get(), &p) != len)
    throw CredentialError(openssl_error("i2d_PUBKEY"));
  return der;
}

std::string KeyPairSigner::sign(const std::string &data) const {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx)
    throw CredentialError(openssl_error("EVP_MD_CTX_new"));
  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1)
    throw CredentialError(openssl_error("EVP_DigestSignInit"));

  std::size_t sig_len = 0;
  const auto *in = reinterpret_cast<const unsigned char *>(data.data());
  if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, in, data.size()) != 1)
    throw CredentialError(openssl_error("EVP_DigestSign size"));
  std::string sig(sig_len, '\0');
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char *>(&sig[0]),
                     &sig_len, in, data.size()) != 1)
    throw CredentialError(openssl_error("EVP_DigestSign"));
  sig.resize(sig_len);
  return sig;
}

std::string KeyPairSigner::sign_jwt(const nlohmann::json &claims) const {
  static const std::string header =
      base64url_encode(R"({"alg":"RS256","typ":"JWT"})");
  const std::string signing_input = header + "." + base64url_encode(claims.dump());
  return signing_input + "." + base64url_encode(sign(signing_input));
}

} // namespace sensestream
