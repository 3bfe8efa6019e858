#include "session_token.hpp"

#include <google/protobuf/util/json_util.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace dashstream::session {

using dashstream::v1::SessionTokenClaims;

namespace {

constexpr std::string_view kHeaderJson = R"({"alg":"HS256","typ":"JWT"})";

} // namespace

std::string Base64UrlEncode(std::string_view bytes) {
  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));

  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::string Base64UrlDecode(std::string_view text) {
  std::string padded;
  padded.reserve(text.size() + 3);
  for (char c : text) {
    if (c == '-') {
      padded.push_back('+');
    } else if (c == '_') {
      padded.push_back('/');
    } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      padded.push_back(c);
    } else {
      throw std::invalid_argument("invalid base64url character");
    }
  }
  if (padded.size() % 4 == 1) {
    throw std::invalid_argument("invalid base64url length");
  }
  const std::size_t padding = (4 - padded.size() % 4) % 4;
  padded.append(padding, '=');

  std::vector<unsigned char> out(3 * (padded.size() / 4) + 1);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()), static_cast<int>(padded.size()));
  if (decoded < 0) {
    throw std::invalid_argument("invalid base64url payload");
  }

  // EVP_DecodeBlock counts the zero bytes produced by '=' padding
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(decoded) - padding);
}

SessionTokenSigner::SessionTokenSigner(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    throw std::invalid_argument("session token secret must not be empty");
  }
}

std::string SessionTokenSigner::Mac(std::string_view signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (!HMAC(EVP_sha256(),
            secret_.data(),
            static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(signing_input.data()),
            signing_input.size(),
            digest,
            &digest_len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string SessionTokenSigner::Sign(const SessionTokenClaims& claims) const {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(claims, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode token claims: " + std::string(status.message()));
  }

  auto signing_input = Base64UrlEncode(kHeaderJson) + "." + Base64UrlEncode(json);
  return signing_input + "." + Base64UrlEncode(Mac(signing_input));
}

SessionTokenClaims SessionTokenSigner::Verify(std::string_view token) const {
  const auto first  = token.find('.');
  const auto second = first == std::string_view::npos ? std::string_view::npos : token.find('.', first + 1);
  if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
    throw util::SessionTokenInvalid("session token is malformed");
  }

  const auto header        = token.substr(0, first);
  const auto payload       = token.substr(first + 1, second - first - 1);
  const auto signing_input = token.substr(0, second);

  std::string signature;
  std::string header_json;
  std::string claims_json;
  try {
    signature   = Base64UrlDecode(token.substr(second + 1));
    header_json = Base64UrlDecode(header);
    claims_json = Base64UrlDecode(payload);
  } catch (const std::invalid_argument&) {
    throw util::SessionTokenInvalid("session token is malformed");
  }

  if (header_json != kHeaderJson) {
    throw util::SessionTokenInvalid("session token uses an unsupported header");
  }

  const auto expected = Mac(signing_input);
  if (signature.size() != expected.size() || CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    throw util::SessionTokenInvalid("session token signature mismatch");
  }

  SessionTokenClaims                       claims;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (!google::protobuf::util::JsonStringToMessage(claims_json, &claims, options).ok()) {
    throw util::SessionTokenInvalid("session token claims are malformed");
  }
  if (claims.type() != dashstream::v1::kSessionTokenType || claims.session_id().empty() || claims.user_id().empty()) {
    throw util::SessionTokenInvalid("session token claims are incomplete");
  }
  return claims;
}

} // namespace dashstream::session
