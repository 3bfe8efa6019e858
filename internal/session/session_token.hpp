#pragma once

#include <string>
#include <string_view>

#include "dashstream/v1.hpp"

namespace dashstream::session {

/*
  HS256 compact tokens.

    base64url(header) "." base64url(claims json) "." base64url(hmac)

  Claims are SessionTokenClaims in protobuf JSON form. Verify only checks
  structure and signature; scope and expiry rules belong to the caller.
*/
class SessionTokenSigner {
 public:
  explicit SessionTokenSigner(std::string secret);

  std::string Sign(const dashstream::v1::SessionTokenClaims& claims) const;

  // Throws util::SessionTokenInvalid.
  dashstream::v1::SessionTokenClaims Verify(std::string_view token) const;

 private:
  std::string Mac(std::string_view signing_input) const;

  std::string secret_;
};

std::string Base64UrlEncode(std::string_view bytes);

// Throws std::invalid_argument on characters outside the url alphabet.
std::string Base64UrlDecode(std::string_view text);

} // namespace dashstream::session
