#pragma once

#include <exception>
#include <string>

namespace dashstream::http {

struct HttpError {
  int         status = 500;
  std::string code;
  std::string message;
};

/*
  Converts internal exceptions into the status/code pair the HTTP layer
  answers with.
*/
HttpError ToHttpError(const std::exception& e);

// {"error":{"code":"...","message":"...","statusCode":N}}
std::string ToJsonBody(const HttpError& error);

} // namespace dashstream::http
