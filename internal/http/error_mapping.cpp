#include "error_mapping.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace dashstream::http {

HttpError ToHttpError(const std::exception& e) {
  using namespace dashstream::util;

  if (const auto* streaming = dynamic_cast<const StreamingError*>(&e)) {
    return {streaming->status_code(), streaming->code(), e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {400, "INVALID_ARGUMENT", e.what()};
  }

  return {500, "INTERNAL_ERROR", "Internal server error"};
}

std::string ToJsonBody(const HttpError& error) {
  google::protobuf::Struct body;
  auto&                    fields = *(*body.mutable_fields())["error"].mutable_struct_value()->mutable_fields();
  fields["code"].set_string_value(error.code);
  fields["message"].set_string_value(error.message);
  fields["statusCode"].set_number_value(error.status);

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(body, &json).ok()) {
    return R"({"error":{"code":"INTERNAL_ERROR"}})";
  }
  return json;
}

} // namespace dashstream::http
