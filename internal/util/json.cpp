#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace chatlog::util {

std::string MessageToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw InvalidArgument("encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void JsonToMessage(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw InvalidArgument("decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

std::string StringMapToJson(const StringMap& values) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : values) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) {
    throw InvalidArgument("encode string map: " + std::string(status.message()));
  }
  return json;
}

StringMap JsonToStringMap(const std::string& json) {
  StringMap values;
  if (json.empty()) {
    return values;
  }

  google::protobuf::Struct as_struct;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &as_struct);
  if (!status.ok()) {
    throw InvalidArgument("decode string map: " + std::string(status.message()));
  }

  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      values[key] = value.string_value();
      continue;
    }

    std::string rendered;
    if (google::protobuf::util::MessageToJsonString(value, &rendered).ok()) {
      values[key] = rendered;
    }
  }
  return values;
}

} // namespace chatlog::util
