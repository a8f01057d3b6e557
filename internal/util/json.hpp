#pragma once

#include <map>
#include <string>

#include <google/protobuf/message.h>

namespace chatlog::util {

using StringMap = std::map<std::string, std::string>;

/*
  JSON helpers over google::protobuf::util.

  Messages are printed with their proto field names and with zero-valued
  fields included, so stored payloads are complete string-keyed objects.
  Parsing ignores unknown fields.
*/
std::string MessageToJson(const google::protobuf::Message& message);
void        JsonToMessage(const std::string& json, google::protobuf::Message* message);

// String maps are stored as flat JSON objects. Non-string values read back
// from the store are kept in their JSON form.
std::string StringMapToJson(const StringMap& values);
StringMap   JsonToStringMap(const std::string& json);

} // namespace chatlog::util
