#include "internal/model/document_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace forecast::model {

namespace pb = forecast::sync::v1;

namespace {

template <typename Message>
std::string EncodeJson(const Message& message, const char* what) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error(std::string("failed to encode ") + what + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message DecodeJson(const std::string& json, const char* what) {
  Message                                  message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::invalid_argument(std::string("malformed ") + what + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace

pb::FieldValue ToProto(const FieldValue& value) {
  pb::FieldValue out;
  if (std::holds_alternative<std::monostate>(value)) {
    out.set_null_value(google::protobuf::NULL_VALUE);
  } else if (const auto* s = std::get_if<std::string>(&value)) {
    out.set_string_value(*s);
  } else if (const auto* d = std::get_if<double>(&value)) {
    out.set_number_value(*d);
  } else if (const auto* b = std::get_if<bool>(&value)) {
    out.set_bool_value(*b);
  } else if (const auto* ts = std::get_if<Timestamp>(&value)) {
    out.set_timestamp_ms(ts->unix_ms);
  }
  return out;
}

FieldValue FromProto(const pb::FieldValue& value) {
  switch (value.kind_case()) {
    case pb::FieldValue::kStringValue:
      return value.string_value();
    case pb::FieldValue::kNumberValue:
      return value.number_value();
    case pb::FieldValue::kBoolValue:
      return value.bool_value();
    case pb::FieldValue::kTimestampMs:
      return Timestamp{value.timestamp_ms()};
    case pb::FieldValue::kNullValue:
    case pb::FieldValue::KIND_NOT_SET:
      break;
  }
  return std::monostate{};
}

pb::Document ToProto(const Document& doc) {
  pb::Document out;
  auto&        fields = *out.mutable_fields();
  for (const auto& [field, value] : doc) {
    fields[field] = ToProto(value);
  }
  return out;
}

Document FromProto(const pb::Document& doc) {
  Document out;
  for (const auto& [field, value] : doc.fields()) {
    out.emplace(field, FromProto(value));
  }
  return out;
}

std::string ToJson(const Document& doc) {
  return EncodeJson(ToProto(doc), "document");
}

Document FromJson(const std::string& json) {
  if (json.empty()) {
    return {};
  }
  return FromProto(DecodeJson<pb::Document>(json, "document"));
}

std::string FieldValueToJson(const FieldValue& value) {
  return EncodeJson(ToProto(value), "field value");
}

FieldValue FieldValueFromJson(const std::string& json) {
  if (json.empty()) {
    return std::monostate{};
  }
  return FromProto(DecodeJson<pb::FieldValue>(json, "field value"));
}

std::string FieldSetToJson(const std::set<std::string>& fields) {
  google::protobuf::ListValue list;
  for (const auto& field : fields) {
    list.add_values()->set_string_value(field);
  }
  return EncodeJson(list, "field set");
}

std::set<std::string> FieldSetFromJson(const std::string& json) {
  std::set<std::string> fields;
  if (json.empty()) {
    return fields;
  }
  for (const auto& value : DecodeJson<google::protobuf::ListValue>(json, "field set").values()) {
    fields.insert(value.string_value());
  }
  return fields;
}

} // namespace forecast::model
