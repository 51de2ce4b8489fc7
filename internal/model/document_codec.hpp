#pragma once

#include <set>
#include <string>

#include "forecast/sync/v1/document.pb.h"
#include "internal/model/document.hpp"

namespace forecast::model {

/*
  Document <-> protobuf conversion.

  The persisted form of a document is the protobuf JSON encoding of
  forecast.sync.v1.Document, shared by every SQL backend.
*/

forecast::sync::v1::FieldValue ToProto(const FieldValue& value);
FieldValue                     FromProto(const forecast::sync::v1::FieldValue& value);

forecast::sync::v1::Document ToProto(const Document& doc);
Document                     FromProto(const forecast::sync::v1::Document& doc);

std::string ToJson(const Document& doc);

// Throws std::invalid_argument on malformed input.
Document FromJson(const std::string& json);

std::string FieldValueToJson(const FieldValue& value);
FieldValue  FieldValueFromJson(const std::string& json);

// Field-name sets persist as a JSON string array.
std::string           FieldSetToJson(const std::set<std::string>& fields);
std::set<std::string> FieldSetFromJson(const std::string& json);

} // namespace forecast::model
