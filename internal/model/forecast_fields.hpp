#pragma once

#include <string>
#include <variant>

#include "internal/model/document.hpp"

namespace forecast::model {

/*
  Well-known forecast record fields.

  The indexed ones are copied into dedicated columns on every mirror write
  so filters never have to look inside the stored document.
*/
namespace fields {
inline constexpr const char* kCategory     = "category";
inline constexpr const char* kClass        = "class";
inline constexpr const char* kSource       = "source";
inline constexpr const char* kDor          = "dor";
inline constexpr const char* kManufacturer = "manufacturer";
inline constexpr const char* kModel        = "model";

inline constexpr const char* kForecastStart = "forecastStart";
inline constexpr const char* kForecastEnd   = "forecastEnd";
inline constexpr const char* kOriginalStart = "originalStart";
inline constexpr const char* kOriginalEnd   = "originalEnd";
inline constexpr const char* kActualStart   = "actualStart";
inline constexpr const char* kActualEnd     = "actualEnd";

inline constexpr const char* kMonthlyRate   = "monthlyRate";
inline constexpr const char* kPurchasePrice = "purchasePrice";

inline constexpr const char* kIsActualized        = "isActualized";
inline constexpr const char* kIsDiscontinued      = "isDiscontinued";
inline constexpr const char* kIsFundsTransferable = "isFundsTransferable";
inline constexpr const char* kHasPlan             = "hasPlan";
inline constexpr const char* kHasActuals          = "hasActuals";
} // namespace fields

struct IndexedColumns {
  std::string category;
  std::string class_name;
  std::string source;
  std::string dor;
  std::string manufacturer;
  std::string model;
};

// Non-string values index as empty.
inline std::string StringField(const Document& doc, const std::string& field) {
  auto it = doc.find(field);
  if (it == doc.end()) {
    return {};
  }
  if (const auto* s = std::get_if<std::string>(&it->second)) {
    return *s;
  }
  return {};
}

inline IndexedColumns ExtractIndexedColumns(const Document& doc) {
  return IndexedColumns{
      .category     = StringField(doc, fields::kCategory),
      .class_name   = StringField(doc, fields::kClass),
      .source       = StringField(doc, fields::kSource),
      .dor          = StringField(doc, fields::kDor),
      .manufacturer = StringField(doc, fields::kManufacturer),
      .model        = StringField(doc, fields::kModel),
  };
}

} // namespace forecast::model
