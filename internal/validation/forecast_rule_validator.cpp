#include "internal/validation/forecast_rule_validator.hpp"

#include <array>
#include <string>
#include <utility>

#include "internal/model/forecast_fields.hpp"

namespace forecast::validation {

namespace {

namespace f = model::fields;

constexpr const char* kInvalidDateOrder = "INVALID_DATE_ORDER";
constexpr const char* kMissingRequired  = "MISSING_REQUIRED_FIELD";
constexpr const char* kInvalidValue     = "INVALID_VALUE";
constexpr const char* kInvalidEnum      = "INVALID_ENUM_VALUE";
constexpr const char* kInvalidType      = "INVALID_TYPE";
constexpr const char* kBusinessRule     = "BUSINESS_RULE_VIOLATION";

struct DatePair {
  const char* start;
  const char* end;
  const char* label;
};

constexpr std::array<DatePair, 3> kDatePairs = {{
    {f::kForecastStart, f::kForecastEnd, "Forecast"},
    {f::kOriginalStart, f::kOriginalEnd, "Original"},
    {f::kActualStart, f::kActualEnd, "Actual"},
}};

constexpr std::array<const char*, 5> kBooleanFields = {f::kIsActualized, f::kIsDiscontinued, f::kIsFundsTransferable, f::kHasPlan,
                                                       f::kHasActuals};

bool Has(const model::Document& doc, const char* field) {
  return doc.find(field) != doc.end();
}

const model::Timestamp* AsTimestamp(const model::Document& doc, const char* field) {
  auto it = doc.find(field);
  return it == doc.end() ? nullptr : std::get_if<model::Timestamp>(&it->second);
}

bool IsTrue(const model::Document& doc, const char* field) {
  auto it = doc.find(field);
  if (it == doc.end()) return false;
  const auto* b = std::get_if<bool>(&it->second);
  return b && *b;
}

void Add(ValidationReport& report, std::string field, std::string message, const char* code) {
  report.errors.push_back(util::FieldError{std::move(field), std::move(message), code});
}

void CheckDates(const model::Document& delta, const model::Document& effective, ValidationReport& report) {
  for (const auto* field : {f::kForecastStart, f::kForecastEnd, f::kOriginalStart, f::kOriginalEnd, f::kActualStart, f::kActualEnd}) {
    auto it = delta.find(field);
    if (it != delta.end() && !model::IsNull(it->second) && !std::holds_alternative<model::Timestamp>(it->second)) {
      Add(report, field, std::string(field) + " must be a timestamp", kInvalidType);
    }
  }

  for (const auto& pair : kDatePairs) {
    if (!Has(delta, pair.start) && !Has(delta, pair.end)) continue;

    const auto* start = AsTimestamp(effective, pair.start);
    const auto* end   = AsTimestamp(effective, pair.end);
    if (start && end && *start > *end) {
      Add(report, pair.end, std::string(pair.label) + " end date must be after start date", kInvalidDateOrder);
    }
  }
}

void CheckAmount(const model::Document& delta, const char* field, ValidationReport& report) {
  auto it = delta.find(field);
  if (it == delta.end() || model::IsNull(it->second)) return;

  const auto* amount = std::get_if<double>(&it->second);
  if (!amount) {
    Add(report, field, std::string(field) + " must be a number", kInvalidType);
  } else if (*amount < 0) {
    Add(report, field, std::string(field) + " must be non-negative", kInvalidValue);
  }
}

void CheckSource(const model::Document& delta, const model::Document& effective, ValidationReport& report) {
  CheckAmount(delta, f::kMonthlyRate, report);
  CheckAmount(delta, f::kPurchasePrice, report);

  auto it = delta.find(f::kSource);
  if (it == delta.end() || model::IsNull(it->second)) return;

  const auto* source = std::get_if<std::string>(&it->second);
  if (!source || (*source != "Rental" && *source != "Purchase")) {
    Add(report, f::kSource, "Source must be either Rental or Purchase", kInvalidEnum);
    return;
  }

  const char* required = *source == "Rental" ? f::kMonthlyRate : f::kPurchasePrice;
  if (model::IsNull(model::ValueOr(effective, required))) {
    Add(report, required,
        *source == "Rental" ? "Monthly rate is required for rental equipment" : "Purchase price is required for purchased equipment",
        kMissingRequired);
  }
}

void CheckDor(const model::Document& delta, ValidationReport& report) {
  auto it = delta.find(f::kDor);
  if (it == delta.end() || model::IsNull(it->second)) return;

  const auto* dor = std::get_if<std::string>(&it->second);
  if (!dor || (*dor != "BEO" && *dor != "PROJECT")) {
    Add(report, f::kDor, "DOR must be either BEO or PROJECT", kInvalidEnum);
  }
}

void CheckFlags(const model::Document& delta, ValidationReport& report) {
  for (const auto* field : kBooleanFields) {
    auto it = delta.find(field);
    if (it != delta.end() && !std::holds_alternative<bool>(it->second)) {
      Add(report, field, std::string(field) + " must be a boolean", kInvalidType);
    }
  }
}

void CheckBusinessRules(const model::Document& delta, const model::Document& current, ValidationReport& report) {
  if (IsTrue(current, f::kIsActualized)) {
    const auto* current_start = AsTimestamp(current, f::kActualStart);
    const auto* new_start     = AsTimestamp(delta, f::kActualStart);
    if (current_start && new_start && *new_start > *current_start) {
      Add(report, f::kActualStart, "Cannot move actual start date forward for actualized equipment", kBusinessRule);
    }

    auto it = delta.find(f::kSource);
    if (it != delta.end() && !model::IsNull(it->second) && it->second != model::ValueOr(current, f::kSource)) {
      Add(report, f::kSource, "Cannot change source type for actualized equipment", kBusinessRule);
    }
  }

  if (IsTrue(current, f::kIsDiscontinued)) {
    auto it = delta.find(f::kIsDiscontinued);
    if (it != delta.end() && it->second == model::FieldValue{false}) {
      Add(report, f::kIsDiscontinued, "Cannot reactivate discontinued equipment", kBusinessRule);
    }
  }
}

} // namespace

ValidationReport ForecastRuleValidator::Validate(const model::Document& delta, const model::Document& current) const {
  ValidationReport report;
  const auto       effective = model::Merge(current, delta);

  CheckDates(delta, effective, report);
  CheckSource(delta, effective, report);
  CheckDor(delta, report);
  CheckFlags(delta, report);
  CheckBusinessRules(delta, current, report);
  return report;
}

} // namespace forecast::validation
