#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/forecast_fields.hpp"
#include "internal/validation/forecast_rule_validator.hpp"
#include "tests/support/fixture.hpp"

namespace {

using forecast::model::Document;
using forecast::model::Timestamp;
using forecast::validation::ForecastRuleValidator;
using forecast::validation::ValidationReport;

namespace f = forecast::model::fields;

bool HasError(const ValidationReport& report, const std::string& field, const std::string& code) {
  return std::any_of(report.errors.begin(), report.errors.end(), [&](const auto& e) { return e.field == field && e.code == code; });
}

void TestValidDeltaPasses() {
  ForecastRuleValidator validator;
  const auto            current = forecast::testing::EquipmentDoc("Acme", 100.0);

  assert(validator.Validate(Document{{f::kMonthlyRate, 150.0}}, current).Valid());
  assert(validator.Validate(Document{{f::kDor, std::string("BEO")}}, current).Valid());
}

void TestDateOrderUsesMergedDocument() {
  ForecastRuleValidator validator;
  const auto            current = forecast::testing::EquipmentDoc("Acme", 100.0);

  // Only the end moves, before the stored start.
  const Document delta{{f::kForecastEnd, Timestamp{forecast::testing::kStartMs - 1}}};
  const auto     report = validator.Validate(delta, current);
  assert(HasError(report, f::kForecastEnd, "INVALID_DATE_ORDER"));

  // Untouched pairs are not judged even when already out of order.
  Document broken = current;
  broken[f::kActualStart] = Timestamp{10};
  broken[f::kActualEnd]   = Timestamp{5};
  assert(validator.Validate(Document{{f::kMonthlyRate, 1.0}}, broken).Valid());
}

void TestDateFieldsMustBeTimestamps() {
  ForecastRuleValidator validator;
  const auto report = validator.Validate(Document{{f::kForecastStart, std::string("2024-01-01")}}, Document{});
  assert(HasError(report, f::kForecastStart, "INVALID_TYPE"));
}

void TestSourceRequiresMatchingAmount() {
  ForecastRuleValidator validator;
  const auto            current = forecast::testing::EquipmentDoc("Acme", 100.0);

  auto report = validator.Validate(Document{{f::kSource, std::string("Purchase")}}, current);
  assert(HasError(report, f::kPurchasePrice, "MISSING_REQUIRED_FIELD"));

  report = validator.Validate(Document{{f::kSource, std::string("Purchase")}, {f::kPurchasePrice, 5000.0}}, current);
  assert(report.Valid());

  report = validator.Validate(Document{{f::kMonthlyRate, std::monostate{}}, {f::kSource, std::string("Rental")}}, current);
  assert(HasError(report, f::kMonthlyRate, "MISSING_REQUIRED_FIELD"));

  report = validator.Validate(Document{{f::kSource, std::string("Lease")}}, current);
  assert(HasError(report, f::kSource, "INVALID_ENUM_VALUE"));
}

void TestAmountsAndEnums() {
  ForecastRuleValidator validator;

  auto report = validator.Validate(Document{{f::kMonthlyRate, -1.0}}, Document{});
  assert(HasError(report, f::kMonthlyRate, "INVALID_VALUE"));

  report = validator.Validate(Document{{f::kPurchasePrice, std::string("a lot")}}, Document{});
  assert(HasError(report, f::kPurchasePrice, "INVALID_TYPE"));

  report = validator.Validate(Document{{f::kDor, std::string("OTHER")}}, Document{});
  assert(HasError(report, f::kDor, "INVALID_ENUM_VALUE"));

  report = validator.Validate(Document{{f::kHasPlan, std::string("yes")}}, Document{});
  assert(HasError(report, f::kHasPlan, "INVALID_TYPE"));
}

void TestActualizedEquipmentRules() {
  ForecastRuleValidator validator;
  auto                  current = forecast::testing::EquipmentDoc("Acme", 100.0);
  current[f::kIsActualized]     = true;
  current[f::kActualStart]      = Timestamp{1000};

  auto report = validator.Validate(Document{{f::kActualStart, Timestamp{2000}}}, current);
  assert(HasError(report, f::kActualStart, "BUSINESS_RULE_VIOLATION"));

  // Moving it earlier is allowed.
  assert(validator.Validate(Document{{f::kActualStart, Timestamp{500}}}, current).Valid());

  report = validator.Validate(Document{{f::kSource, std::string("Purchase")}, {f::kPurchasePrice, 10.0}}, current);
  assert(HasError(report, f::kSource, "BUSINESS_RULE_VIOLATION"));
}

void TestDiscontinuedEquipmentCannotBeReactivated() {
  ForecastRuleValidator validator;
  Document              current{{f::kIsDiscontinued, true}};

  auto report = validator.Validate(Document{{f::kIsDiscontinued, false}}, current);
  assert(HasError(report, f::kIsDiscontinued, "BUSINESS_RULE_VIOLATION"));

  assert(validator.Validate(Document{{f::kIsDiscontinued, false}}, Document{}).Valid());
}

void TestEveryErrorIsReported() {
  ForecastRuleValidator validator;
  const Document        delta{{f::kMonthlyRate, -5.0}, {f::kDor, std::string("X")}, {f::kHasActuals, 1.0}};

  const auto report = validator.Validate(delta, Document{});
  assert(report.errors.size() == 3);
}

} // namespace

int main() {
  TestValidDeltaPasses();
  TestDateOrderUsesMergedDocument();
  TestDateFieldsMustBeTimestamps();
  TestSourceRequiresMatchingAmount();
  TestAmountsAndEnums();
  TestActualizedEquipmentRules();
  TestDiscontinuedEquipmentCannotBeReactivated();
  TestEveryErrorIsReported();

  std::cout << "validation_test: pass\n";
  return 0;
}
