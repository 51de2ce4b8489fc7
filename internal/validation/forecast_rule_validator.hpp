#pragma once

#include "internal/validation/validator.hpp"

namespace forecast::validation {

/*
  Forecast record rules:
    - forecast / original / actual start must not be after the matching end
    - source is Rental or Purchase, dor is BEO or PROJECT
    - Rental needs a monthlyRate, Purchase a purchasePrice; both non-negative
    - status flags are booleans
    - actualized records keep their source and never move actualStart
      forward; discontinued records stay discontinued
*/
class ForecastRuleValidator final : public Validator {
 public:
  ValidationReport Validate(const model::Document& delta, const model::Document& current) const override;
};

} // namespace forecast::validation
