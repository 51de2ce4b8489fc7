#pragma once

#include <vector>

#include "internal/model/document.hpp"
#include "internal/util/errors.hpp"

namespace forecast::validation {

struct ValidationReport {
  std::vector<util::FieldError> errors;

  bool Valid() const {
    return errors.empty();
  }
};

/*
  Gate every delta passes before it is stored or committed.

  `current` is the mirror document the delta will be overlaid on. Only
  fields present in `delta` are judged; values already in `current` are
  context.
*/
class Validator {
 public:
  virtual ~Validator() = default;

  virtual ValidationReport Validate(const model::Document& delta, const model::Document& current) const = 0;
};

} // namespace forecast::validation
