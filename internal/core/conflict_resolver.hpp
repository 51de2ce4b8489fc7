#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/validator.hpp"

namespace forecast::core {

enum class ResolutionChoice {
  kKeepLocal,
  kKeepRemote,
  kManual,
};

struct FieldResolution {
  std::string      field;
  ResolutionChoice choice = ResolutionChoice::kKeepLocal;

  // Used only with kManual.
  model::FieldValue manual_value;
};

struct ResolutionOutcome {
  db::model::ModificationRecord modification;
  std::string                   entity_id;
};

/*
  Settles a modification parked in the conflict state.

  Every conflicting field needs exactly one decision. The modification is
  rebased on the newest version known for the row and re-enters the queue
  through draft -> committed. Every resolved field stays in the delta, a
  remote choice carrying the remote value, so the merged view shows the
  decision at once.
*/
class ConflictResolver {
 public:
  ConflictResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<validation::Validator> validator,
                   std::shared_ptr<util::TimeSource> clock);

  ResolutionOutcome ResolveConflicts(const std::string& organization_id, const std::string& modification_id,
                                     const std::vector<FieldResolution>& resolutions, const std::string& resolved_by);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<validation::Validator> validator_;
  std::shared_ptr<util::TimeSource>      clock_;
};

} // namespace forecast::core
