#include "merge_engine.hpp"

namespace forecast::core {

MergedView MergeEngine::Overlay(const db::model::MirrorRecord& mirror, const db::model::ModificationRecord* delta) {
  MergedView view;
  view.mirror_id      = mirror.id;
  view.entity_id      = mirror.entity_id;
  view.mirror_version = mirror.version;

  if (!delta) {
    view.document            = mirror.document;
    view.last_modified_at_ms = mirror.updated_at_ms;
    return view;
  }

  view.document            = model::Merge(mirror.document, delta->delta);
  view.has_modification    = true;
  view.sync_state          = delta->sync_state;
  view.modification_id     = delta->id;
  view.modified_by         = delta->user_id;
  view.last_modified_at_ms = delta->updated_at_ms;
  view.modified_fields     = delta->modified_fields;
  return view;
}

std::unordered_map<std::string, const db::model::ModificationRecord*> MergeEngine::SelectOverlays(
    const std::vector<db::model::ModificationRecord>& active) {
  std::unordered_map<std::string, const db::model::ModificationRecord*> chosen;
  for (const auto& mod : active) {
    if (!model::IsActive(mod.sync_state)) continue;

    auto& slot = chosen[mod.mirror_id];
    if (!slot || mod.updated_at_ms > slot->updated_at_ms || (mod.updated_at_ms == slot->updated_at_ms && mod.id > slot->id)) {
      slot = &mod;
    }
  }
  return chosen;
}

std::vector<MergedView> MergeEngine::Build(const std::vector<db::model::MirrorRecord>& mirrors,
                                           const std::vector<db::model::ModificationRecord>& active) {
  const auto overlays = SelectOverlays(active);

  std::vector<MergedView> views;
  views.reserve(mirrors.size());
  for (const auto& mirror : mirrors) {
    auto it = overlays.find(mirror.id);
    views.push_back(Overlay(mirror, it == overlays.end() ? nullptr : it->second));
  }
  return views;
}

} // namespace forecast::core
