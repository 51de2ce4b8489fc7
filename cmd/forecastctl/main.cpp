#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "forecast/sync/v1.hpp"
#include "forecast/sync/v1/mirror_service.grpc.pb.h"
#include "forecast/sync/v1/sync_admin_service.grpc.pb.h"

using namespace forecast::sync::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  forecastctl <addr> views <org> [user]\n"
            << "  forecastctl <addr> count <org>\n"
            << "  forecastctl <addr> save <org> <user> <entity> <field=value>...\n"
            << "  forecastctl <addr> commit <org> <user> [entity...]\n"
            << "  forecastctl <addr> discard <org> <user> [entity...]\n"
            << "  forecastctl <addr> drafts <org> <user>\n"
            << "  forecastctl <addr> history <org> <entity>\n"
            << "  forecastctl <addr> mirror-history <org> <entity>\n"
            << "  forecastctl <addr> promote <org> <entity> <field=value>...\n"
            << "  forecastctl <addr> sync\n"
            << "  forecastctl <addr> status <org>\n"
            << "  forecastctl <addr> conflicts <org>\n"
            << "  forecastctl <addr> resolve <org> <modification_id> <field=local|remote>...\n"
            << "  forecastctl <addr> requeue <org> [modification_id...]\n"
            << "  forecastctl <addr> retention [dry-run]\n"
            << "  forecastctl <addr> retention-stats\n"
            << "  forecastctl <addr> jobs\n"
            << "  forecastctl <addr> enable|disable <job>\n";
}

// `null`, booleans and numbers are typed; anything else is a string.
static FieldValue ParseValue(const std::string& text) {
  FieldValue value;
  if (text == "null") {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
  } else {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end && *end == '\0') {
      value.set_number_value(number);
    } else {
      value.set_string_value(text);
    }
  }
  return value;
}

static std::optional<std::pair<std::string, std::string>> SplitAssignment(const std::string& arg) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) return std::nullopt;
  return std::make_pair(arg.substr(0, eq), arg.substr(eq + 1));
}

static bool ParseDocument(int argc, char** argv, int first, Document* doc) {
  for (int i = first; i < argc; ++i) {
    auto assignment = SplitAssignment(argv[i]);
    if (!assignment) {
      std::cerr << "expected field=value, got '" << argv[i] << "'\n";
      return false;
    }
    (*doc->mutable_fields())[assignment->first] = ParseValue(assignment->second);
  }
  return true;
}

static void Print(const google::protobuf::Message& message) {
  std::string                                 json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Finish(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  Print(resp);
  return 0;
}

static DraftSelector MakeSelector(int argc, char** argv) {
  DraftSelector selector;
  selector.set_organization_id(argv[3]);
  selector.set_user_id(argv[4]);
  for (int i = 5; i < argc; ++i) selector.add_entity_ids(argv[i]);
  return selector;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto mirror_stub = ForecastMirrorService::NewStub(channel);
  auto admin_stub  = SyncAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Mirror service
  // ------------------------------------------------------------

  if (cmd == "views") {
    if (argc < 4) return 1;

    GetMergedViewsRequest req;
    req.set_organization_id(argv[3]);
    if (argc >= 5) req.set_user_id(argv[4]);

    GetMergedViewsResponse resp;
    return Finish(mirror_stub->GetMergedViews(&ctx, req, &resp), resp);
  }

  if (cmd == "count") {
    if (argc < 4) return 1;

    GetCountRequest req;
    req.set_organization_id(argv[3]);

    GetCountResponse resp;
    return Finish(mirror_stub->GetCount(&ctx, req, &resp), resp);
  }

  if (cmd == "save") {
    if (argc < 7) return 1;

    SaveDraftRequest req;
    req.set_organization_id(argv[3]);
    req.set_user_id(argv[4]);
    req.set_entity_id(argv[5]);
    if (!ParseDocument(argc, argv, 6, req.mutable_delta())) return 1;

    SaveDraftResponse resp;
    return Finish(mirror_stub->SaveDraft(&ctx, req, &resp), resp);
  }

  if (cmd == "commit") {
    if (argc < 5) return 1;

    CommitDraftsRequest req;
    *req.mutable_selector() = MakeSelector(argc, argv);

    CommitDraftsResponse resp;
    return Finish(mirror_stub->CommitDrafts(&ctx, req, &resp), resp);
  }

  if (cmd == "discard") {
    if (argc < 5) return 1;

    DiscardDraftsRequest req;
    *req.mutable_selector() = MakeSelector(argc, argv);

    DiscardDraftsResponse resp;
    return Finish(mirror_stub->DiscardDrafts(&ctx, req, &resp), resp);
  }

  if (cmd == "drafts") {
    if (argc < 5) return 1;

    GetDraftCountRequest req;
    req.set_organization_id(argv[3]);
    req.set_user_id(argv[4]);

    GetDraftCountResponse resp;
    return Finish(mirror_stub->GetDraftCount(&ctx, req, &resp), resp);
  }

  if (cmd == "history") {
    if (argc < 5) return 1;

    GetModificationHistoryRequest req;
    req.set_organization_id(argv[3]);
    req.set_entity_id(argv[4]);

    GetModificationHistoryResponse resp;
    return Finish(mirror_stub->GetModificationHistory(&ctx, req, &resp), resp);
  }

  if (cmd == "mirror-history") {
    if (argc < 5) return 1;

    GetMirrorHistoryRequest req;
    req.set_organization_id(argv[3]);
    req.set_entity_id(argv[4]);

    GetMirrorHistoryResponse resp;
    return Finish(mirror_stub->GetMirrorHistory(&ctx, req, &resp), resp);
  }

  if (cmd == "promote") {
    if (argc < 6) return 1;

    PromoteMirrorRequest req;
    req.set_organization_id(argv[3]);
    req.set_entity_id(argv[4]);
    req.set_changed_by("forecastctl");
    if (!ParseDocument(argc, argv, 5, req.mutable_document())) return 1;

    PromoteMirrorResponse resp;
    return Finish(mirror_stub->PromoteMirror(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Sync admin service
  // ------------------------------------------------------------

  if (cmd == "sync") {
    RunSyncCycleRequest  req;
    RunSyncCycleResponse resp;
    return Finish(admin_stub->RunSyncCycle(&ctx, req, &resp), resp);
  }

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetSyncStatusRequest req;
    req.set_organization_id(argv[3]);

    GetSyncStatusResponse resp;
    return Finish(admin_stub->GetSyncStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "conflicts") {
    if (argc < 4) return 1;

    ListConflictsRequest req;
    req.set_organization_id(argv[3]);

    ListConflictsResponse resp;
    return Finish(admin_stub->ListConflicts(&ctx, req, &resp), resp);
  }

  if (cmd == "resolve") {
    if (argc < 6) return 1;

    ResolveConflictsRequest req;
    req.set_organization_id(argv[3]);
    req.set_modification_id(argv[4]);
    req.set_resolved_by("forecastctl");
    for (int i = 5; i < argc; ++i) {
      auto assignment = SplitAssignment(argv[i]);
      if (!assignment) {
        std::cerr << "expected field=local|remote, got '" << argv[i] << "'\n";
        return 1;
      }
      auto* resolution = req.add_resolutions();
      resolution->set_field(assignment->first);
      if (assignment->second == "local") {
        resolution->set_choice(RESOLUTION_CHOICE_KEEP_LOCAL);
      } else if (assignment->second == "remote") {
        resolution->set_choice(RESOLUTION_CHOICE_KEEP_REMOTE);
      } else {
        resolution->set_choice(RESOLUTION_CHOICE_MANUAL);
        *resolution->mutable_manual_value() = ParseValue(assignment->second);
      }
    }

    ResolveConflictsResponse resp;
    return Finish(admin_stub->ResolveConflicts(&ctx, req, &resp), resp);
  }

  if (cmd == "requeue") {
    if (argc < 4) return 1;

    RequeueFailedRequest req;
    req.set_organization_id(argv[3]);
    for (int i = 4; i < argc; ++i) req.add_modification_ids(argv[i]);

    RequeueFailedResponse resp;
    return Finish(admin_stub->RequeueFailed(&ctx, req, &resp), resp);
  }

  if (cmd == "retention") {
    RunRetentionRequest req;
    req.set_dry_run(argc >= 4 && std::string(argv[3]) == "dry-run");

    RunRetentionResponse resp;
    return Finish(admin_stub->RunRetention(&ctx, req, &resp), resp);
  }

  if (cmd == "retention-stats") {
    GetRetentionStatsRequest  req;
    GetRetentionStatsResponse resp;
    return Finish(admin_stub->GetRetentionStats(&ctx, req, &resp), resp);
  }

  if (cmd == "jobs") {
    GetScheduleStatusRequest  req;
    GetScheduleStatusResponse resp;
    return Finish(admin_stub->GetScheduleStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "enable" || cmd == "disable") {
    if (argc < 4) return 1;

    SetJobEnabledRequest req;
    req.set_name(argv[3]);
    req.set_enabled(cmd == "enable");

    SetJobEnabledResponse resp;
    return Finish(admin_stub->SetJobEnabled(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
