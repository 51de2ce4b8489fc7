#pragma once

#include <memory>

namespace forecast::core {
class MirrorStore;
class DeltaManager;
class ConflictResolver;
} // namespace forecast::core
namespace forecast::sync {
class SyncWorker;
}
namespace forecast::retention {
class RetentionManager;
}
namespace forecast::runtime {
class JobScheduler;
}

namespace forecast::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<core::MirrorStore>           mirrors;
  std::shared_ptr<core::DeltaManager>          deltas;
  std::shared_ptr<core::ConflictResolver>      resolver;
  std::shared_ptr<sync::SyncWorker>            sync_worker;
  std::shared_ptr<retention::RetentionManager> retention;
  std::shared_ptr<runtime::JobScheduler>       scheduler;
};

} // namespace forecast::service
