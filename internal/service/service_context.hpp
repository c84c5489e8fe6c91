#pragma once

#include <memory>

namespace bolt::coordinator { class LifecycleCoordinator; }
namespace bolt::relay { class MessageRelay; }

namespace bolt::service {

/*
  Dependency container shared by the boundary services.
*/
struct ServiceContext {
  std::shared_ptr<bolt::coordinator::LifecycleCoordinator> coordinator;
  std::shared_ptr<bolt::relay::MessageRelay> relay;
};

}
