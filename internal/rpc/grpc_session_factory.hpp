#pragma once

#include "rpc_session.hpp"

namespace bolt::rpc {

class GrpcSessionFactory final : public SessionFactory {
 public:
  std::shared_ptr<RpcSession> Create(SessionKind kind) override;
};

} // namespace bolt::rpc
