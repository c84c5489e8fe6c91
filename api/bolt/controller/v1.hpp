#pragma once

// Presentation boundary service.
#include "bolt/controller/v1/controller_service.pb.h"
#include "bolt/controller/v1/controller_service.grpc.pb.h"

// Node RPC surface relayed through the controller.
#include "lnrpc/lightning.pb.h"
#include "lnrpc/lightning.grpc.pb.h"
