#pragma once

#include "market/agent/v1/worker_agent_service.pb.h"
#include "market/agent/v1/execution_runtime_service.pb.h"
#include "market/agent/v1/reputation_service.pb.h"

#include "market/agent/v1/worker_agent_service.grpc.pb.h"
#include "market/agent/v1/execution_runtime_service.grpc.pb.h"
#include "market/agent/v1/reputation_service.grpc.pb.h"
