#pragma once

#include "market/v1/worker.pb.h"
#include "market/v1/auction.pb.h"
#include "market/v1/ledger.pb.h"
#include "market/v1/allocation.pb.h"
#include "market/v1/admin.pb.h"

#include "market/services/v1/market_discovery_service.pb.h"
#include "market/services/v1/market_auction_service.pb.h"
#include "market/services/v1/market_ledger_service.pb.h"
#include "market/services/v1/market_allocation_service.pb.h"
#include "market/services/v1/market_admin_service.pb.h"

#include "market/services/v1/market_discovery_service.grpc.pb.h"
#include "market/services/v1/market_auction_service.grpc.pb.h"
#include "market/services/v1/market_ledger_service.grpc.pb.h"
#include "market/services/v1/market_allocation_service.grpc.pb.h"
#include "market/services/v1/market_admin_service.grpc.pb.h"

namespace market::v1 {
using namespace ::market::services::v1;
}
