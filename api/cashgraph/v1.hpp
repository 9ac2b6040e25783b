#pragma once

#include "cashgraph/core/v1/types.pb.h"
#include "cashgraph/services/v1/ledger_service.pb.h"

namespace cashgraph::v1 {
using namespace ::cashgraph::core::v1;
using namespace ::cashgraph::services::v1;
}
