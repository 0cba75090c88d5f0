#pragma once

#include "vaultsync/core/v1/identity.pb.h"
#include "vaultsync/core/v1/record.pb.h"

#include "vaultsync/wire/v1/envelope.pb.h"

#include "vaultsync/services/v1/admin_service.pb.h"
#include "vaultsync/services/v1/peer_service.pb.h"
#include "vaultsync/services/v1/relay_service.pb.h"

namespace vaultsync::sync::v1 {
using namespace ::vaultsync::core::v1;
using namespace ::vaultsync::wire::v1;
using namespace ::vaultsync::services::v1;
}
