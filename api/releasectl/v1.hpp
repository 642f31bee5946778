#pragma once

#include "releasectl/v1/release.pb.h"

#include "releasectl/admin/v1/admin_service.pb.h"
#include "releasectl/admin/v1/admin_service.grpc.pb.h"

namespace releasectl::api {
using namespace ::releasectl::v1;
using namespace ::releasectl::admin::v1;
}
