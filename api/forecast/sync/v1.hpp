#pragma once

#include "forecast/sync/v1/document.pb.h"
#include "forecast/sync/v1/types.pb.h"

#include "forecast/sync/v1/mirror_service.pb.h"
#include "forecast/sync/v1/sync_admin_service.pb.h"
