#pragma once

#include "control_bridge.h"
#include "hub_context.h"
#include "http_router.h"

// Registers the hub's REST endpoints: audio stats, chime management and the local control-plane
// bridge (control, call, devices, announce, state)
void register_api_routes(HttpRouter& router, HubContext& ctx, ControlBridge& bridge);
