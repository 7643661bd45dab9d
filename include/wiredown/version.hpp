#pragma once

#define WD_VERSION_MAJOR 0
#define WD_VERSION_MINOR 3
#define WD_VERSION_PATCH 0

#define WD_VERSION_STRING "0.3.0"

// Sent as User-Agent on the WebSocket upgrade and on login requests
#define WD_USER_AGENT "wiredown/" WD_VERSION_STRING
