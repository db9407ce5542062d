#pragma once
// Version: server identity reported by initialize

#define NIYAMA_VERSION "1.4.0"
#define NIYAMA_PROTOCOL_VERSION "2024-11-05"
#define NIYAMA_SERVER_NAME "context-provider"
