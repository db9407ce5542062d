#pragma once
// Niyama: context rule store
//
// Named JSON context documents describing tool-specific syntax rules,
// auto-corrections and startup actions, served over JSON-RPC.

#include "version.hpp"
#include "types.hpp"
#include "config.hpp"
#include "document.hpp"
#include "validator.hpp"
#include "backup.hpp"
#include "memory_service.hpp"
#include "memory_client.hpp"
#include "audit.hpp"
#include "context_store.hpp"
#include "corrections.hpp"
#include "session.hpp"
#include "rpc/handler.hpp"
