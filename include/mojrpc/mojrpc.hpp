#pragma once

/// Umbrella header for the mojrpc JSON-RPC dispatch library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "error_shaper.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"
#include "dispatcher.hpp"
#include "batch.hpp"
#include "service.hpp"
#include "transport/http_server.hpp"
#include "transport/upstream.hpp"
