#pragma once

/// Umbrella header for the echotest fixture library.

#include "version.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tools.hpp"
#include "router.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/stream_transport.hpp"
