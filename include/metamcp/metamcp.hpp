#pragma once

/// Umbrella header for the metamcp tool-invocation library.
/// The HTTP front-end lives in a separate target; include
/// "http_frontend.hpp" directly to use it.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
#include "types.hpp"
#include "tools.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "router.hpp"
#include "process.hpp"
#include "executor.hpp"
#include "supervisor.hpp"
#include "sessions.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "client.hpp"
#include "client_session.hpp"
#include "shutdown.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
