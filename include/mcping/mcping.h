#pragma once

/**
 * mcping — status ping client for Java edition game servers.
 *
 *   #include <mcping/mcping.h>
 *
 *   asio::ip::tcp::socket socket(io);
 *   asio::connect(socket, resolver.resolve(host, "25565"));
 *   mcping::Pong pong = mcping::ping(socket, host, 25565);
 */

#include "mcping/network/ping.h"
#include "mcping/network/ping_options.h"
#include "mcping/protocol/error.h"
#include "mcping/status/pong.h"
