// SPDX-License-Identifier: Apache-2.0
#include "server/server_context.hpp"

#include "common/logger.hpp"

namespace arena {

bool ServerContext::teardown(const std::shared_ptr<net::Session> &s, std::string_view reason)
{
    if (!registry.disconnect(s))
        return false;
    if (!s->player_id.empty())
        inputs.erase(s->player_id);
    if (s->client)
        s->client->socket().shutdown();
    if (s->player_id.empty())
        arena::log::info("[conn] {} closed before join reason={}", s->connection_id, reason);
    else
        arena::log::info("[conn] {} player={} left reason={}", s->connection_id, s->player_id, reason);
    return true;
}

} // namespace arena
