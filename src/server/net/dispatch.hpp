// SPDX-License-Identifier: Apache-2.0
// dispatch.hpp - Maps one ClientRequest onto lobby / world calls.
#pragma once

#include "arena.pb.h"
#include "server/lobby/lobby.hpp"

#include <cstddef>

namespace arena::net {

inline constexpr size_t kMaxNameBytes = 64;

// Builds the response for `req`; failures are reported as an Error body, never
// thrown. The response always echoes req.request_id().
arena::ServerResponse handle_request(lobby::Lobby &lobby, const arena::ClientRequest &req);

} // namespace arena::net
