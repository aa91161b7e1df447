#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace audit::core {

/*
  Per-request state threaded through ingestion. Owned by the caller of
  a single request; nothing in the pipeline keeps it.
*/
struct RequestContext {
  std::string request_id;
  std::string caller;
  std::string route;

  uint64_t received_at_ms = 0;
};

inline RequestContext MakeRequestContext(std::string route, std::string caller = {}) {
  RequestContext ctx;
  ctx.request_id     = util::GenerateUUIDString();
  ctx.caller         = std::move(caller);
  ctx.route          = std::move(route);
  ctx.received_at_ms = util::NowMs();
  return ctx;
}

} // namespace audit::core
