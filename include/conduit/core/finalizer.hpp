#pragma once

#include <string>

#include "conduit/core/context.hpp"
#include "conduit/core/response.hpp"

namespace conduit {

// ============================================================================
// Response Finalizer
// ============================================================================

/// Commits the response held by ctx exactly once.
///
/// The status (200 when unset) is checked against the status table, the
/// before-send callbacks run last-registered first, then the body and
/// content-length are set and the context is sealed. Throws DoubleCommit if
/// ctx is already committed and InvalidStatus (leaving ctx uncommitted) for a
/// status outside the table.
void commit(Context& ctx, std::string body);

// put_status(status) followed by commit(body)
void send_resp(Context& ctx, int status, std::string body);

// Transport view of a committed context; throws NoResponse otherwise
Response to_response(const Context& ctx);

} // namespace conduit
