#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "conduit/core/flash.hpp"
#include "conduit/core/logging.hpp"
#include "conduit/core/session.hpp"
#include "conduit/pipeline/stage.hpp"

namespace conduit::stages {

// ============================================================================
// Built-in stages
// ============================================================================

/// Declares the formats the following stages may render and records the
/// negotiated one on the context. Never fails: an unacceptable request
/// format is refused by render() with UnsupportedFormat.
StageFn accepts(std::vector<std::string> formats);

// Layout for the rest of the request; nullopt disables it
StageFn put_layout(std::optional<std::string> layout);

/// Loads the session named by the request cookie, or starts a new one.
/// At commit a modified session is saved and a new non-empty one gets its
/// cookie; a dropped session is destroyed and its cookie expired.
StageFn fetch_session(std::shared_ptr<SessionStore> store, SessionOptions options = {});

/// Hydrates the flash from the session (requires fetch_session) and writes
/// the persisted snapshot back at commit.
StageFn fetch_flash(FlashOptions options = {});

/// Logs "<METHOD> <path> - Sent <status> in <ms>ms" once the response is
/// committed. logger must outlive the pipeline.
StageFn log_request(Logger& logger);
StageFn log_request();

} // namespace conduit::stages
