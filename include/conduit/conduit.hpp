#pragma once

// Main include file for conduit

// Core
#include "conduit/core/config.hpp"
#include "conduit/core/context.hpp"
#include "conduit/core/cookie.hpp"
#include "conduit/core/error.hpp"
#include "conduit/core/finalizer.hpp"
#include "conduit/core/flash.hpp"
#include "conduit/core/logging.hpp"
#include "conduit/core/mime.hpp"
#include "conduit/core/request.hpp"
#include "conduit/core/response.hpp"
#include "conduit/core/session.hpp"
#include "conduit/core/status.hpp"

// Coroutines
#include "conduit/coro/cancellation.hpp"
#include "conduit/coro/task.hpp"

// Pipeline
#include "conduit/pipeline/pipeline.hpp"
#include "conduit/pipeline/stage.hpp"
#include "conduit/pipeline/stages.hpp"

// View system
#include "conduit/view/inja_engine.hpp"
#include "conduit/view/render.hpp"
#include "conduit/view/template_engine.hpp"

// Controllers
#include "conduit/controller/controller.hpp"
#include "conduit/controller/endpoint.hpp"
#include "conduit/controller/redirect.hpp"

namespace conduit {

// Version info
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace conduit
