#include "conduit/core/finalizer.hpp"

#include "conduit/core/error.hpp"
#include "conduit/core/logging.hpp"
#include "conduit/core/status.hpp"

#include <variant>

namespace conduit {

namespace {

int validated_status(const Context& ctx) {
    const auto& raw = ctx.raw_status();
    if (!raw) {
        return 200;
    }
    if (const int* code = std::get_if<int>(&*raw)) {
        if (!is_known_status(*code)) {
            throw ConduitError(Error::invalid_status(std::to_string(*code)));
        }
        return *code;
    }
    const auto& name = std::get<std::string>(*raw);
    auto code = status_from_name(name);
    if (!code) {
        throw ConduitError(Error::invalid_status(name));
    }
    return *code;
}

} // anonymous namespace

void commit(Context& ctx, std::string body) {
    ctx.ensure_open("send a response");

    ctx.status_ = validated_status(ctx);
    ctx.resp_body_ = std::move(body);

    auto callbacks = std::move(ctx.before_send_);
    ctx.before_send_.clear();
    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
        (*it)(ctx);
    }

    // Callbacks may have changed the status
    ctx.status_ = validated_status(ctx);
    ctx.put_resp_header("content-length", std::to_string(ctx.resp_body_.size()));
    ctx.committed_ = true;

    auto& logger = default_logger();
    if (logger.is_enabled(LogLevel::Debug)) {
        auto entry = logger.entry(LogLevel::Debug, "Committed response");
        entry.field("status", std::get<int>(*ctx.status_))
             .field("bytes", ctx.resp_body_.size())
             .field("action", ctx.action());
        logger.log(entry);
    }
}

void send_resp(Context& ctx, int status, std::string body) {
    ctx.put_status(status);
    commit(ctx, std::move(body));
}

Response to_response(const Context& ctx) {
    if (!ctx.committed()) {
        throw ConduitError(ErrorCode::NoResponse,
                           "action \"" + ctx.action() + "\" finished without sending a response");
    }
    return Response(ctx.status().value_or(200), ctx.resp_headers(), std::string(ctx.resp_body()));
}

} // namespace conduit
