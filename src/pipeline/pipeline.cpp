#include "conduit/pipeline/pipeline.hpp"

#include "conduit/core/context.hpp"
#include "conduit/core/error.hpp"
#include "conduit/core/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace conduit {

Pipeline& Pipeline::add(std::string name, StageFn fn, ActionGuard guard) {
    return add(Stage{std::move(name), std::move(fn), std::move(guard)});
}

Pipeline& Pipeline::add(Stage stage) {
    if (!stage.fn) {
        throw std::invalid_argument("stage \"" + stage.name + "\" has no function");
    }
    stages_.push_back(std::move(stage));
    return *this;
}

bool Pipeline::contains(std::string_view name) const {
    return std::any_of(stages_.begin(), stages_.end(),
                       [&](const Stage& s) { return s.name == name; });
}

Task<void> Pipeline::run(Context& ctx, std::string action) const {
    auto& logger = default_logger();

    for (const auto& stage : stages_) {
        if (ctx.halted() || ctx.committed()) {
            break;
        }
        if (ctx.is_cancelled()) {
            throw ConduitError(Error::cancelled());
        }

        if (!stage.guard.matches(action)) {
            if (logger.is_enabled(LogLevel::Trace)) {
                logger.log(logger.entry(LogLevel::Trace, "Skipped stage")
                               .field("stage", stage.name)
                               .field("action", action));
            }
            continue;
        }

        if (logger.is_enabled(LogLevel::Trace)) {
            logger.log(logger.entry(LogLevel::Trace, "Running stage")
                           .field("stage", stage.name)
                           .field("action", action));
        }
        co_await stage.fn(ctx);
    }
}

} // namespace conduit
