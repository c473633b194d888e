#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "conduit/coro/task.hpp"
#include "conduit/pipeline/stage.hpp"

namespace conduit {

// ============================================================================
// Pipeline - ordered stage chain of one controller
// ============================================================================

/// Built once while the controller is defined, then shared read-only by
/// every request routed to it. run() never mutates the pipeline.
class Pipeline {
    std::vector<Stage> stages_;

public:
    Pipeline() = default;

    // Appends a stage; throws std::invalid_argument for an empty function
    Pipeline& add(std::string name, StageFn fn, ActionGuard guard = ActionGuard::always());
    Pipeline& add(Stage stage);

    size_t size() const noexcept { return stages_.size(); }
    bool empty() const noexcept { return stages_.empty(); }
    const std::vector<Stage>& stages() const noexcept { return stages_; }
    bool contains(std::string_view name) const;

    /// Runs the stages whose guard matches action, in registration order.
    /// Stops after the stage that halts or commits ctx. Cancellation is
    /// checked before each stage and raises Cancelled; any error raised by a
    /// stage aborts the remaining stages and propagates.
    Task<void> run(Context& ctx, std::string action) const;
};

} // namespace conduit
