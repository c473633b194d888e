#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/coro/task.hpp"

namespace conduit {

class Context;

// A stage transforms the context in place; it may halt or commit it.
using StageFn = std::function<Task<void>(Context&)>;

// ============================================================================
// ActionGuard - inclusion predicate over the resolved action name
// ============================================================================

class ActionGuard {
public:
    enum class Mode { Always, Only, Except, Custom };

private:
    Mode mode_ = Mode::Always;
    std::vector<std::string> actions_;
    std::function<bool(std::string_view)> predicate_;

public:
    ActionGuard() = default;

    static ActionGuard always() { return ActionGuard{}; }
    static ActionGuard only(std::vector<std::string> actions);
    static ActionGuard except(std::vector<std::string> actions);
    static ActionGuard when(std::function<bool(std::string_view)> predicate);

    bool matches(std::string_view action) const;

    Mode mode() const noexcept { return mode_; }

    // Names listed by only()/except(); checked against the action table on freeze
    const std::vector<std::string>& actions() const noexcept { return actions_; }
};

inline ActionGuard always() { return ActionGuard::always(); }

inline ActionGuard only(std::initializer_list<std::string> actions) {
    return ActionGuard::only(actions);
}

inline ActionGuard except(std::initializer_list<std::string> actions) {
    return ActionGuard::except(actions);
}

inline ActionGuard when(std::function<bool(std::string_view)> predicate) {
    return ActionGuard::when(std::move(predicate));
}

// ============================================================================
// Stage
// ============================================================================

struct Stage {
    std::string name;
    StageFn fn;
    ActionGuard guard;
};

} // namespace conduit
