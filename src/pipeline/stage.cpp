#include "conduit/pipeline/stage.hpp"

#include <algorithm>

namespace conduit {

ActionGuard ActionGuard::only(std::vector<std::string> actions) {
    ActionGuard guard;
    guard.mode_ = Mode::Only;
    guard.actions_ = std::move(actions);
    return guard;
}

ActionGuard ActionGuard::except(std::vector<std::string> actions) {
    ActionGuard guard;
    guard.mode_ = Mode::Except;
    guard.actions_ = std::move(actions);
    return guard;
}

ActionGuard ActionGuard::when(std::function<bool(std::string_view)> predicate) {
    ActionGuard guard;
    guard.mode_ = Mode::Custom;
    guard.predicate_ = std::move(predicate);
    return guard;
}

bool ActionGuard::matches(std::string_view action) const {
    auto listed = [&] {
        return std::find(actions_.begin(), actions_.end(), action) != actions_.end();
    };

    switch (mode_) {
        case Mode::Always: return true;
        case Mode::Only: return listed();
        case Mode::Except: return !listed();
        case Mode::Custom: return predicate_ && predicate_(action);
    }
    return false;
}

} // namespace conduit
