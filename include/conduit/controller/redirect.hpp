#pragma once

#include <string>
#include <string_view>

#include "conduit/core/context.hpp"

namespace conduit {

// ============================================================================
// Redirect target
// ============================================================================

/// Where a redirect goes. The kind is chosen by the caller, never guessed
/// from the string: To::internal("/posts") or To::external("https://...").
class To {
public:
    enum class Kind { Internal, External };

private:
    Kind kind_;
    std::string target_;

    To(Kind kind, std::string target) : kind_(kind), target_(std::move(target)) {}

public:
    static To internal(std::string path) { return To(Kind::Internal, std::move(path)); }
    static To external(std::string url) { return To(Kind::External, std::move(url)); }

    Kind kind() const noexcept { return kind_; }
    const std::string& target() const noexcept { return target_; }
};

/// Sets status 302 (unless a status is already set) and the location header,
/// then commits an empty body.
///
/// Throws MisusedRedirect when an internal target is not a path ("//host" and
/// "https://..." included) or an external target has no scheme; DoubleCommit
/// when ctx is already committed.
void redirect(Context& ctx, const To& to);

// ============================================================================
// Status helpers
// ============================================================================

// Accepted as-is; checked against the status table at commit
inline void put_status(Context& ctx, int code) { ctx.put_status(code); }
inline void put_status(Context& ctx, std::string_view name) { ctx.put_status(name); }

// Stops the remaining stages; nothing is sent
inline void halt(Context& ctx) noexcept { ctx.halt(); }

} // namespace conduit
