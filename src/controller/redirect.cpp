#include "conduit/controller/redirect.hpp"

#include "conduit/core/error.hpp"
#include "conduit/core/finalizer.hpp"

#include <cctype>

namespace conduit {

namespace {

// RFC 3986 scheme followed by ':'
bool has_scheme(std::string_view target) {
    auto colon = target.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(target[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(target[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

void check_internal(std::string_view target) {
    if (target.empty() || target.front() != '/') {
        throw ConduitError(Error::misused_redirect(target, "internal targets must be paths starting with \"/\""));
    }
    if (target.size() > 1 && (target[1] == '/' || target[1] == '\\')) {
        throw ConduitError(Error::misused_redirect(target, "use To::external for URLs with a host"));
    }
}

void check_external(std::string_view target) {
    if (!has_scheme(target)) {
        throw ConduitError(Error::misused_redirect(target, "external targets need a scheme; use To::internal for paths"));
    }
}

} // anonymous namespace

void redirect(Context& ctx, const To& to) {
    if (ctx.committed()) {
        throw ConduitError(Error::double_commit("redirect to \"" + to.target() + "\""));
    }

    if (to.kind() == To::Kind::Internal) {
        check_internal(to.target());
    } else {
        check_external(to.target());
    }

    if (!ctx.has_status()) {
        ctx.put_status(302);
    }
    ctx.put_resp_header("location", to.target());
    commit(ctx, "");
}

} // namespace conduit
