#include "pathguard/symlink_resolver.hpp"
#include "pathguard/allowed_checker.hpp"
#include "pathguard/platform.hpp"

#include <cctype>
#include <optional>
#include <set>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

Result<void> charge(ResolutionRequest* request) {
    if (!request) {
        return Result<void>::ok();
    }
    return request->charge_op();
}

bool is_absolute_target(const std::string& target, const PathPolicy& policy) {
    if (!target.empty() && target[0] == '/') return true;
    return policy.is_windows() && target.size() >= 3 &&
           std::isalpha(static_cast<unsigned char>(target[0])) &&
           target[1] == ':' && target[2] == '/';
}

std::string absolutize_target(const std::string& link, const std::string& raw_target,
                              const PathPolicy& policy) {
    std::string target = to_portable_path(raw_target);
    if (is_absolute_target(target, policy)) {
        return lexically_normalize(target);
    }
    return lexically_normalize(get_parent_directory(link) + "/" + target);
}

struct ChainWalk {
    bool loop = false;
    std::vector<std::string> chain;  // ends with the revisited path when loop is set
};

// Follow the chain with readlink alone for at most `budget` hops. Existence
// is never consulted. The walk ends quietly at the first path that cannot be
// read as a link.
Result<ChainWalk> walk_chain(const std::string& start, int budget,
                             ResolutionRequest* request, const PathPolicy& policy) {
    ChainWalk walk;
    std::set<std::string> seen;
    std::string current = start;

    for (int step = 0; step <= budget; ++step) {
        if (seen.count(current)) {
            walk.chain.push_back(current);
            walk.loop = true;
            return Result<ChainWalk>::ok(walk);
        }
        if (step == budget) {
            break;
        }
        walk.chain.push_back(current);
        seen.insert(current);

        if (auto charged = charge(request); charged.isErr()) {
            return Result<ChainWalk>::err(charged.error());
        }
        auto link = read_symlink(current);
        if (!link.ok) {
            break;
        }

        auto next = normalize(absolutize_target(current, link.target, policy));
        if (next.isErr()) {
            break;
        }
        current = next.value().str();
    }

    walk.chain.clear();
    return Result<ChainWalk>::ok(walk);
}

SecurityErrorContext hop_context(const std::string& path, const std::vector<std::string>& visited,
                                 int depth, int max_depth) {
    SecurityErrorContext ctx;
    ctx.path = path;
    ctx.chain = visited;
    ctx.depth = depth;
    ctx.max_depth = max_depth;
    return ctx;
}

} // namespace

Result<NormalizedPath> resolve_symlink(const std::string& path,
                                       int max_depth,
                                       const std::vector<std::string>& allowed_dirs,
                                       ResolutionRequest* request,
                                       const PathPolicy& policy) {
    ResolveState state = ResolveState::CheckDepth;
    std::string current = path;
    std::optional<NormalizedPath> normalized;
    std::optional<NormalizedPath> target;
    std::string raw_target;
    std::string absolute_target;
    std::vector<std::string> visited;
    int depth = 0;

    while (true) {
        spdlog::debug("resolve {} [{}] depth {}", current, resolve_state_to_string(state), depth);

        switch (state) {
            case ResolveState::CheckDepth: {
                if (depth >= max_depth) {
                    spdlog::warn("Maximum symlink depth exceeded: {} (depth {}, max {})",
                                 path, depth, max_depth);
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_MAX_DEPTH,
                        "Symlink security violation: maximum depth exceeded",
                        hop_context(path, visited, depth, max_depth)));
                }
                state = ResolveState::Normalize;
                break;
            }

            case ResolveState::Normalize: {
                auto n = normalize(current);
                if (n.isErr()) {
                    SecurityError error = n.error();
                    error.context().chain = visited;
                    return Result<NormalizedPath>::err(error);
                }
                normalized = n.value();
                state = ResolveState::CheckIsSymlink;
                break;
            }

            case ResolveState::CheckIsSymlink: {
                if (auto charged = charge(request); charged.isErr()) {
                    return Result<NormalizedPath>::err(charged.error());
                }
                if (!is_symlink(normalized->str())) {
                    state = ResolveState::Done;
                } else {
                    visited.push_back(normalized->str());
                    state = ResolveState::CheckLoop;
                }
                break;
            }

            case ResolveState::CheckLoop: {
                auto walk = walk_chain(normalized->str(), max_depth - depth, request, policy);
                if (walk.isErr()) {
                    return Result<NormalizedPath>::err(walk.error());
                }
                if (walk.value().loop) {
                    spdlog::warn("Symlink loop detected starting at {}", path);
                    SecurityErrorContext ctx = hop_context(path, walk.value().chain, depth, -1);
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_LOOP,
                        "Symlink security violation: loop detected",
                        std::move(ctx)));
                }
                state = ResolveState::ReadTarget;
                break;
            }

            case ResolveState::ReadTarget: {
                if (auto charged = charge(request); charged.isErr()) {
                    return Result<NormalizedPath>::err(charged.error());
                }
                auto link = read_symlink(normalized->str());
                if (!link.ok) {
                    SecurityErrorContext ctx = hop_context(path, visited, depth, -1);
                    ctx.source = normalized->str();
                    ctx.detail = link.error;
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_ERROR,
                        "Symlink security violation: failed to resolve symlink - " + link.error,
                        std::move(ctx)));
                }
                raw_target = link.target;
                absolute_target = absolutize_target(normalized->str(), raw_target, policy);
                state = ResolveState::PlatformValidate;
                break;
            }

            case ResolveState::PlatformValidate: {
                auto hazard = policy.validate(raw_target);
                if (!hazard) {
                    hazard = policy.validate(absolute_target);
                }
                if (hazard) {
                    spdlog::warn("Symlink target rejected by {} rules: {} -> {} ({})",
                                 policy.name(), normalized->str(), raw_target, *hazard);
                    SecurityErrorContext ctx = hop_context(path, visited, depth, -1);
                    ctx.source = normalized->str();
                    ctx.target = raw_target;
                    ctx.detail = *hazard;
                    ctx.windows_specific = policy.is_windows();
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_ERROR,
                        "Symlink security violation: " + *hazard,
                        std::move(ctx)));
                }

                auto n = normalize(absolute_target);
                if (n.isErr()) {
                    SecurityError error = n.error();
                    error.context().source = normalized->str();
                    error.context().target = absolute_target;
                    error.context().chain = visited;
                    return Result<NormalizedPath>::err(error);
                }
                target = n.value();
                state = ResolveState::CheckExists;
                break;
            }

            case ResolveState::CheckExists: {
                if (auto charged = charge(request); charged.isErr()) {
                    return Result<NormalizedPath>::err(charged.error());
                }
                if (!path_exists(target->str())) {
                    spdlog::debug("Broken symlink: {} -> {}", normalized->str(), target->str());
                    SecurityErrorContext ctx = hop_context(path, visited, depth, -1);
                    ctx.source = normalized->str();
                    ctx.target = target->str();
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_BROKEN,
                        "Symlink security violation: broken symlink target '" +
                            target->str() + "' does not exist",
                        std::move(ctx)));
                }
                state = ResolveState::CheckAllowed;
                break;
            }

            case ResolveState::CheckAllowed: {
                if (auto charged = charge(request); charged.isErr()) {
                    return Result<NormalizedPath>::err(charged.error());
                }
                if (!is_path_in_allowed_dirs(target->str(), allowed_dirs,
                                             policy.is_case_insensitive())) {
                    spdlog::warn("Symlink target not allowed: {} -> {}",
                                 normalized->str(), target->str());
                    SecurityErrorContext ctx = hop_context(path, visited, depth, -1);
                    ctx.source = normalized->str();
                    ctx.target = target->str();
                    ctx.allowed_dirs = allowed_dirs;
                    return Result<NormalizedPath>::err(SecurityError(
                        SecurityReason::SYMLINK_TARGET_NOT_ALLOWED,
                        "Symlink security violation: target not allowed",
                        std::move(ctx)));
                }
                state = ResolveState::Recurse;
                break;
            }

            case ResolveState::Recurse: {
                current = target->str();
                depth++;
                state = ResolveState::CheckDepth;
                break;
            }

            case ResolveState::Done:
                return Result<NormalizedPath>::ok(*normalized);
        }
    }
}

} // namespace pathguard
