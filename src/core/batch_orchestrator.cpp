/**
 * @file batch_orchestrator.cpp
 * @brief Implementation of batch validation and sequencing
 */

#include <kcenon/file_move/core/batch_orchestrator.h>

#include <kcenon/file_move/core/cancellation.h>
#include <kcenon/file_move/core/logging.h>
#include <kcenon/file_move/core/path_resolver.h>

#include <algorithm>

namespace kcenon::file_move {

namespace {

auto count_sources(std::size_t count) -> std::string {
    return std::to_string(count) + (count == 1 ? " source" : " sources");
}

}  // namespace

auto render_tally(std::size_t count, transfer_mode mode) -> std::string {
    if (count == 0) {
        return {};
    }
    return count_sources(count) + " " + std::string(participle(mode));
}

batch_orchestrator::batch_orchestrator() : engine_(), merger_(engine_) {}

batch_orchestrator::batch_orchestrator(std::unique_ptr<file_primitives> primitives)
    : engine_(std::move(primitives)), merger_(engine_) {}

auto batch_orchestrator::validate(const std::vector<std::filesystem::path>& sources,
                                  const std::filesystem::path& dest) const
    -> result<std::vector<entry_kind>> {
    std::vector<entry_kind> kinds;
    kinds.reserve(sources.size());

    for (const auto& source : sources) {
        auto kind = kind_of(source);
        if (kind == entry_kind::missing) {
            return unexpected(error{error_code::source_not_found,
                                    "Source " + quoted(source) + " does not exist"});
        }
        if (kind == entry_kind::other) {
            return unexpected(error{error_code::invalid_source,
                                    "Source " + quoted(source) +
                                        " is neither a file nor a directory"});
        }
        kinds.push_back(kind);
    }

    if (sources.size() > 1) {
        bool uniform = std::all_of(kinds.begin(), kinds.end(),
                                   [&](entry_kind kind) { return kind == kinds.front(); });
        if (!uniform) {
            return unexpected(error{error_code::mixed_source_kinds,
                                    "Cannot mix files and directories in one batch"});
        }

        if (kind_of(dest) != entry_kind::directory) {
            return unexpected(error{error_code::multiple_sources_require_dir_dest,
                                    "Destination " + quoted(dest) +
                                        " must be an existing directory for " +
                                        count_sources(sources.size())});
        }
    }

    return kinds;
}

auto batch_orchestrator::dry_run(const std::vector<std::filesystem::path>& sources,
                                 const std::filesystem::path& dest,
                                 const transfer_context& ctx) const -> result<std::string> {
    for (const auto& source : sources) {
        auto target = path_resolver::target_path(source, dest);
        if (!target) {
            return unexpected(target.error());
        }
        FM_LOG_INFO(log_category::batch,
                    "Would " + std::string(to_string(ctx.mode)) + " " + quoted(source) +
                        " => " + quoted(target.value()));
    }

    return "dry run: " + count_sources(sources.size()) + " would be " +
           std::string(participle(ctx.mode));
}

auto batch_orchestrator::run_batch(const std::vector<std::filesystem::path>& sources,
                                   const std::filesystem::path& dest,
                                   const transfer_context& ctx) -> result<std::string> {
    FM_LOG_TRACE(log_category::batch,
                 "run_batch(" + std::to_string(sources.size()) + " source(s), " +
                     quoted(dest) + ", " + std::string(to_string(ctx.mode)) +
                     ", force=" + (ctx.force ? "true" : "false") +
                     ", dry_run=" + (ctx.dry_run ? "true" : "false") + ")");

    if (sources.empty()) {
        return std::string();
    }

    auto kinds = validate(sources, dest);
    if (!kinds) {
        return unexpected(kinds.error());
    }

    if (ctx.dry_run) {
        return dry_run(sources, dest, ctx);
    }

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];

        if (ctx.cancellation.is_set()) {
            terminate_on_cancellation(quoted(source));
        }

        auto resolved = path_resolver::resolve(source, dest, ctx.force);
        if (!resolved) {
            return unexpected(resolved.error());
        }

        auto outcome = kinds.value()[i] == entry_kind::directory
                           ? merger_.merge(source, resolved.value().path, ctx)
                           : engine_.transfer(
                                 transfer_request(source, resolved.value().path, ctx));
        if (!outcome) {
            return unexpected(outcome.error());
        }

        FM_LOG_INFO(log_category::batch, outcome.value().summary);
    }

    return render_tally(sources.size(), ctx.mode);
}

auto run_batch(const std::vector<std::filesystem::path>& sources,
               const std::filesystem::path& dest,
               const transfer_context& ctx) -> result<std::string> {
    batch_orchestrator batch;
    return batch.run_batch(sources, dest, ctx);
}

}  // namespace kcenon::file_move
