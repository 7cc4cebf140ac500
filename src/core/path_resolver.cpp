/**
 * @file path_resolver.cpp
 * @brief Implementation of destination naming and conflict checks
 */

#include <kcenon/file_move/core/path_resolver.h>
#include <kcenon/file_move/core/logging.h>

#include <system_error>

namespace kcenon::file_move {

namespace {

/**
 * @brief Last name component of a path, ignoring trailing separators
 */
auto source_name(const std::filesystem::path& source) -> std::filesystem::path {
    auto path = source;
    while (!path.empty() && path.filename().empty() && path != path.root_path()) {
        path = path.parent_path();
    }

    auto name = path.filename();
    if (name.empty() || name == "." || name == "..") {
        return {};
    }
    return name;
}

/**
 * @brief Check whether candidate equals base or lies beneath it
 *
 * Both paths are made absolute first, so "photos" and "./photos/" compare
 * equal.
 */
auto is_within(const std::filesystem::path& base, const std::filesystem::path& candidate)
    -> bool {
    auto absolute = [](const std::filesystem::path& path, std::error_code& ec) {
        auto out = std::filesystem::weakly_canonical(path, ec).lexically_normal();
        if (out.has_relative_path() && out.filename().empty()) {
            out = out.parent_path();
        }
        return out;
    };

    std::error_code ec;
    auto base_abs = absolute(base, ec);
    if (ec) return false;
    auto candidate_abs = absolute(candidate, ec);
    if (ec) return false;

    auto cand_it = candidate_abs.begin();
    for (const auto& part : base_abs) {
        if (cand_it == candidate_abs.end() || *cand_it != part) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

}  // namespace

auto path_resolver::has_trailing_separator(const std::filesystem::path& path) -> bool {
    const auto& native = path.native();
    return !native.empty() && native.back() == std::filesystem::path::preferred_separator;
}

auto path_resolver::target_path(const std::filesystem::path& source,
                                const std::filesystem::path& destination)
    -> result<std::filesystem::path> {
    // Directories are merged into the destination as given
    if (kind_of(source) == entry_kind::directory) {
        return destination;
    }

    auto dest_kind = kind_of(destination);
    bool into_directory = dest_kind == entry_kind::directory ||
                          (dest_kind == entry_kind::missing &&
                           has_trailing_separator(destination));
    if (!into_directory) {
        return destination;
    }

    auto name = source_name(source);
    if (name.empty()) {
        return unexpected(error{error_code::cannot_derive_name,
                                "Cannot get file name from " + quoted(source)});
    }
    return destination / name;
}

auto path_resolver::resolve(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            bool force) -> result<resolved_destination> {
    FM_LOG_TRACE(log_category::resolver,
                 "resolve(" + quoted(source) + ", " + quoted(destination) +
                     ", force=" + (force ? "true" : "false") + ")");

    auto source_kind = kind_of(source);
    if (source_kind == entry_kind::missing) {
        return unexpected(error{error_code::source_not_found,
                                "Source " + quoted(source) + " does not exist"});
    }

    auto target = target_path(source, destination);
    if (!target) {
        return unexpected(target.error());
    }

    resolved_destination resolved;
    resolved.path = std::move(target.value());
    resolved.source_kind = source_kind;
    resolved.existing_kind = kind_of(resolved.path);

    if (source_kind == entry_kind::directory && is_within(source, resolved.path)) {
        return unexpected(error{error_code::destination_inside_source,
                                "Cannot transfer directory " + quoted(source) +
                                    " into itself (" + quoted(resolved.path) + ")"});
    }

    if (resolved.existing_kind == entry_kind::missing) {
        return resolved;
    }

    if (resolved.existing_kind != source_kind) {
        return unexpected(error{error_code::destination_kind_mismatch,
                                "Destination " + quoted(resolved.path) +
                                    " already exists and is not a " +
                                    std::string(to_string(source_kind))});
    }

    if (source_kind == entry_kind::file) {
        std::error_code ec;
        if (std::filesystem::equivalent(source, resolved.path, ec)) {
            return unexpected(error{error_code::same_file,
                                    quoted(source) + " and " + quoted(resolved.path) +
                                        " are the same file"});
        }

        if (!force) {
            return unexpected(error{error_code::destination_exists,
                                    "Destination " + quoted(resolved.path) +
                                        " already exists; use --force to overwrite"});
        }
    }

    return resolved;
}

}  // namespace kcenon::file_move
