/**
 * @file directory_merger.cpp
 * @brief Implementation of the directory merge
 */

#include <kcenon/file_move/core/directory_merger.h>

#include <kcenon/file_move/core/cancellation.h>
#include <kcenon/file_move/core/logging.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <system_error>
#include <vector>

namespace kcenon::file_move {

namespace {

/**
 * @brief Entries of one directory in sorted path order
 */
auto sorted_entries(const std::filesystem::path& dir)
    -> result<std::vector<std::filesystem::path>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return unexpected(make_io_error("Cannot read directory", dir, ec));
    }

    std::vector<std::filesystem::path> entries;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return unexpected(make_io_error("Cannot read directory", dir, ec));
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

/**
 * @brief One directory level on the work stack
 */
struct merge_frame {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::vector<std::filesystem::path> entries;
    std::size_t next = 0;
    std::size_t depth = 0;
};

auto kind_mismatch(const std::filesystem::path& dest, entry_kind expected) -> error {
    return error{error_code::destination_kind_mismatch,
                 "Destination " + quoted(dest) + " already exists and is not a " +
                     std::string(to_string(expected))};
}

}  // namespace

directory_merger::directory_merger(transfer_engine& engine) : engine_(engine) {}

auto directory_merger::measure(const std::filesystem::path& dir) -> result<tree_size> {
    tree_size size;
    std::vector<std::filesystem::path> pending{dir};

    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();

        auto entries = sorted_entries(current);
        if (!entries) {
            return unexpected(entries.error());
        }

        for (auto& entry : entries.value()) {
            switch (kind_of(entry)) {
                case entry_kind::directory:
                    ++size.directory_count;
                    pending.push_back(std::move(entry));
                    break;
                case entry_kind::file: {
                    std::error_code ec;
                    auto bytes = std::filesystem::file_size(entry, ec);
                    if (ec) {
                        return unexpected(make_io_error("Cannot read size of", entry, ec));
                    }
                    size.total_bytes += bytes;
                    ++size.file_count;
                    break;
                }
                default:
                    return unexpected(error{error_code::invalid_source,
                                            "Unexpected entry type: " + quoted(entry)});
            }
        }
    }

    return size;
}

auto directory_merger::merge(const std::filesystem::path& src_dir,
                             const std::filesystem::path& dest_dir,
                             const transfer_context& ctx) -> result<transfer_outcome> {
    FM_LOG_TRACE(log_category::merger,
                 "merge(" + quoted(src_dir) + ", " + quoted(dest_dir) + ", " +
                     std::string(to_string(ctx.mode)) + ")");

    auto source_kind = kind_of(src_dir);
    if (source_kind == entry_kind::missing) {
        return unexpected(error{error_code::source_not_found,
                                "Source " + quoted(src_dir) + " does not exist"});
    }
    if (source_kind != entry_kind::directory) {
        return unexpected(error{error_code::source_wrong_type,
                                "Source " + quoted(src_dir) + " exists but is not a directory"});
    }

    auto dest_kind = kind_of(dest_dir);
    if (dest_kind != entry_kind::missing && dest_kind != entry_kind::directory) {
        return unexpected(kind_mismatch(dest_dir, entry_kind::directory));
    }

    auto size = measure(src_dir);
    if (!size) {
        return unexpected(size.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(dest_dir, ec);
    if (ec) {
        return unexpected(make_io_error("Cannot create directory", dest_dir, ec));
    }

    auto root_entries = sorted_entries(src_dir);
    if (!root_entries) {
        return unexpected(root_entries.error());
    }

    auto start = std::chrono::steady_clock::now();
    auto bar = ctx.progress.add(size.value().total_bytes, src_dir.filename().string());
    progress_cursor cursor(bar.get());

    auto fail = [&bar](error err) {
        bar->finish_and_clear();
        return unexpected(std::move(err));
    };

    std::vector<merge_frame> stack;
    stack.push_back(merge_frame{src_dir, dest_dir, std::move(root_entries.value()), 0, 0});

    while (!stack.empty()) {
        auto& frame = stack.back();

        if (frame.next == frame.entries.size()) {
            if (ctx.mode == transfer_mode::move) {
                std::filesystem::remove(frame.source, ec);
                if (ec) {
                    return fail(make_io_error("Cannot remove directory", frame.source, ec));
                }
                FM_LOG_DEBUG(log_category::merger,
                             "Removed empty directory: " + quoted(frame.source));
            }
            stack.pop_back();
            continue;
        }

        auto entry = frame.entries[frame.next++];
        auto target = frame.destination / entry.filename();
        auto depth = frame.depth;

        if (depth == 0 && ctx.cancellation.is_set()) {
            bar->finish_and_clear();
            terminate_on_cancellation(quoted(entry));
        }

        bar->set_message(entry.lexically_relative(src_dir).string());

        auto existing = kind_of(target);
        switch (kind_of(entry)) {
            case entry_kind::directory: {
                if (existing == entry_kind::missing) {
                    std::filesystem::create_directory(target, ec);
                    if (ec) {
                        return fail(make_io_error("Cannot create directory", target, ec));
                    }
                } else if (existing != entry_kind::directory) {
                    return fail(kind_mismatch(target, entry_kind::directory));
                }

                auto children = sorted_entries(entry);
                if (!children) {
                    return fail(children.error());
                }
                // frame is invalidated by the push
                stack.push_back(merge_frame{std::move(entry), std::move(target),
                                            std::move(children.value()), 0, depth + 1});
                break;
            }

            case entry_kind::file: {
                if (existing == entry_kind::file && !ctx.force) {
                    return fail(error{error_code::destination_exists,
                                      "Destination " + quoted(target) +
                                          " already exists; use --force to overwrite"});
                }
                if (existing != entry_kind::missing && existing != entry_kind::file) {
                    return fail(kind_mismatch(target, entry_kind::file));
                }
                // A hard link to the source would be truncated by the fallback copy
                if (existing == entry_kind::file &&
                    std::filesystem::equivalent(entry, target, ec)) {
                    return fail(error{error_code::same_file,
                                      quoted(entry) + " and " + quoted(target) +
                                          " are the same file"});
                }

                auto bytes = std::filesystem::file_size(entry, ec);
                if (ec) {
                    return fail(make_io_error("Cannot read size of", entry, ec));
                }

                auto outcome = engine_.transfer(transfer_request(entry, target, ctx),
                                                cursor.for_current_file());
                if (!outcome) {
                    return fail(outcome.error());
                }
                cursor.advance(bytes);
                break;
            }

            case entry_kind::missing:
                return fail(error{error_code::source_not_found,
                                  "Source " + quoted(entry) + " does not exist"});

            default:
                return fail(error{error_code::invalid_source,
                                  "Unexpected entry type: " + quoted(entry)});
        }
    }

    bar->finish_and_clear();

    transfer_outcome outcome;
    outcome.source = src_dir;
    outcome.destination = dest_dir;
    outcome.strategy = transfer_strategy::merged;
    outcome.bytes_transferred = cursor.base();
    outcome.files_transferred = size.value().file_count;
    outcome.elapsed_time = std::chrono::duration_cast<duration>(
        std::chrono::steady_clock::now() - start);
    outcome.summary =
        render_summary(directory_verb(ctx.mode), outcome.elapsed_time, src_dir, dest_dir);

    transfer_log_context log_ctx;
    log_ctx.source = src_dir.string();
    log_ctx.destination = dest_dir.string();
    log_ctx.strategy = std::string(to_string(outcome.strategy));
    log_ctx.bytes_transferred = outcome.bytes_transferred;
    log_ctx.files_transferred = outcome.files_transferred;
    log_ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed_time.count());
    FM_LOG_DEBUG_CTX(log_category::merger,
                     std::string(directory_verb(ctx.mode)) + ": " + quoted(src_dir) +
                         " => " + quoted(dest_dir),
                     log_ctx);
    return outcome;
}

}  // namespace kcenon::file_move
