/**
 * @file transfer_engine.cpp
 * @brief Implementation of the single-file strategy ladder
 */

#include <kcenon/file_move/core/transfer_engine.h>

#include <kcenon/file_move/core/logging.h>
#include <kcenon/file_move/core/os_error.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace kcenon::file_move {

namespace {

auto errno_code() -> std::error_code {
    return {errno != 0 ? errno : EIO, std::system_category()};
}

auto fast_primitive_for(transfer_mode mode) -> fast_primitive {
    return mode == transfer_mode::move ? fast_primitive::rename : fast_primitive::clone;
}

auto fallback_description(transfer_mode mode) -> std::string_view {
    return mode == transfer_mode::move ? "copy and delete" : "copy";
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> duration {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - start);
}

}  // namespace

transfer_engine::transfer_engine() : primitives_(make_default_primitives()) {}

transfer_engine::transfer_engine(std::unique_ptr<file_primitives> primitives)
    : primitives_(std::move(primitives)) {}

transfer_engine::~transfer_engine() = default;

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;

auto transfer_engine::transfer(const transfer_request& request) -> result<transfer_outcome> {
    return run(request, nullptr);
}

auto transfer_engine::transfer(const transfer_request& request,
                               const progress_callback& on_progress)
    -> result<transfer_outcome> {
    return run(request, &on_progress);
}

auto transfer_engine::run(const transfer_request& request,
                          const progress_callback* on_progress)
    -> result<transfer_outcome> {
    const auto& src = request.source;
    const auto& dest = request.destination;
    const auto& ctx = request.context;

    FM_LOG_TRACE(log_category::engine,
                 "transfer(" + quoted(src) + ", " + quoted(dest) + ", " +
                     std::string(to_string(ctx.mode)) + ")");

    auto source_kind = kind_of(src);
    if (source_kind == entry_kind::missing) {
        return unexpected(error{error_code::source_not_found,
                                "Source " + quoted(src) + " does not exist"});
    }
    if (source_kind != entry_kind::file) {
        return unexpected(error{error_code::source_wrong_type,
                                "Source " + quoted(src) + " exists but is not a file"});
    }

    auto dest_kind = kind_of(dest);
    if (dest_kind != entry_kind::missing && dest_kind != entry_kind::file) {
        return unexpected(error{error_code::destination_kind_mismatch,
                                "Destination " + quoted(dest) +
                                    " already exists and is not a file"});
    }

    std::error_code ec;
    auto parent = dest.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected(make_io_error("Cannot create directory", parent, ec));
        }
    }

    auto file_size = std::filesystem::file_size(src, ec);
    if (ec) {
        return unexpected(make_io_error("Cannot read size of", src, ec));
    }

    auto start = std::chrono::steady_clock::now();
    transfer_outcome outcome;
    outcome.source = src;
    outcome.destination = dest;
    outcome.bytes_transferred = file_size;
    outcome.files_transferred = 1;

    // Strategy 1: O(1) metadata operation
    auto primitive = fast_primitive_for(ctx.mode);
    if (ctx.mode == transfer_mode::move) {
        ec = primitives_->rename(src, dest);
    } else {
        if (dest_kind == entry_kind::file) {
            std::error_code remove_ec;
            std::filesystem::remove(dest, remove_ec);
            if (remove_ec) {
                return unexpected(make_io_error("Cannot replace", dest, remove_ec));
            }
        }
        ec = primitives_->clone(src, dest);
    }

    if (!ec) {
        outcome.strategy = ctx.mode == transfer_mode::move ? transfer_strategy::renamed
                                                           : transfer_strategy::reflinked;
        outcome.elapsed_time = elapsed_since(start);
        outcome.summary = render_summary(file_verb(ctx.mode), outcome.elapsed_time, src, dest);
        FM_LOG_DEBUG(log_category::engine,
                     std::string(outcome.strategy == transfer_strategy::renamed ? "Renamed"
                                                                                : "Reflinked") +
                         ": " + quoted(src) + " => " + quoted(dest));
        return outcome;
    }

    auto classification = classify(ec, primitive);
    if (classification.is_fatal()) {
        return unexpected(error{io_error_code_from(ec),
                                "Cannot " + std::string(to_string(primitive)) + " " +
                                    quoted(src) + " => " + quoted(dest) + ": " +
                                    ec.message()});
    }

    FM_LOG_DEBUG(log_category::engine,
                 std::string(to_string(primitive)) + " " + quoted(src) + " => " +
                     quoted(dest) + " not possible (" +
                     std::string(to_string(classification.reason())) + "), falling back to " +
                     std::string(fallback_description(ctx.mode)));

    // Strategy 2: buffered copy with progress
    std::unique_ptr<progress_handle> bar;
    progress_callback bar_callback;
    if (on_progress == nullptr) {
        bar = ctx.progress.add(file_size, src.filename().string());
        bar_callback = [handle = bar.get()](uint64_t bytes) { handle->set_position(bytes); };
        on_progress = &bar_callback;
    }

    auto copied = buffered_copy(src, dest, ctx.copy, *on_progress);
    if (bar) {
        bar->finish_and_clear();
    }
    if (!copied) {
        return unexpected(copied.error());
    }

    if (ctx.mode == transfer_mode::move) {
        auto mtime = std::filesystem::last_write_time(src, ec);
        if (!ec) {
            std::filesystem::last_write_time(dest, mtime, ec);
        }
        if (ec) {
            FM_LOG_WARN(log_category::engine,
                        "Cannot preserve modification time of " + quoted(src) + ": " +
                            ec.message());
        }

        std::filesystem::remove(src, ec);
        if (ec) {
            return unexpected(make_io_error("Cannot remove source", src, ec));
        }
    }

    outcome.strategy = transfer_strategy::copied;
    outcome.bytes_transferred = copied.value();
    outcome.elapsed_time = elapsed_since(start);
    outcome.summary = render_summary(file_verb(ctx.mode), outcome.elapsed_time, src, dest);

    transfer_log_context log_ctx;
    log_ctx.source = src.string();
    log_ctx.destination = dest.string();
    log_ctx.strategy = std::string(to_string(outcome.strategy));
    log_ctx.file_size = file_size;
    log_ctx.bytes_transferred = outcome.bytes_transferred;
    log_ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed_time.count());
    if (outcome.elapsed_time.count() > 0) {
        log_ctx.rate_mbps = static_cast<double>(outcome.bytes_transferred) * 1000.0 /
                            static_cast<double>(outcome.elapsed_time.count()) /
                            (1024.0 * 1024.0);
    }
    FM_LOG_DEBUG_CTX(log_category::engine,
                     std::string(file_verb(ctx.mode)) + ": " + quoted(src) + " => " +
                         quoted(dest),
                     log_ctx);
    return outcome;
}

auto transfer_engine::buffered_copy(const std::filesystem::path& source,
                                    const std::filesystem::path& destination,
                                    const copy_config& config,
                                    const progress_callback& on_progress)
    -> result<uint64_t> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    errno = 0;
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return unexpected(make_io_error("Cannot open", source, errno_code()));
    }

    errno = 0;
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(make_io_error("Cannot create", destination, errno_code()));
    }

    auto fail = [&](std::string_view operation, const std::filesystem::path& path) {
        auto err = make_io_error(operation, path, errno_code());
        out.close();
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        return unexpected(std::move(err));
    };

    std::vector<char> buffer(config.buffer_size);
    uint64_t copied = 0;
    bool reported = false;

    while (true) {
        errno = 0;
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) {
            return fail("Cannot read", source);
        }

        auto bytes_read = in.gcount();
        if (bytes_read > 0) {
            errno = 0;
            out.write(buffer.data(), bytes_read);
            if (!out) {
                return fail("Cannot write", destination);
            }
            copied += static_cast<uint64_t>(bytes_read);
            if (on_progress) {
                on_progress(copied);
            }
            reported = true;
        }

        if (in.eof() || bytes_read == 0) {
            break;
        }
    }

    errno = 0;
    out.close();
    if (out.fail()) {
        return fail("Cannot write", destination);
    }

    if (!reported && on_progress) {
        on_progress(copied);
    }

    if (config.preserve_permissions) {
        std::error_code ec;
        auto perms = std::filesystem::status(source, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(destination, perms,
                                         std::filesystem::perm_options::replace, ec);
        }
        if (ec) {
            FM_LOG_WARN(log_category::engine,
                        "Cannot preserve permissions on " + quoted(destination) + ": " +
                            ec.message());
        }
    }

    return copied;
}

}  // namespace kcenon::file_move
