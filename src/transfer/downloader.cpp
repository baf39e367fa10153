/**
 * @file downloader.cpp
 * @brief Ranged, resumable download followed by in-order decryption
 */

#include "kcenon/resilient_transfer/transfer/downloader.h"
#include "kcenon/resilient_transfer/core/checksum.h"
#include "kcenon/resilient_transfer/core/disk_space.h"
#include "engine_common.h"

#include <fstream>
#include <mutex>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::string_view artifact_suffix = ".encrypted";
constexpr std::string_view partial_suffix = ".partial";

auto has_parent_reference(const std::filesystem::path& path) -> bool {
    for (const auto& component : path) {
        if (component == "..") {
            return true;
        }
    }
    return false;
}

auto is_within(const std::filesystem::path& path, const std::filesystem::path& root) -> bool {
    std::error_code ec;
    const auto base = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }
    const auto target = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    auto base_it = base.begin();
    auto target_it = target.begin();
    for (; base_it != base.end(); ++base_it, ++target_it) {
        // weakly_canonical keeps a trailing empty component for "dir/"
        if (base_it->empty()) {
            continue;
        }
        if (target_it == target.end() || *base_it != *target_it) {
            return false;
        }
    }
    return true;
}

class download_job {
public:
    download_job(const engine_context& context,
                 transfer_task& task,
                 const download_request& request,
                 const transfer_observer& observer)
        : context_(context),
          task_(task),
          request_(request),
          observer_(observer),
          remote_(context, request.storage ? *request.storage : context.config.default_storage,
                  &task.token()),
          local_(request.local_path),
          artifact_(detail::sibling_path(request.local_path, artifact_suffix)),
          partial_(detail::sibling_path(request.local_path, partial_suffix)) {}

    auto run() -> result<transfer_outcome> {
        if (auto safe = downloader::check_destination(local_, context_.config.download_root);
            !safe) {
            return unexpected(safe.error());
        }
        if (request_.object_key.empty()) {
            return unexpected(error(error_code::invalid_argument, "object key is empty"));
        }
        log_ctx_ = detail::make_log_context(task_, request_.object_key);
        task_.set_object_key(request_.object_key);

        auto info = remote_.call(rate_limit_scope::platform_api, "head_object",
                                 [&](const credential_lease& lease) {
                                     return context_.backend->head_object(lease,
                                                                          request_.object_key);
                                 });
        if (!info) {
            return unexpected(info.error());
        }
        auto layout = object_layout::from_object(info.value());
        if (!layout) {
            return unexpected(layout.error());
        }
        layout_ = std::move(layout.value());

        if (request_.declared_size && *request_.declared_size != layout_.plain_size) {
            return unexpected(error(error_code::size_mismatch,
                                    "declared size " + std::to_string(*request_.declared_size) +
                                        " differs from object size " +
                                        std::to_string(layout_.plain_size)));
        }
        task_.set_total_bytes(layout_.plain_size);
        log_ctx_.total_bytes = layout_.plain_size;
        log_ctx_.total_parts = layout_.part_count;

        if (auto existing = check_existing(); !existing) {
            return unexpected(existing.error());
        } else if (existing.value()) {
            return finished_outcome(0, true);
        }

        auto material = detail::derive_material(context_.config.master_secret, layout_.file_id);
        if (!material) {
            return unexpected(material.error());
        }
        material_ = std::move(material.value());

        chunked_ = layout_.plain_size >= context_.config.multipart_threshold ||
                   layout_.part_count > 1;
        if (chunked_) {
            load_resume_state();
        }
        if (!resumed_) {
            start_fresh();
        }

        // Without a resume state nothing can reuse the artifact.
        detail::scoped_removal artifact_guard(artifact_);
        if (chunked_) {
            artifact_guard.release();
        }
        if (auto prepared = prepare_artifact(); !prepared) {
            return unexpected(prepared.error());
        }

        if (auto active = mark_active(); !active) {
            return unexpected(active.error());
        }

        auto fetched = fetch_parts();
        if (!fetched) {
            if (fetched.error().code == error_code::cancelled) {
                RT_LOG_INFO_CTX(log_category::download,
                                "Download cancelled, progress kept for resume", log_ctx_);
            }
            return unexpected(fetched.error());
        }
        return decrypt_and_finalize(fetched.value());
    }

private:
    // ------------------------------------------------------------------
    // Preparation
    // ------------------------------------------------------------------

    /**
     * @return true when the destination already holds the object's plaintext
     */
    auto check_existing() -> result<bool> {
        std::error_code ec;
        if (!std::filesystem::exists(local_, ec)) {
            return false;
        }
        const auto size = std::filesystem::file_size(local_, ec);
        if (!ec && size == layout_.plain_size) {
            auto digest = checksum::hash_file(local_, digest_algorithm::sha512);
            if (!digest) {
                return unexpected(digest.error());
            }
            if (checksum::equals(digest.value(), layout_.checksum)) {
                RT_LOG_INFO_CTX(log_category::download,
                                "Destination already matches the object, nothing to fetch",
                                log_ctx_);
                task_.update_progress(layout_.plain_size);
                return true;
            }
        }
        if (!request_.overwrite) {
            return unexpected(error(error_code::destination_exists,
                                    local_.string() + " exists and differs from the object"));
        }
        return false;
    }

    auto discard_state() -> void {
        if (auto removed = context_.resumes->remove(local_, transfer_direction::download);
            !removed) {
            RT_LOG_WARN_CTX(log_category::resume,
                            "Could not remove resume state: " + removed.error().message, log_ctx_);
        }
        detail::remove_quietly(artifact_);
        detail::remove_quietly(partial_);
    }

    auto load_resume_state() -> void {
        auto loaded = context_.resumes->load(local_, transfer_direction::download);
        if (!loaded) {
            if (loaded.error().code != error_code::file_not_found) {
                RT_LOG_WARN_CTX(log_category::resume,
                                "Discarding unreadable resume state: " + loaded.error().message,
                                log_ctx_);
                discard_state();
            }
            return;
        }

        auto state = std::move(loaded.value());
        auto valid = context_.resumes->validate_download(state, local_, layout_.plain_size,
                                                         layout_.etag);
        if (valid && (state.part_size != layout_.part_size ||
                      state.total_size != layout_.remote_size ||
                      state.object_key != request_.object_key)) {
            valid = unexpected(error(error_code::resume_state_invalid,
                                     "resume state describes a different object layout"));
        }
        if (!valid) {
            RT_LOG_WARN_CTX(log_category::resume,
                            "Restarting download from byte 0: " + valid.error().message, log_ctx_);
            discard_state();
            return;
        }

        state.encrypted_path = artifact_.string();
        reconcile_artifact(state);
        RT_LOG_INFO_CTX(log_category::resume,
                        "Resuming download with " + std::to_string(state.completed_parts.size()) +
                            " of " + std::to_string(layout_.part_count) + " parts on disk",
                        log_ctx_);
        state_ = std::move(state);
        resumed_ = true;
    }

    /**
     * @brief Drop recorded parts whose bytes are no longer in the artifact
     */
    auto reconcile_artifact(resume_state& state) -> void {
        std::ifstream in(artifact_, std::ios::binary);
        std::vector<uint32_t> lost;
        for (const auto& part : state.completed_parts) {
            if (!in) {
                lost.push_back(part.part_number);
                continue;
            }
            const auto index = part.part_number - 1;
            byte_buffer bytes(static_cast<std::size_t>(part.size));
            in.clear();
            in.seekg(static_cast<std::streamoff>(encrypted_part_offset(index, state.part_size)));
            in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (static_cast<std::size_t>(in.gcount()) != bytes.size() ||
                !checksum::equals(checksum::sha256(bytes), part.etag)) {
                lost.push_back(part.part_number);
            }
        }
        for (auto number : lost) {
            state.remove_part(number);
        }
        if (!lost.empty()) {
            RT_LOG_WARN_CTX(log_category::resume,
                            std::to_string(lost.size()) + " recorded parts missing from " +
                                artifact_.filename().string() + ", fetching again",
                            log_ctx_);
        }
    }

    auto start_fresh() -> void {
        detail::remove_quietly(artifact_);
        detail::remove_quietly(partial_);

        resume_state state;
        state.direction = transfer_direction::download;
        state.local_path = local_.string();
        state.object_key = request_.object_key;
        state.storage = remote_.storage().type;
        state.storage_id = remote_.storage().storage_id;
        state.plain_size = layout_.plain_size;
        state.total_size = layout_.remote_size;
        state.part_size = layout_.part_size;
        state.file_key = base64_encode(material_.file_key);
        state.file_id = base64_encode(material_.file_id);
        state.etag = layout_.etag;
        state.encrypted_path = artifact_.string();
        state.created_at = std::chrono::system_clock::now();
        state_ = std::move(state);
    }

    /**
     * @brief Disk check, then a sparse artifact of the final ciphertext size
     */
    auto prepare_artifact() -> result<void> {
        auto parent = local_.parent_path();
        if (parent.empty()) {
            parent = ".";
        }
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot create " + parent.string() + ": " + ec.message()));
        }

        const auto remaining = layout_.remote_size - std::min(layout_.remote_size,
                                                              state_.bytes_transferred);
        if (auto space = check_available_space(parent, remaining + layout_.plain_size,
                                               context_.config.disk_space_margin);
            !space) {
            return space;
        }

        if (!std::filesystem::exists(artifact_, ec)) {
            std::ofstream create(artifact_, std::ios::binary);
            if (!create) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot create " + artifact_.string()));
            }
        }
        std::filesystem::resize_file(artifact_, layout_.remote_size, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot size " + artifact_.string() + ": " + ec.message()));
        }

        if (chunked_) {
            if (auto saved = context_.resumes->save(state_); !saved) {
                return saved;
            }
        }
        return {};
    }

    auto mark_active() -> result<void> {
        if (auto moved = task_.transition(task_state::active); !moved) {
            if (task_.token().is_cancelled()) {
                return unexpected(error(error_code::cancelled, "transfer cancelled"));
            }
            return moved;
        }
        return {};
    }

    auto report_progress(uint64_t plain_done) -> void {
        if (task_.update_progress(plain_done) && observer_.on_progress) {
            observer_.on_progress(task_);
        }
    }

    // ------------------------------------------------------------------
    // Fetch
    // ------------------------------------------------------------------

    /**
     * @return number of parts fetched by this run
     */
    auto fetch_parts() -> result<uint32_t> {
        const auto pending = detail::pending_parts(state_, layout_.part_count);
        plain_done_ = detail::plain_bytes_done(state_);
        report_progress(plain_done_);
        if (pending.empty()) {
            return 0U;
        }

        auto allocation = context_.resources->allocate(layout_.plain_size, request_.priority,
                                                       request_.concurrent_files);
        if (!allocation) {
            return unexpected(allocation.error());
        }
        const auto workers = chunked_ ? allocation.value()->threads() : 1U;

        part_scheduler scheduler(context_.resources->workers(), context_.resources->slots(),
                                 workers, &task_.token());
        scheduler_ = &scheduler;
        auto fetched = scheduler.run(
            pending, [this](uint32_t index) { return fetch_part(index); },
            [this] { return task_.wait_while_paused(); });
        scheduler_ = nullptr;
        allocation.value()->complete();
        context_.resources->monitor().forget(task_.id().to_string());

        if (!fetched) {
            return unexpected(fetched.error());
        }
        return static_cast<uint32_t>(pending.size());
    }

    /**
     * @brief Largest range one read_range may ask for: a padded configured part
     *
     * Single-shot objects record one part covering the whole file, so their
     * part is fetched in several reads.
     */
    auto read_limit() const -> uint64_t {
        return encrypted_size(std::max<uint64_t>(context_.config.part_size, cipher_block_size));
    }

    auto fetch_part(uint32_t index) -> result<void> {
        const auto started = std::chrono::steady_clock::now();
        const auto plain_length =
            detail::plain_part_length(layout_.plain_size, layout_.part_size, index);
        const auto offset = encrypted_part_offset(index, layout_.part_size);
        const auto length = encrypted_size(plain_length);

        std::fstream out(artifact_, std::ios::binary | std::ios::in | std::ios::out);
        if (!out) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot open " + artifact_.string()));
        }
        out.seekp(static_cast<std::streamoff>(offset));

        incremental_hasher part_hash(digest_algorithm::sha256);
        uint64_t fetched = 0;
        while (fetched < length) {
            const auto range = std::min(read_limit(), length - fetched);
            auto bytes = remote_.call(rate_limit_scope::storage_io, "read_range",
                                      [&](const credential_lease& lease) {
                                          return context_.backend->read_range(
                                              lease, request_.object_key, offset + fetched, range);
                                      });
            if (!bytes) {
                return unexpected(bytes.error());
            }
            if (bytes.value().size() != range) {
                return unexpected(error(error_code::size_mismatch,
                                        "part " + std::to_string(index + 1) + " returned " +
                                            std::to_string(bytes.value().size()) + " of " +
                                            std::to_string(range) + " bytes at " +
                                            std::to_string(offset + fetched)));
            }
            out.write(reinterpret_cast<const char*>(bytes.value().data()),
                      static_cast<std::streamsize>(bytes.value().size()));
            if (!out) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot write part " + std::to_string(index + 1) +
                                            " to " + artifact_.string()));
            }
            if (auto hashed = part_hash.update(bytes.value()); !hashed) {
                return hashed;
            }
            fetched += range;
        }
        out.flush();
        if (!out) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot flush " + artifact_.string()));
        }
        out.close();

        auto part_digest = part_hash.finalize();
        if (!part_digest) {
            return unexpected(part_digest.error());
        }

        uint64_t done = 0;
        {
            std::lock_guard lock(state_mutex_);
            state_.record_part({index + 1, length, std::move(part_digest.value())});
            if (chunked_) {
                if (auto saved = context_.resumes->save(state_); !saved) {
                    return saved;
                }
            }
            plain_done_ += plain_length;
            done = plain_done_;
        }
        report_progress(done);

        const auto seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        if (scheduler_ != nullptr && seconds > 0.0) {
            detail::adapt_parallelism(context_.resources->monitor(), *scheduler_,
                                      task_.id().to_string(),
                                      static_cast<double>(length) / seconds);
        }

        auto ctx = log_ctx_;
        ctx.part_number = index + 1;
        ctx.bytes_transferred = done;
        RT_LOG_DEBUG_CTX(log_category::download, "Part fetched", ctx);
        return {};
    }

    // ------------------------------------------------------------------
    // Decrypt and finalize
    // ------------------------------------------------------------------

    /**
     * @brief A part failed to decrypt: forget it so the next attempt fetches it again
     */
    auto drop_corrupt_part(uint32_t index) -> void {
        std::lock_guard lock(state_mutex_);
        state_.remove_part(index + 1);
        if (chunked_) {
            if (auto saved = context_.resumes->save(state_); !saved) {
                RT_LOG_WARN_CTX(log_category::resume,
                                "Could not persist dropped part: " + saved.error().message,
                                log_ctx_);
            }
        }
    }

    auto decrypt_part_to(std::ifstream& in,
                         std::ofstream& out,
                         incremental_hasher& hasher,
                         uint32_t index) -> result<uint64_t> {
        const auto plain_length =
            detail::plain_part_length(layout_.plain_size, layout_.part_size, index);
        auto remaining = encrypted_size(plain_length);

        auto material = material_.for_part(index);
        if (!material) {
            return unexpected(material.error());
        }
        auto decryptor = part_decryptor::create(material.value(), context_.config.cipher_window);
        if (!decryptor) {
            return unexpected(decryptor.error());
        }

        in.seekg(static_cast<std::streamoff>(encrypted_part_offset(index, layout_.part_size)));
        std::vector<std::byte> window(context_.config.cipher_window);
        byte_buffer plaintext;
        uint64_t written = 0;

        auto emit = [&]() -> result<void> {
            if (plaintext.empty()) {
                return {};
            }
            out.write(reinterpret_cast<const char*>(plaintext.data()),
                      static_cast<std::streamsize>(plaintext.size()));
            if (!out) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot write " + partial_.string()));
            }
            if (auto hashed = hasher.update(plaintext); !hashed) {
                return hashed;
            }
            written += plaintext.size();
            plaintext.clear();
            return {};
        };

        while (remaining > 0) {
            const auto chunk =
                static_cast<std::size_t>(std::min<uint64_t>(remaining, window.size()));
            in.read(reinterpret_cast<char*>(window.data()), static_cast<std::streamsize>(chunk));
            if (static_cast<std::size_t>(in.gcount()) != chunk) {
                return unexpected(error(error_code::file_read_error,
                                        "short read from " + artifact_.string()));
            }
            if (auto updated = decryptor.value().update(std::span(window.data(), chunk), plaintext);
                !updated) {
                return unexpected(updated.error());
            }
            if (auto emitted = emit(); !emitted) {
                return unexpected(emitted.error());
            }
            remaining -= chunk;
        }
        if (auto finished = decryptor.value().finalize(plaintext); !finished) {
            return unexpected(finished.error());
        }
        if (auto emitted = emit(); !emitted) {
            return unexpected(emitted.error());
        }
        if (written != plain_length) {
            return unexpected(error(error_code::size_mismatch,
                                    "part " + std::to_string(index + 1) + " decrypted to " +
                                        std::to_string(written) + " bytes, expected " +
                                        std::to_string(plain_length)));
        }
        return written;
    }

    auto decrypt_and_finalize(uint32_t parts_fetched) -> result<transfer_outcome> {
        detail::scoped_removal partial_guard(partial_);
        incremental_hasher hasher(digest_algorithm::sha512);
        uint64_t written = 0;
        {
            std::ifstream in(artifact_, std::ios::binary);
            std::ofstream out(partial_, std::ios::binary | std::ios::trunc);
            if (!in || !out) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot open " + artifact_.string() + " for decryption"));
            }
            for (uint32_t index = 0; index < layout_.part_count; ++index) {
                if (task_.token().is_cancelled()) {
                    return unexpected(error(error_code::cancelled, "transfer cancelled"));
                }
                auto part = decrypt_part_to(in, out, hasher, index);
                if (!part) {
                    if (part.error().code == error_code::cipher_error) {
                        RT_LOG_ERROR_CTX(log_category::cipher,
                                         "Part " + std::to_string(index + 1) +
                                             " failed to decrypt: " + part.error().message,
                                         log_ctx_);
                        drop_corrupt_part(index);
                    }
                    return unexpected(part.error());
                }
                written += part.value();
            }
            out.close();
            if (!out) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot flush " + partial_.string()));
            }
        }

        auto digest = hasher.finalize();
        if (!digest) {
            return unexpected(digest.error());
        }
        if (written != layout_.plain_size) {
            discard_state();
            return unexpected(error(error_code::size_mismatch,
                                    "decrypted " + std::to_string(written) + " bytes, expected " +
                                        std::to_string(layout_.plain_size)));
        }
        if (!checksum::equals(digest.value(), layout_.checksum)) {
            RT_LOG_ERROR_CTX(log_category::download,
                             "Checksum mismatch, discarding partial download", log_ctx_);
            discard_state();
            return unexpected(error(error_code::checksum_mismatch,
                                    "SHA-512 of the downloaded data does not match the object"));
        }

        std::error_code ec;
        std::filesystem::rename(partial_, local_, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot move download into place at " + local_.string() +
                                        ": " + ec.message()));
        }
        partial_guard.release();
        detail::remove_quietly(artifact_);
        if (auto removed = context_.resumes->remove(local_, transfer_direction::download);
            !removed) {
            return unexpected(removed.error());
        }

        report_progress(layout_.plain_size);
        RT_LOG_INFO_CTX(log_category::download, "Downloaded to " + local_.filename().string(),
                        log_ctx_);
        return finished_outcome(parts_fetched, false);
    }

    auto finished_outcome(uint32_t parts_fetched, bool already_complete) const -> transfer_outcome {
        transfer_outcome outcome;
        outcome.object_key = request_.object_key;
        outcome.plain_size = layout_.plain_size;
        outcome.remote_size = layout_.remote_size;
        outcome.checksum = layout_.checksum;
        outcome.part_count = static_cast<uint32_t>(layout_.part_count);
        outcome.parts_transferred = parts_fetched;
        outcome.resumed = resumed_;
        outcome.already_complete = already_complete;
        return outcome;
    }

    const engine_context& context_;
    transfer_task& task_;
    const download_request& request_;
    const transfer_observer& observer_;
    remote_caller remote_;
    const std::filesystem::path local_;
    const std::filesystem::path artifact_;
    const std::filesystem::path partial_;
    transfer_log_context log_ctx_;

    object_layout layout_;
    detail::file_material material_;
    bool chunked_ = false;
    bool resumed_ = false;

    std::mutex state_mutex_;
    resume_state state_;
    uint64_t plain_done_ = 0;
    part_scheduler* scheduler_ = nullptr;
};

}  // namespace

auto object_layout::from_object(const object_info& info) -> result<object_layout> {
    auto missing = [&](std::string_view name) {
        return unexpected(error(error_code::invalid_argument,
                                "object " + info.key + " lacks metadata " + std::string(name)));
    };

    const auto plain = detail::parse_u64(info.find_metadata(metadata_keys::plain_size));
    if (!plain) {
        return missing(metadata_keys::plain_size);
    }
    const auto part_size = detail::parse_u64(info.find_metadata(metadata_keys::part_size));
    if (!part_size || *part_size == 0 || *part_size % cipher_block_size != 0) {
        return missing(metadata_keys::part_size);
    }
    const auto parts = detail::parse_u64(info.find_metadata(metadata_keys::part_count));
    if (!parts) {
        return missing(metadata_keys::part_count);
    }
    auto digest = info.find_metadata(metadata_keys::checksum);
    if (!digest || digest->empty()) {
        return missing(metadata_keys::checksum);
    }
    if (auto algorithm = info.find_metadata(metadata_keys::checksum_algorithm);
        algorithm && *algorithm != detail::checksum_algorithm_name) {
        return unexpected(error(error_code::invalid_argument,
                                "unsupported checksum algorithm " + *algorithm));
    }
    if (auto cipher = info.find_metadata(metadata_keys::cipher);
        !cipher || *cipher != cipher_identifier) {
        return unexpected(error(error_code::invalid_argument,
                                "object " + info.key + " was not written by this engine's cipher"));
    }
    auto encoded_id = info.find_metadata(metadata_keys::file_id);
    if (!encoded_id) {
        return missing(metadata_keys::file_id);
    }
    auto file_id = base64_decode(*encoded_id);
    if (!file_id || file_id.value().size() != file_id_size) {
        return missing(metadata_keys::file_id);
    }

    if (*parts != resilient_transfer::part_count(*plain, *part_size)) {
        return unexpected(error(error_code::invalid_argument,
                                "part count " + std::to_string(*parts) + " does not match size " +
                                    std::to_string(*plain)));
    }
    const auto bounds = encrypted_size_bounds(*plain, *part_size);
    if (!bounds.contains(info.size) ||
        info.size != detail::expected_ciphertext_size(*plain, *part_size)) {
        return unexpected(error(error_code::size_mismatch,
                                "object holds " + std::to_string(info.size) +
                                    " bytes, cannot contain " + std::to_string(*plain) +
                                    " plaintext bytes"));
    }

    object_layout layout;
    layout.plain_size = *plain;
    layout.part_size = *part_size;
    layout.part_count = *parts;
    layout.remote_size = info.size;
    layout.checksum = std::move(*digest);
    layout.etag = info.etag;
    layout.file_id = std::move(file_id.value());
    return layout;
}

downloader::downloader(engine_context context) : context_(std::move(context)) {}

auto downloader::check_destination(const std::filesystem::path& local_path,
                                   const std::optional<std::filesystem::path>& root)
    -> result<void> {
    if (local_path.empty() || !local_path.has_filename()) {
        return unexpected(error(error_code::path_invalid, "destination must name a file"));
    }
    if (has_parent_reference(local_path)) {
        return unexpected(error(error_code::path_unsafe,
                                "destination " + local_path.string() + " contains '..'"));
    }
    std::error_code ec;
    if (std::filesystem::is_directory(local_path, ec)) {
        return unexpected(error(error_code::path_invalid,
                                "destination " + local_path.string() + " is a directory"));
    }
    if (root && !is_within(local_path, *root)) {
        return unexpected(error(error_code::path_unsafe,
                                "destination " + local_path.string() + " is outside " +
                                    root->string()));
    }
    return {};
}

auto downloader::run(transfer_task& task,
                     const download_request& request,
                     const transfer_observer& observer) -> result<transfer_outcome> {
    if (auto valid = context_.validate(); !valid) {
        return unexpected(valid.error());
    }
    download_job job(context_, task, request, observer);
    return job.run();
}

}  // namespace kcenon::resilient_transfer
