/**
 * @file uploader.cpp
 * @brief Single-shot and multipart upload pipeline
 */

#include "kcenon/resilient_transfer/transfer/uploader.h"
#include "kcenon/resilient_transfer/core/checksum.h"
#include "kcenon/resilient_transfer/core/upload_lock.h"
#include "engine_common.h"

#include <fstream>
#include <mutex>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::string_view artifact_suffix = ".encrypted";

auto trim_slashes(std::string text) -> std::string {
    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

class upload_job {
public:
    upload_job(const engine_context& context,
               transfer_task& task,
               const upload_request& request,
               const transfer_observer& observer)
        : context_(context),
          task_(task),
          request_(request),
          observer_(observer),
          remote_(context, request.storage ? *request.storage : context.config.default_storage,
                  &task.token()),
          local_(request.local_path) {}

    auto run() -> result<transfer_outcome> {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_, ec)) {
            return unexpected(error(error_code::file_not_found,
                                    "local file not found: " + local_.string()));
        }
        plain_size_ = std::filesystem::file_size(local_, ec);
        if (ec) {
            return unexpected(error(error_code::file_read_error,
                                    "cannot stat " + local_.string() + ": " + ec.message()));
        }
        task_.set_total_bytes(plain_size_);

        auto lock = upload_lock::acquire(local_, context_.config.lock_stale_after);
        if (!lock) {
            return unexpected(lock.error());
        }

        path_base_ = trim_slashes(request_.path_base.empty() ? remote_.storage().path_base
                                                              : request_.path_base);
        log_ctx_ = detail::make_log_context(task_, local_.filename().string());
        log_ctx_.total_bytes = plain_size_;

        const bool multipart =
            plain_size_ > 0 && plain_size_ >= context_.config.multipart_threshold;
        if (!multipart) {
            return upload_single();
        }

        if (auto resumed = try_resume(); resumed) {
            return resumed.value();
        } else if (resumed.error().code != error_code::resume_state_invalid) {
            return unexpected(resumed.error());
        }
        return upload_fresh_multipart();
    }

private:
    // ------------------------------------------------------------------
    // Preparation
    // ------------------------------------------------------------------

    /**
     * @return outcome of a resumed upload, or resume_state_invalid to start over
     */
    auto try_resume() -> result<transfer_outcome> {
        auto loaded = context_.resumes->load(local_, transfer_direction::upload);
        if (!loaded) {
            if (loaded.error().code != error_code::file_not_found) {
                RT_LOG_WARN_CTX(log_category::resume,
                                "Discarding unreadable resume state: " + loaded.error().message,
                                log_ctx_);
                discard_state(std::nullopt);
            }
            return unexpected(error(error_code::resume_state_invalid, "no resume state"));
        }

        auto state = std::move(loaded.value());
        if (auto valid = context_.resumes->validate_upload(state, local_, plain_size_); !valid) {
            RT_LOG_WARN_CTX(log_category::resume,
                            "Discarding resume state: " + valid.error().message, log_ctx_);
            discard_state(state);
            return unexpected(valid.error());
        }

        if (!state.committed) {
            if (auto unchanged = check_local_unchanged(state.checksum); !unchanged) {
                if (unchanged.error().code != error_code::checksum_mismatch) {
                    return unexpected(unchanged.error());
                }
                RT_LOG_WARN_CTX(log_category::resume,
                                "Local file changed since the upload started, restarting",
                                log_ctx_);
                discard_state(state);
                return unexpected(error(error_code::resume_state_invalid, "local file changed"));
            }
        }

        auto material = detail::decode_material(state);
        if (!material) {
            discard_state(state);
            return unexpected(material.error());
        }
        material_ = std::move(material.value());
        task_.set_object_key(state.object_key);

        if (state.committed) {
            return verify_committed(std::move(state));
        }

        auto listed = remote_.call(rate_limit_scope::platform_api, "list_parts",
                                   [&](const credential_lease& lease) {
                                       return context_.backend->list_parts(
                                           lease, state.object_key, state.upload_id);
                                   });
        if (!listed) {
            if (listed.error().code == error_code::object_not_found) {
                RT_LOG_WARN_CTX(log_category::resume,
                                "Multipart session " + state.upload_id +
                                    " no longer exists, restarting upload",
                                log_ctx_);
                discard_state(std::nullopt);
                return unexpected(error(error_code::resume_state_invalid, "session expired"));
            }
            return unexpected(listed.error());
        }

        // Keep only the parts the server still holds with the same ETag.
        std::vector<uint32_t> stale;
        for (const auto& recorded : state.completed_parts) {
            const bool held = std::any_of(
                listed.value().begin(), listed.value().end(), [&](const part_receipt& server) {
                    return server.part_number == recorded.part_number &&
                           checksum::equals(server.etag, recorded.etag) &&
                           server.size == recorded.size;
                });
            if (!held) {
                stale.push_back(recorded.part_number);
            }
        }
        for (auto number : stale) {
            state.remove_part(number);
        }

        RT_LOG_INFO_CTX(log_category::resume,
                        "Resuming upload with " + std::to_string(state.completed_parts.size()) +
                            " of " + std::to_string(part_count(state.plain_size, state.part_size)) +
                            " parts already sent",
                        log_ctx_);
        state_ = std::move(state);
        resumed_ = true;
        return upload_parts();
    }

    /**
     * @brief Remove a resume state, aborting its session when one was recorded
     */
    auto discard_state(const std::optional<resume_state>& state) -> void {
        if (state && !state->upload_id.empty() && !state->object_key.empty() && !state->committed) {
            auto aborted = remote_.call(rate_limit_scope::platform_api, "abort_multipart",
                                        [&](const credential_lease& lease) {
                                            return context_.backend->abort_multipart(
                                                lease, state->object_key, state->upload_id);
                                        });
            if (!aborted) {
                RT_LOG_DEBUG_CTX(log_category::upload,
                                 "Could not abort old session: " + aborted.error().message,
                                 log_ctx_);
            }
        }
        if (auto removed = context_.resumes->remove(local_, transfer_direction::upload); !removed) {
            RT_LOG_WARN_CTX(log_category::resume,
                            "Could not remove resume state: " + removed.error().message, log_ctx_);
        }
    }

    auto check_duplicates(const std::string& file_name) -> result<void> {
        if (context_.config.fast_mode) {
            RT_LOG_DEBUG_CTX(log_category::upload, "Fast mode: duplicate check skipped", log_ctx_);
            return {};
        }
        const auto prefix = (path_base_.empty() ? std::string{} : path_base_ + "/") + file_name + "-";
        auto listed = remote_.call(rate_limit_scope::platform_api, "list_objects",
                                   [&](const credential_lease& lease) {
                                       return context_.backend->list_objects(lease, prefix);
                                   });
        if (!listed) {
            return unexpected(listed.error());
        }
        if (!listed.value().empty() && !context_.config.allow_duplicates) {
            return unexpected(error(error_code::duplicate_object,
                                    "an object named " + listed.value().front().key +
                                        " already exists"));
        }
        return {};
    }

    /**
     * @brief Checksum, duplicate check, object key and key material for a new upload
     */
    auto prepare_fresh() -> result<void> {
        auto digest = checksum::hash_file(local_, digest_algorithm::sha512);
        if (!digest) {
            return unexpected(digest.error());
        }
        checksum_ = digest.value();

        const auto file_name = local_.filename().string();
        if (auto unique = check_duplicates(file_name); !unique) {
            return unique;
        }

        auto suffix = generate_random_suffix();
        if (!suffix) {
            return unexpected(suffix.error());
        }
        suffix_ = suffix.value();
        object_key_ = uploader::make_object_key(path_base_, file_name, suffix_);
        task_.set_object_key(object_key_);

        auto file_id = generate_random_bytes(file_id_size);
        if (!file_id) {
            return unexpected(file_id.error());
        }
        auto material = detail::derive_material(context_.config.master_secret,
                                                std::move(file_id.value()));
        if (!material) {
            return unexpected(material.error());
        }
        material_ = std::move(material.value());
        return {};
    }

    auto object_metadata(uint64_t part_size, uint64_t parts, const std::string& digest) const
        -> metadata_map {
        metadata_map metadata;
        metadata[std::string(metadata_keys::plain_size)] = std::to_string(plain_size_);
        metadata[std::string(metadata_keys::part_size)] = std::to_string(part_size);
        metadata[std::string(metadata_keys::part_count)] = std::to_string(parts);
        metadata[std::string(metadata_keys::checksum)] = digest;
        metadata[std::string(metadata_keys::checksum_algorithm)] =
            std::string(detail::checksum_algorithm_name);
        metadata[std::string(metadata_keys::file_id)] = base64_encode(material_.file_id);
        metadata[std::string(metadata_keys::cipher)] = std::string(cipher_identifier);
        return metadata;
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
    // Verification
    // ------------------------------------------------------------------

    /**
     * @brief Remote size and recorded checksum must match what was sent
     */
    auto verify_remote(const object_info& info, uint64_t expected_size, const std::string& digest)
        -> result<void> {
        if (info.size != expected_size) {
            return unexpected(error(error_code::size_mismatch,
                                    "remote object has " + std::to_string(info.size) +
                                        " bytes, expected " + std::to_string(expected_size)));
        }
        auto recorded = info.find_metadata(metadata_keys::checksum);
        if (!recorded || !checksum::equals(*recorded, digest)) {
            return unexpected(error(error_code::checksum_mismatch,
                                    "remote checksum does not match the local file"));
        }
        return {};
    }

    /**
     * @brief The local file must still hash to the digest recorded when the upload began
     *
     * Same-size edits pass the resume state checks, so resumed uploads compare
     * content before reusing parts and before committing them.
     */
    auto check_local_unchanged(const std::string& digest) -> result<void> {
        if (!context_.config.verify_checksum) {
            return {};
        }
        auto local_digest = checksum::hash_file(local_, digest_algorithm::sha512);
        if (!local_digest) {
            return unexpected(local_digest.error());
        }
        if (!checksum::equals(local_digest.value(), digest)) {
            return unexpected(error(error_code::checksum_mismatch,
                                    "local file changed while the upload was interrupted"));
        }
        return {};
    }

    /**
     * @brief Remove an object that does not hold the local file
     */
    auto delete_remote(const std::string& key) -> result<void> {
        auto deleted = remote_.call(rate_limit_scope::platform_api, "delete_object",
                                    [&](const credential_lease& lease) {
                                        return context_.backend->delete_object(lease, key);
                                    });
        if (!deleted && deleted.error().code != error_code::object_not_found) {
            return deleted;
        }
        return {};
    }

    auto head(const std::string& key) -> result<object_info> {
        return remote_.call(rate_limit_scope::platform_api, "head_object",
                            [&](const credential_lease& lease) {
                                return context_.backend->head_object(lease, key);
                            });
    }

    /**
     * @brief A previous run completed the session; check the object, move nothing
     */
    auto verify_committed(resume_state state) -> result<transfer_outcome> {
        resumed_ = true;
        auto info = head(state.object_key);
        if (!info) {
            if (info.error().code == error_code::object_not_found) {
                RT_LOG_WARN_CTX(log_category::resume,
                                "Committed object " + state.object_key + " is missing, restarting",
                                log_ctx_);
                discard_state(std::nullopt);
                return unexpected(error(error_code::resume_state_invalid, "object missing"));
            }
            return unexpected(info.error());
        }
        auto verified = verify_remote(info.value(), state.total_size, state.checksum);
        if (verified) {
            verified = check_local_unchanged(state.checksum);
        }
        if (!verified) {
            const auto code = verified.error().code;
            if (code != error_code::size_mismatch && code != error_code::checksum_mismatch) {
                return unexpected(verified.error());
            }
            RT_LOG_WARN_CTX(log_category::resume,
                            "Committed object failed verification, restarting: " +
                                verified.error().message,
                            log_ctx_);
            // The fresh upload's duplicate check must not find this object.
            if (auto deleted = delete_remote(state.object_key); !deleted) {
                RT_LOG_ERROR_CTX(log_category::resume,
                                 "Cannot delete " + state.object_key + ": " +
                                     deleted.error().message,
                                 log_ctx_);
                return unexpected(deleted.error());
            }
            discard_state(std::nullopt);
            resumed_ = false;
            return unexpected(error(error_code::resume_state_invalid, "committed object invalid"));
        }
        if (auto removed = context_.resumes->remove(local_, transfer_direction::upload); !removed) {
            return unexpected(removed.error());
        }
        task_.update_progress(plain_size_);
        RT_LOG_INFO_CTX(log_category::upload, "Upload was already committed, verified remote object",
                        log_ctx_);

        transfer_outcome outcome;
        outcome.object_key = state.object_key;
        outcome.plain_size = plain_size_;
        outcome.remote_size = info.value().size;
        outcome.checksum = state.checksum;
        outcome.part_count = static_cast<uint32_t>(state.completed_parts.size());
        outcome.resumed = true;
        outcome.already_complete = true;
        return outcome;
    }

    // ------------------------------------------------------------------
    // Single shot
    // ------------------------------------------------------------------

    auto upload_single() -> result<transfer_outcome> {
        if (auto prepared = prepare_fresh(); !prepared) {
            return unexpected(prepared.error());
        }
        if (auto active = mark_active(); !active) {
            return unexpected(active.error());
        }

        auto material = material_.for_part(0);
        if (!material) {
            return unexpected(material.error());
        }

        const auto artifact = detail::sibling_path(local_, artifact_suffix);
        detail::scoped_removal cleanup(artifact);
        auto encrypted = encrypt_file(material.value(), local_, artifact, context_.config.cipher_window);
        if (!encrypted) {
            return unexpected(encrypted.error());
        }
        if (!is_valid_encrypted_size(plain_size_, encrypted.value())) {
            return unexpected(error(error_code::size_mismatch,
                                    "encrypted artifact has " + std::to_string(encrypted.value()) +
                                        " bytes for " + std::to_string(plain_size_) +
                                        " plaintext bytes"));
        }

        const auto metadata = object_metadata(detail::single_part_size(plain_size_), 1, checksum_);
        auto stored = remote_.call(rate_limit_scope::storage_io, "put_object",
                                   [&](const credential_lease& lease) {
                                       return context_.backend->put_object(lease, object_key_,
                                                                           artifact, metadata);
                                   });
        if (!stored) {
            return unexpected(stored.error());
        }
        report_progress(plain_size_);

        if (auto verified = verify_remote(stored.value(), encrypted.value(), checksum_); !verified) {
            return unexpected(verified.error());
        }

        RT_LOG_INFO_CTX(log_category::upload, "Uploaded " + object_key_, log_ctx_);
        transfer_outcome outcome;
        outcome.object_key = object_key_;
        outcome.plain_size = plain_size_;
        outcome.remote_size = stored.value().size;
        outcome.checksum = checksum_;
        outcome.part_count = 1;
        outcome.parts_transferred = 1;
        return outcome;
    }

    // ------------------------------------------------------------------
    // Multipart
    // ------------------------------------------------------------------

    auto upload_fresh_multipart() -> result<transfer_outcome> {
        if (auto prepared = prepare_fresh(); !prepared) {
            return unexpected(prepared.error());
        }

        auto session = remote_.call(rate_limit_scope::platform_api, "create_multipart",
                                    [&](const credential_lease& lease) {
                                        return context_.backend->create_multipart(lease,
                                                                                  object_key_);
                                    });
        if (!session) {
            return unexpected(session.error());
        }

        resume_state state;
        state.direction = transfer_direction::upload;
        state.local_path = local_.string();
        state.object_key = object_key_;
        state.storage = remote_.storage().type;
        state.storage_id = remote_.storage().storage_id;
        state.upload_id = session.value();
        state.plain_size = plain_size_;
        state.part_size = context_.config.part_size;
        state.total_size = detail::expected_ciphertext_size(plain_size_, state.part_size);
        state.file_key = base64_encode(material_.file_key);
        state.file_id = base64_encode(material_.file_id);
        state.random_suffix = suffix_;
        state.checksum = checksum_;
        state.created_at = std::chrono::system_clock::now();
        if (auto saved = context_.resumes->save(state); !saved) {
            return unexpected(saved.error());
        }
        RT_LOG_INFO_CTX(log_category::upload,
                        "Started multipart upload " + state.upload_id + " for " + object_key_,
                        log_ctx_);
        state_ = std::move(state);
        return upload_parts();
    }

    auto upload_parts() -> result<transfer_outcome> {
        if (auto active = mark_active(); !active) {
            return unexpected(active.error());
        }

        const auto total_parts = part_count(state_.plain_size, state_.part_size);
        const auto pending = detail::pending_parts(state_, total_parts);
        plain_done_ = detail::plain_bytes_done(state_);
        report_progress(plain_done_);
        log_ctx_.total_parts = total_parts;

        auto allocation = context_.resources->allocate(plain_size_, request_.priority,
                                                       request_.concurrent_files);
        if (!allocation) {
            return unexpected(allocation.error());
        }

        part_scheduler scheduler(context_.resources->workers(), context_.resources->slots(),
                                 allocation.value()->threads(),
                                 &task_.token());
        scheduler_ = &scheduler;
        auto sent = scheduler.run(
            pending, [this](uint32_t index) { return upload_part(index); },
            [this] { return task_.wait_while_paused(); });
        scheduler_ = nullptr;
        allocation.value()->complete();
        context_.resources->monitor().forget(task_.id().to_string());

        if (!sent) {
            if (sent.error().code == error_code::cancelled) {
                RT_LOG_INFO_CTX(log_category::upload, "Upload cancelled, progress kept for resume",
                                log_ctx_);
            }
            return unexpected(sent.error());
        }
        return complete_upload(static_cast<uint32_t>(pending.size()));
    }

    auto upload_part(uint32_t index) -> result<void> {
        const auto started = std::chrono::steady_clock::now();
        const auto offset = static_cast<uint64_t>(index) * state_.part_size;
        const auto length = detail::plain_part_length(state_.plain_size, state_.part_size, index);

        auto material = material_.for_part(index);
        if (!material) {
            return unexpected(material.error());
        }
        auto encryptor = part_encryptor::create(material.value(), context_.config.cipher_window);
        if (!encryptor) {
            return unexpected(encryptor.error());
        }

        std::ifstream in(local_, std::ios::binary);
        if (!in) {
            return unexpected(error(error_code::file_read_error, "cannot open " + local_.string()));
        }
        in.seekg(static_cast<std::streamoff>(offset));

        byte_buffer ciphertext;
        ciphertext.reserve(static_cast<std::size_t>(encrypted_size(length)));
        std::vector<std::byte> window(context_.config.cipher_window);
        uint64_t remaining = length;
        while (remaining > 0) {
            const auto chunk = static_cast<std::size_t>(std::min<uint64_t>(remaining, window.size()));
            in.read(reinterpret_cast<char*>(window.data()), static_cast<std::streamsize>(chunk));
            if (static_cast<std::size_t>(in.gcount()) != chunk) {
                return unexpected(error(error_code::file_read_error,
                                        "short read from " + local_.string() + " in part " +
                                            std::to_string(index + 1)));
            }
            auto updated = encryptor.value().update(std::span(window.data(), chunk), ciphertext);
            if (!updated) {
                return unexpected(updated.error());
            }
            remaining -= chunk;
        }
        if (auto finished = encryptor.value().finalize(ciphertext); !finished) {
            return unexpected(finished.error());
        }

        const auto part_number = index + 1;
        auto receipt = remote_.call(rate_limit_scope::storage_io, "upload_part",
                                    [&](const credential_lease& lease) {
                                        return context_.backend->upload_part(
                                            lease, state_.object_key, state_.upload_id,
                                            part_number, ciphertext);
                                    });
        if (!receipt) {
            return unexpected(receipt.error());
        }
        if (receipt.value().size != ciphertext.size()) {
            return unexpected(error(error_code::size_mismatch,
                                    "server stored " + std::to_string(receipt.value().size) +
                                        " bytes for part " + std::to_string(part_number)));
        }

        uint64_t done = 0;
        {
            std::lock_guard lock(state_mutex_);
            state_.record_part({part_number, ciphertext.size(), receipt.value().etag});
            if (auto saved = context_.resumes->save(state_); !saved) {
                return unexpected(saved.error());
            }
            plain_done_ += length;
            done = plain_done_;
        }
        report_progress(done);

        const auto seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        if (scheduler_ != nullptr && seconds > 0.0) {
            detail::adapt_parallelism(context_.resources->monitor(), *scheduler_,
                                      task_.id().to_string(),
                                      static_cast<double>(ciphertext.size()) / seconds);
        }

        auto ctx = log_ctx_;
        ctx.part_number = part_number;
        ctx.bytes_transferred = done;
        RT_LOG_DEBUG_CTX(log_category::upload, "Part uploaded", ctx);
        return {};
    }

    auto complete_upload(uint32_t parts_sent) -> result<transfer_outcome> {
        std::vector<part_receipt> receipts;
        uint64_t committed_size = 0;
        for (const auto& part : detail::sorted_parts(state_)) {
            receipts.push_back(part_receipt{part.part_number, part.etag, part.size});
            committed_size += part.size;
        }
        if (committed_size != state_.total_size) {
            return unexpected(error(error_code::size_mismatch,
                                    "committed parts hold " + std::to_string(committed_size) +
                                        " bytes, expected " + std::to_string(state_.total_size)));
        }

        if (resumed_) {
            if (auto unchanged = check_local_unchanged(state_.checksum); !unchanged) {
                if (unchanged.error().code == error_code::checksum_mismatch) {
                    RT_LOG_WARN_CTX(log_category::upload,
                                    "Local file changed during the upload, aborting session " +
                                        state_.upload_id,
                                    log_ctx_);
                    discard_state(state_);
                }
                return unexpected(unchanged.error());
            }
        }

        const auto metadata = object_metadata(state_.part_size, receipts.size(), state_.checksum);
        auto completed = remote_.call(rate_limit_scope::platform_api, "complete_multipart",
                                      [&](const credential_lease& lease) {
                                          return context_.backend->complete_multipart(
                                              lease, state_.object_key, state_.upload_id,
                                              receipts, metadata);
                                      });
        object_info info;
        if (completed) {
            info = std::move(completed.value());
        } else if (completed.error().code == error_code::object_not_found) {
            // An earlier complete may have succeeded with its response lost.
            auto existing = head(state_.object_key);
            if (!existing) {
                return unexpected(completed.error());
            }
            info = std::move(existing.value());
        } else {
            return unexpected(completed.error());
        }

        state_.committed = true;
        if (auto saved = context_.resumes->save(state_); !saved) {
            return unexpected(saved.error());
        }

        if (auto verified = verify_remote(info, committed_size, state_.checksum); !verified) {
            return unexpected(verified.error());
        }
        if (auto removed = context_.resumes->remove(local_, transfer_direction::upload); !removed) {
            return unexpected(removed.error());
        }

        RT_LOG_INFO_CTX(log_category::upload,
                        "Completed multipart upload of " + state_.object_key + " (" +
                            std::to_string(receipts.size()) + " parts)",
                        log_ctx_);
        transfer_outcome outcome;
        outcome.object_key = state_.object_key;
        outcome.plain_size = plain_size_;
        outcome.remote_size = info.size;
        outcome.checksum = state_.checksum;
        outcome.part_count = static_cast<uint32_t>(receipts.size());
        outcome.parts_transferred = parts_sent;
        outcome.resumed = resumed_;
        return outcome;
    }

    const engine_context& context_;
    transfer_task& task_;
    const upload_request& request_;
    const transfer_observer& observer_;
    remote_caller remote_;
    const std::filesystem::path local_;
    transfer_log_context log_ctx_;

    uint64_t plain_size_ = 0;
    std::string path_base_;
    std::string checksum_;
    std::string suffix_;
    std::string object_key_;
    detail::file_material material_;
    bool resumed_ = false;

    std::mutex state_mutex_;
    resume_state state_;
    uint64_t plain_done_ = 0;
    part_scheduler* scheduler_ = nullptr;
};

}  // namespace

uploader::uploader(engine_context context) : context_(std::move(context)) {}

auto uploader::make_object_key(const std::string& path_base,
                               const std::string& file_name,
                               const std::string& suffix) -> std::string {
    const auto base = trim_slashes(path_base);
    auto key = base.empty() ? std::string{} : base + "/";
    key += file_name + "-" + suffix;
    return key;
}

auto uploader::run(transfer_task& task,
                   const upload_request& request,
                   const transfer_observer& observer) -> result<transfer_outcome> {
    if (auto valid = context_.validate(); !valid) {
        return unexpected(valid.error());
    }
    upload_job job(context_, task, request, observer);
    return job.run();
}

}  // namespace kcenon::resilient_transfer
