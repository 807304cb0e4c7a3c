/**
 * @file chunk_transfer_engine.cpp
 * @brief Implementation of chunk_transfer_engine
 */

#include <resumable/upload/engine/chunk_transfer_engine.h>
#include <resumable/upload/core/logging.h>

#include <fstream>
#include <span>
#include <vector>

namespace resumable::upload {

// ============================================================================
// run_context: state of a single run
// ============================================================================

class chunk_transfer_engine::run_context {
public:
    run_context(const chunk_transfer_engine& engine,
                upload_task& task,
                upload_control& control,
                const state_callback& on_update)
        : engine_(engine)
        , task_(task)
        , control_(control)
        , on_update_(on_update) {}

    auto execute() -> upload_outcome {
        task_.last_error.reset();
        task_.last_error_kind = error_kind::none;
        set_status(upload_status::in_progress);

        if (control_.is_cancel_requested()) {
            return cancel();
        }

        auto fp = compute_fingerprint(task_.local_path, engine_.options_.fingerprint);
        if (!fp) {
            return fail(fp.error());
        }
        fingerprint_ = fp.value().to_string();
        task_.total_size = fp.value().size;

        auto offset = decide_offset();
        if (!offset) {
            return finish_with(offset.error());
        }
        task_.bytes_transferred = offset.value();
        outcome_.resume_offset = offset.value();
        have_fingerprint_ = true;
        notify();

        engine_.events_.publish_started(started_event{
            task_.id, task_.filename(), task_.total_size, task_.bytes_transferred});

        if (auto r = ensure_parent(); !r) {
            return finish_with(r.error());
        }

        if (auto r = with_retry("open", [&] { return open_writer(task_.bytes_transferred); });
            !r) {
            return finish_with(r.error());
        }

        save_record();

        if (task_.total_size == 0) {
            return complete();
        }

        if (auto r = transfer_chunks(); !r) {
            return finish_with(r.error());
        }

        return complete();
    }

private:
    // ------------------------------------------------------------------------
    // Resume decision
    // ------------------------------------------------------------------------

    auto decide_offset() -> result<uint64_t> {
        auto loaded = engine_.store_.load(task_.id);
        if (!loaded) {
            if (loaded.error().code != error_code::resume_record_not_found) {
                discard_record(loaded.error().message);
            }
            return uint64_t{0};
        }

        const auto& record = loaded.value();
        if (record.local_path != task_.local_path.string() ||
            record.remote_path != task_.remote_path) {
            discard_record("record belongs to a different source or destination");
            return uint64_t{0};
        }
        if (record.file_fingerprint != fingerprint_) {
            discard_record("local file changed (" + record.file_fingerprint +
                           " -> " + fingerprint_ + ")");
            return uint64_t{0};
        }
        if (record.bytes_transferred > task_.total_size) {
            discard_record("record offset beyond end of file");
            return uint64_t{0};
        }
        if (record.bytes_transferred == 0) {
            return uint64_t{0};
        }

        auto st = with_retry("stat", [&] { return engine_.remote_->stat(task_.remote_path); });
        if (!st) {
            if (st.error().code == error_code::remote_not_found) {
                discard_record("remote file is missing");
                return uint64_t{0};
            }
            return unexpected(st.error());
        }
        if (!st.value().exists || st.value().size < record.bytes_transferred) {
            discard_record("remote file holds " + std::to_string(st.value().size) +
                           " bytes, record expects " +
                           std::to_string(record.bytes_transferred));
            return uint64_t{0};
        }

        auto ctx = log_context();
        ctx.offset = record.bytes_transferred;
        RU_LOG_INFO_CTX(log_category::engine, "Resuming upload", ctx);
        return record.bytes_transferred;
    }

    void discard_record(const std::string& reason) {
        auto ctx = log_context();
        ctx.error_kind = std::string(to_string(error_kind::resume_state_mismatch));
        ctx.error_message = reason;
        RU_LOG_INFO_CTX(log_category::engine, "Discarding stale resume record", ctx);

        if (auto r = engine_.store_.remove(task_.id); !r) {
            RU_LOG_WARN(log_category::engine,
                "Failed to discard resume record for " + task_.id + ": " +
                r.error().message);
        }
    }

    // ------------------------------------------------------------------------
    // Remote operations
    // ------------------------------------------------------------------------

    auto ensure_parent() -> result<void> {
        auto parent = remote_parent_path(task_.remote_path);
        if (parent.empty() || parent == "/") {
            return {};
        }
        return with_retry("mkdir", [&] { return engine_.remote_->mkdir_all(parent); });
    }

    auto open_writer(uint64_t offset) -> result<void> {
        auto opened = engine_.remote_->open_for_write(task_.remote_path, offset);
        if (!opened) {
            return unexpected(opened.error());
        }
        writer_ = std::move(opened.value());
        return {};
    }

    auto write_chunk(std::span<const std::byte> data) -> result<void> {
        if (!writer_) {
            if (auto r = open_writer(task_.bytes_transferred); !r) {
                return r;
            }
        }

        auto written = writer_->write(data);
        if (!written) {
            writer_.reset();
            return unexpected(written.error());
        }
        if (written.value() != data.size()) {
            // Bytes past the committed offset are rewritten after reopening
            writer_.reset();
            return unexpected(error{error_code::remote_partial_write,
                                    "remote accepted " + std::to_string(written.value()) +
                                    " of " + std::to_string(data.size()) + " bytes"});
        }
        return {};
    }

    auto close_writer() -> result<void> {
        if (!writer_) {
            if (auto r = open_writer(task_.total_size); !r) {
                return r;
            }
        }
        auto closed = writer_->close();
        writer_.reset();
        return closed;
    }

    template <typename Op>
    auto with_retry(const char* what, Op op) -> decltype(op()) {
        const auto& policy = engine_.options_.retry;
        for (std::size_t attempt = 1;; ++attempt) {
            auto r = op();
            if (r) {
                return r;
            }

            const auto& err = r.error();
            if (!is_retryable(err.code)) {
                return r;
            }

            auto ctx = log_context();
            ctx.attempt = static_cast<uint32_t>(attempt);
            ctx.error_message = err.message;

            if (attempt >= policy.max_attempts) {
                RU_LOG_ERROR_CTX(log_category::engine,
                    std::string("Remote ") + what + " failed, retries exhausted", ctx);
                return unexpected(error{error_code::retries_exhausted,
                                        std::string(what) + " failed after " +
                                        std::to_string(attempt) + " attempts: " +
                                        err.message});
            }

            auto delay = policy.delay_for(attempt);
            RU_LOG_WARN_CTX(log_category::engine,
                std::string("Remote ") + what + " failed, retrying in " +
                std::to_string(delay.count()) + "ms", ctx);

            if (!control_.sleep_for(delay)) {
                return unexpected(error{error_code::upload_cancelled,
                                        "cancelled while waiting to retry"});
            }
        }
    }

    // ------------------------------------------------------------------------
    // Chunk loop
    // ------------------------------------------------------------------------

    auto transfer_chunks() -> result<void> {
        std::ifstream local(task_.local_path, std::ios::binary);
        if (!local) {
            return unexpected(error{error_code::local_file_unreadable,
                                    "cannot open " + task_.local_path.string()});
        }
        local.seekg(static_cast<std::streamoff>(task_.bytes_transferred));
        if (!local) {
            return unexpected(error{error_code::local_file_read_error,
                                    "cannot seek in " + task_.local_path.string()});
        }

        std::vector<std::byte> buffer(
            chunk_length_at(task_.bytes_transferred, task_.total_size, task_.chunk_size));
        const auto total_chunks = chunk_count(task_.total_size, task_.chunk_size);

        while (task_.bytes_transferred < task_.total_size) {
            if (control_.is_cancel_requested()) {
                return unexpected(error{error_code::upload_cancelled, "cancelled by caller"});
            }
            if (control_.is_pause_requested()) {
                set_status(upload_status::paused);
                save_record();
                RU_LOG_INFO(log_category::engine, "Upload " + task_.id + " paused");
                if (!control_.wait_while_paused()) {
                    return unexpected(error{error_code::upload_cancelled,
                                            "cancelled while paused"});
                }
                set_status(upload_status::in_progress);
                RU_LOG_INFO(log_category::engine, "Upload " + task_.id + " resumed");
            }

            auto length = chunk_length_at(task_.bytes_transferred, task_.total_size,
                                          task_.chunk_size);
            buffer.resize(length);
            local.read(reinterpret_cast<char*>(buffer.data()),
                       static_cast<std::streamsize>(length));
            if (static_cast<std::size_t>(local.gcount()) != length) {
                return unexpected(error{error_code::local_file_changed,
                                        "local file shorter than " +
                                        std::to_string(task_.total_size) + " bytes"});
            }

            std::span<const std::byte> chunk(buffer.data(), length);
            if (auto r = with_retry("write", [&] { return write_chunk(chunk); }); !r) {
                return r;
            }

            auto ctx = log_context();
            ctx.chunk_index = task_.bytes_transferred / task_.chunk_size;
            ctx.total_chunks = total_chunks;

            task_.bytes_transferred += length;
            outcome_.bytes_sent += length;
            ++outcome_.chunks_sent;
            notify();
            save_record();

            ctx.bytes_transferred = task_.bytes_transferred;
            RU_LOG_CTX(log_level::trace, log_category::engine, "Chunk committed", ctx);

            // The final 100 is published by complete() once the writer closes
            if (task_.bytes_transferred < task_.total_size) {
                engine_.events_.publish_progress(
                    progress_event{task_.id, task_.percent(), task_.filename()});
            }
        }

        return {};
    }

    // ------------------------------------------------------------------------
    // Terminal transitions
    // ------------------------------------------------------------------------

    auto finish_with(const error& err) -> upload_outcome {
        if (err.code == error_code::upload_cancelled) {
            return cancel();
        }
        return fail(err);
    }

    auto complete() -> upload_outcome {
        if (auto r = with_retry("close", [&] { return close_writer(); }); !r) {
            return finish_with(r.error());
        }

        task_.bytes_transferred = task_.total_size;
        set_status(upload_status::completed);

        if (auto r = engine_.store_.remove(task_.id); !r) {
            RU_LOG_WARN(log_category::engine,
                "Completed upload left a resume record behind: " + r.error().message);
        }

        auto ctx = log_context();
        ctx.file_size = task_.total_size;
        ctx.bytes_transferred = outcome_.bytes_sent;
        RU_LOG_INFO_CTX(log_category::engine, "Upload completed", ctx);

        engine_.events_.publish_progress(progress_event{task_.id, 100, task_.filename()});
        engine_.events_.publish_completed(completion_event{task_.id, task_.filename()});
        return finalize();
    }

    auto cancel() -> upload_outcome {
        release_writer();
        set_status(upload_status::cancelled);
        save_record();

        auto ctx = log_context();
        ctx.bytes_transferred = task_.bytes_transferred;
        RU_LOG_INFO_CTX(log_category::engine, "Upload cancelled", ctx);

        outcome_.kind = error_kind::cancelled_by_caller;
        engine_.events_.publish_cancelled(
            cancellation_event{task_.id, task_.filename(), task_.bytes_transferred});
        return finalize();
    }

    auto fail(const error& err) -> upload_outcome {
        release_writer();

        auto kind = classify(err.code);
        task_.last_error = err;
        task_.last_error_kind = kind;
        set_status(upload_status::failed);
        save_record();

        auto ctx = log_context();
        ctx.bytes_transferred = task_.bytes_transferred;
        ctx.error_kind = std::string(to_string(kind));
        ctx.error_message = err.message;
        RU_LOG_ERROR_CTX(log_category::engine, "Upload failed", ctx);

        outcome_.last_error = err;
        outcome_.kind = kind;
        engine_.events_.publish_failed(
            failure_event{task_.id, task_.filename(), kind, err.message});
        return finalize();
    }

    void release_writer() {
        if (!writer_) {
            return;
        }
        if (auto r = writer_->close(); !r) {
            RU_LOG_DEBUG(log_category::engine,
                "Ignoring close error on abandoned writer for " + task_.id + ": " +
                r.error().message);
        }
        writer_.reset();
    }

    auto finalize() -> upload_outcome {
        outcome_.status = task_.status;
        outcome_.total_size = task_.total_size;
        outcome_.bytes_transferred = task_.bytes_transferred;
        return outcome_;
    }

    // ------------------------------------------------------------------------
    // Bookkeeping
    // ------------------------------------------------------------------------

    void save_record() {
        if (!have_fingerprint_) {
            return;
        }
        auto record = resume_record::from_task(task_, fingerprint_);
        if (auto r = engine_.store_.save(record); !r) {
            // The upload itself is unaffected; only resumability is lost
            RU_LOG_WARN(log_category::engine,
                "Failed to persist resume record for " + task_.id + ": " +
                r.error().message);
        }
    }

    void set_status(upload_status status) {
        task_.status = status;
        notify();
    }

    void notify() {
        if (on_update_) {
            on_update_(task_);
        }
    }

    [[nodiscard]] auto log_context() const -> upload_log_context {
        upload_log_context ctx;
        ctx.task_id = task_.id;
        ctx.filename = task_.filename();
        ctx.remote_path = task_.remote_path;
        return ctx;
    }

    const chunk_transfer_engine& engine_;
    upload_task& task_;
    upload_control& control_;
    const state_callback& on_update_;

    std::string fingerprint_;
    bool have_fingerprint_ = false;
    std::unique_ptr<remote_writer> writer_;
    upload_outcome outcome_;
};

// ============================================================================
// chunk_transfer_engine
// ============================================================================

chunk_transfer_engine::chunk_transfer_engine(std::shared_ptr<remote_access> remote,
                                             resume_store& store,
                                             const progress_event_bus& events,
                                             engine_options options)
    : remote_(std::move(remote))
    , store_(store)
    , events_(events)
    , options_(std::move(options)) {
}

auto chunk_transfer_engine::run(upload_task& task, upload_control& control,
                                const state_callback& on_update) -> upload_outcome {
    if (task.chunk_size == 0) {
        task.chunk_size = default_chunk_size;
    }

    if (!remote_) {
        upload_outcome outcome;
        error err{error_code::remote_not_configured};
        task.status = upload_status::failed;
        task.last_error = err;
        task.last_error_kind = classify(err.code);
        if (on_update) {
            on_update(task);
        }
        events_.publish_failed(
            failure_event{task.id, task.filename(), task.last_error_kind, err.message});
        outcome.status = upload_status::failed;
        outcome.last_error = err;
        outcome.kind = task.last_error_kind;
        return outcome;
    }

    run_context context(*this, task, control, on_update);
    return context.execute();
}

}  // namespace resumable::upload
