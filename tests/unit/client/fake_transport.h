/**
 * @file fake_transport.h
 * @brief Scriptable in-process chunk_transport for client tests
 *
 * Simulates the session server: the first chunk without an upload id
 * opens a session, later chunks must name a known one, and the session
 * completes when every index has been received. Failures can be queued
 * and requests can be held at a gate until released or aborted.
 */

#ifndef UPLOAD_PIPELINE_TESTS_FAKE_TRANSPORT_H
#define UPLOAD_PIPELINE_TESTS_FAKE_TRANSPORT_H

#include <upload_pipeline/client/chunk_transport.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace upload_pipeline::test {

class fake_transport : public chunk_transport {
public:
    struct sent_chunk {
        std::optional<std::string> upload_id;
        uint64_t chunk_index = 0;
        uint64_t total_chunks = 0;
        std::string file_name;
        std::string metadata_json;
        std::size_t size = 0;
    };

    /// The next @p count sends fail with @p code before reaching the server
    void fail_next(int count, error_code code) {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < count; ++i) {
            failures_.push_back(code);
        }
    }

    /// Every send fails with @p code until cleared with std::nullopt
    void fail_always(std::optional<error_code> code) {
        std::lock_guard lock(mutex_);
        always_fail_ = code;
    }

    /**
     * @brief Block sends of chunk @p from_index and later at a gate
     * @param abortable When false, a cancelled token does not open the gate
     *        and the request still reaches the server after release()
     */
    void hold(uint64_t from_index = 0, bool abortable = true) {
        std::lock_guard lock(mutex_);
        hold_from_ = from_index;
        abortable_ = abortable;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            hold_from_.reset();
        }
        cv_.notify_all();
    }

    /// Wait until @p count sends are blocked at the gate
    [[nodiscard]] auto wait_for_held(std::size_t count, std::chrono::milliseconds timeout)
        -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return held_ >= count; });
    }

    /// Acknowledge the next send of @p index without storing it; stacks
    void lose_once(uint64_t index) {
        std::lock_guard lock(mutex_);
        lost_.insert(index);
    }

    /// Forget a session as a restarted server would
    void drop_session(const std::string& upload_id) {
        std::lock_guard lock(mutex_);
        sessions_.erase(upload_id);
    }

    [[nodiscard]] auto sent() const -> std::vector<sent_chunk> {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    [[nodiscard]] auto calls() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    [[nodiscard]] auto held() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return held_;
    }

    [[nodiscard]] auto max_in_flight() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return max_in_flight_;
    }

    [[nodiscard]] auto session_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    [[nodiscard]] auto cancelled_sessions() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    auto send_chunk(const protocol::chunk_request& request, cancellation_token& token)
        -> result<protocol::chunk_receipt> override {
        scoped_abort_hook hook(token, [this] {
            { std::lock_guard lock(mutex_); }
            cv_.notify_all();
        });

        std::unique_lock lock(mutex_);
        ++calls_;
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);

        if (hold_from_ && request.chunk_index >= *hold_from_) {
            ++held_;
            cv_.notify_all();
            cv_.wait(lock, [&] { return !hold_from_ || (abortable_ && token.is_cancelled()); });
            --held_;
        }
        --in_flight_;

        if (abortable_ && token.is_cancelled()) {
            return unexpected(error{error_code::cancelled, "request aborted"});
        }
        if (always_fail_) {
            return unexpected(error{*always_fail_, "scripted failure"});
        }
        if (!failures_.empty()) {
            auto code = failures_.front();
            failures_.pop_front();
            return unexpected(error{code, "scripted failure"});
        }

        sent_.push_back(sent_chunk{request.upload_id, request.chunk_index, request.total_chunks,
                                   request.file_name, request.metadata_json,
                                   request.bytes.size()});
        return accept_locked(request);
    }

    auto query_status(const std::string& upload_id) -> result<protocol::session_status> override {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            return unexpected(error{error_code::session_not_found, "unknown session"});
        }
        protocol::session_status status;
        status.upload_id = upload_id;
        status.received_chunks = it->second.received.size();
        status.total_chunks = it->second.total;
        status.status = status.received_chunks == status.total_chunks
                            ? protocol::session_state::completed
                            : protocol::session_state::uploading;
        return status;
    }

    auto cancel_session(const std::string& upload_id) -> result<void> override {
        std::lock_guard lock(mutex_);
        cancelled_.push_back(upload_id);
        if (sessions_.erase(upload_id) == 0) {
            return unexpected(error{error_code::session_not_found, "unknown session"});
        }
        return {};
    }

private:
    struct session {
        uint64_t total = 0;
        std::set<uint64_t> received;
    };

    auto accept_locked(const protocol::chunk_request& request) -> result<protocol::chunk_receipt> {
        std::string id;
        if (!request.upload_id) {
            if (request.chunk_index != 0) {
                return unexpected(error{error_code::invalid_request, "missing uploadId"});
            }
            id = "session-" + std::to_string(++next_session_);
            sessions_[id].total = request.total_chunks;
        } else {
            id = *request.upload_id;
            if (sessions_.find(id) == sessions_.end()) {
                return unexpected(error{error_code::session_not_found,
                                        "Upload ID " + id + " does not exist"});
            }
        }

        auto& s = sessions_[id];
        if (auto lost = lost_.find(request.chunk_index); lost != lost_.end()) {
            lost_.erase(lost);
        } else {
            s.received.insert(request.chunk_index);
        }

        protocol::chunk_receipt receipt;
        receipt.upload_id = id;
        receipt.received_chunks = s.received.size();
        if (s.received.size() == s.total) {
            receipt.status = protocol::session_state::completed;
            receipt.progress = 100;
            receipt.evidence_id = id;
            receipt.message = "Upload completed successfully";
            return receipt;
        }

        receipt.total_chunks = s.total;
        receipt.progress = static_cast<int>(s.received.size() * 100 / s.total);
        receipt.message = "Chunk " + std::to_string(request.chunk_index + 1) + "/" +
                          std::to_string(s.total) + " received";
        if (request.chunk_index + 1 == s.total) {
            for (uint64_t i = 0; i < s.total; ++i) {
                if (s.received.count(i) == 0) {
                    receipt.missing_chunks.push_back(i);
                }
            }
        }
        return receipt;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<error_code> failures_;
    std::optional<error_code> always_fail_;
    std::optional<uint64_t> hold_from_;
    bool abortable_ = true;
    std::size_t held_ = 0;
    std::size_t calls_ = 0;
    std::size_t in_flight_ = 0;
    std::size_t max_in_flight_ = 0;
    std::multiset<uint64_t> lost_;
    std::map<std::string, session> sessions_;
    uint64_t next_session_ = 0;
    std::vector<sent_chunk> sent_;
    std::vector<std::string> cancelled_;
};

}  // namespace upload_pipeline::test

#endif  // UPLOAD_PIPELINE_TESTS_FAKE_TRANSPORT_H
