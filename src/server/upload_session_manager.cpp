/**
 * @file upload_session_manager.cpp
 * @brief Implementation of server-side upload sessions
 */

#include "upload_pipeline/server/upload_session_manager.h"

#include <algorithm>
#include <fstream>
#include <span>
#include <string_view>

#include "upload_pipeline/core/checksum.h"
#include "upload_pipeline/core/file_io.h"
#include "upload_pipeline/core/logging.h"
#include "upload_pipeline/core/timestamp.h"
#include "upload_pipeline/core/unique_id.h"

namespace upload_pipeline {

namespace {

constexpr std::size_t assembly_buffer_size = 64 * 1024;
constexpr const char* record_suffix = ".session.json";

auto context_for(const upload_session& session) -> upload_log_context {
    upload_log_context ctx;
    ctx.upload_id = session.id;
    ctx.file_name = session.file_name;
    ctx.total_chunks = session.total_chunks;
    ctx.progress = session.progress();
    return ctx;
}

/**
 * @brief True when @p text is well-formed UTF-8
 */
auto is_valid_utf8(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (text.size() - i <= extra) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        static constexpr uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[extra] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

/**
 * @brief Strip directories so a client cannot write outside upload_dir
 */
auto sanitize_file_name(const std::string& name) -> std::optional<std::string> {
    auto base = std::filesystem::path(name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return std::nullopt;
    }
    return base;
}

auto parse_metadata(const std::string& text) -> result<nlohmann::json> {
    if (text.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return unexpected(error{error_code::invalid_metadata, "metadata must be a JSON object"});
    }
    return parsed;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

auto upload_session_manager::create(server_config config)
    -> result<std::shared_ptr<upload_session_manager>> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    for (const auto& dir : {config.upload_directory, config.temp_directory}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create directory " + dir.string() + ": " +
                                        ec.message()});
        }
    }

    return std::make_shared<upload_session_manager>(std::move(config));
}

upload_session_manager::upload_session_manager(server_config config)
    : config_(std::move(config)) {
    if (config_.persist_sessions) {
        load_persisted();
    }
}

auto upload_session_manager::chunk_path(const std::string& upload_id, uint64_t index) const
    -> std::filesystem::path {
    return config_.temp_directory / (upload_id + "-chunk-" + std::to_string(index));
}

auto upload_session_manager::record_path(const std::string& upload_id) const
    -> std::filesystem::path {
    return config_.temp_directory / (upload_id + record_suffix);
}

void upload_session_manager::load_persisted() {
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.temp_directory, ec);
    if (ec) {
        return;
    }

    std::size_t restored = 0;
    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !name.ends_with(record_suffix)) {
            continue;
        }

        auto content = read_file(entry.path());
        if (!content) {
            UP_LOG_WARN(log_category::session, content.error().message);
            continue;
        }
        auto json = nlohmann::json::parse(content.value(), nullptr, false);
        auto session = session_from_json(json);
        if (!session) {
            UP_LOG_WARN(log_category::session,
                        "ignoring session record " + name + ": " + session.error().message);
            continue;
        }

        auto& s = session.value();
        if (s.status == protocol::session_state::uploading) {
            // Only chunks whose files survived the restart count as received.
            for (auto index_it = s.received.begin(); index_it != s.received.end();) {
                if (std::filesystem::exists(chunk_path(s.id, *index_it), ec)) {
                    ++index_it;
                } else {
                    index_it = s.received.erase(index_it);
                }
            }
        }
        s.last_activity = std::chrono::steady_clock::now();

        auto restored_entry = std::make_shared<session_entry>();
        restored_entry->session = std::move(s);
        sessions_.emplace(restored_entry->session.id, std::move(restored_entry));
        ++restored;
    }

    if (restored > 0) {
        UP_LOG_INFO(log_category::session,
                    "restored " + std::to_string(restored) + " upload session(s)");
    }
}

// ============================================================================
// Chunk receipt
// ============================================================================

auto upload_session_manager::find_entry(const std::string& upload_id) const
    -> std::shared_ptr<session_entry> {
    std::shared_lock lock(sessions_mutex_);
    auto it = sessions_.find(upload_id);
    return it == sessions_.end() ? nullptr : it->second;
}

auto upload_session_manager::open_session(const chunk_upload& chunk,
                                          nlohmann::json metadata,
                                          std::string file_name)
    -> result<std::shared_ptr<session_entry>> {
    if (chunk.upload_id) {
        auto entry = find_entry(*chunk.upload_id);
        if (!entry) {
            return unexpected(error{error_code::session_not_found,
                                    "Upload ID " + *chunk.upload_id + " does not exist"});
        }
        return entry;
    }

    if (chunk.chunk_index != 0) {
        return unexpected(error{error_code::invalid_request,
                                "uploadId is required for chunk " +
                                    std::to_string(chunk.chunk_index)});
    }

    auto entry = std::make_shared<session_entry>();
    auto& s = entry->session;
    s.id = make_session_id();
    s.file_name = std::move(file_name);
    s.metadata = std::move(metadata);
    s.total_chunks = chunk.total_chunks;
    s.created_at = iso8601_now();

    {
        std::unique_lock lock(sessions_mutex_);
        sessions_.emplace(s.id, entry);
    }

    auto ctx = context_for(s);
    UP_LOG_INFO_CTX(log_category::session, "upload session created", ctx);
    return entry;
}

auto upload_session_manager::receive_chunk(const chunk_upload& chunk)
    -> result<protocol::chunk_receipt> {
    if (chunk.total_chunks == 0) {
        return unexpected(error{error_code::invalid_request, "totalChunks must be at least 1"});
    }
    if (chunk.chunk_index >= chunk.total_chunks) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(chunk.chunk_index) +
                                    " out of range for " + std::to_string(chunk.total_chunks) +
                                    " chunks"});
    }
    if (chunk.bytes.size() > config_.max_chunk_size) {
        return unexpected(error{error_code::chunk_too_large,
                                "chunk of " + std::to_string(chunk.bytes.size()) +
                                    " bytes exceeds the limit of " +
                                    std::to_string(config_.max_chunk_size)});
    }
    auto file_name = sanitize_file_name(chunk.file_name);
    if (!file_name) {
        return unexpected(error{error_code::invalid_request, "fileName is required"});
    }
    if (!is_valid_utf8(*file_name)) {
        return unexpected(error{error_code::invalid_request, "fileName must be valid UTF-8"});
    }
    auto metadata = parse_metadata(chunk.metadata_json);
    if (!metadata) {
        return unexpected(metadata.error());
    }

    auto entry = open_session(chunk, std::move(metadata.value()), std::move(*file_name));
    if (!entry) {
        return unexpected(entry.error());
    }

    auto& e = *entry.value();
    std::lock_guard lock(e.mutex);
    auto& session = e.session;

    if (e.removed) {
        return unexpected(error{error_code::session_not_found,
                                "Upload ID " + session.id + " does not exist"});
    }
    if (session.total_chunks != chunk.total_chunks) {
        return unexpected(error{error_code::chunk_count_mismatch,
                                "session expects " + std::to_string(session.total_chunks) +
                                    " chunks, request says " +
                                    std::to_string(chunk.total_chunks)});
    }
    session.last_activity = std::chrono::steady_clock::now();

    if (session.status == protocol::session_state::completed) {
        return make_receipt(session, chunk.chunk_index);
    }

    auto written = write_file_atomic(
        chunk_path(session.id, chunk.chunk_index),
        std::string_view(reinterpret_cast<const char*>(chunk.bytes.data()), chunk.bytes.size()));
    if (!written) {
        return unexpected(written.error());
    }
    session.received.insert(chunk.chunk_index);

    auto ctx = context_for(session);
    ctx.chunk_index = chunk.chunk_index;
    UP_LOG_DEBUG_CTX(log_category::session, "chunk stored", ctx);

    if (session.received.size() == session.total_chunks) {
        auto assembled = assemble(session);
        persist(session);
        if (!assembled) {
            return unexpected(assembled.error());
        }
    } else {
        persist(session);
    }

    return make_receipt(session, chunk.chunk_index);
}

auto upload_session_manager::assemble(upload_session& session) -> result<void> {
    auto final_path = config_.upload_directory / (session.id + "-" + session.file_name);
    auto temp_path = final_path;
    temp_path += ".assembling";

    auto fail = [&](error err) -> result<void> {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        auto ctx = context_for(session);
        ctx.error_message = err.message;
        UP_LOG_ERROR_CTX(log_category::session, "assembly failed", ctx);
        return unexpected(std::move(err));
    };

    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(error{error_code::assembly_failed,
                          "cannot create " + temp_path.string()});
    }

    sha256_hasher hasher;
    std::vector<char> buffer(assembly_buffer_size);
    uint64_t expected_size = 0;
    uint64_t written = 0;

    for (uint64_t index = 0; index < session.total_chunks; ++index) {
        auto path = chunk_path(session.id, index);
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        std::ifstream in(path, std::ios::binary);
        if (ec || !in) {
            // The client resends it once the receipt lists it as missing.
            session.received.erase(index);
            out.close();
            return fail(error{error_code::chunk_read_failed,
                              "chunk " + std::to_string(index) + " could not be read"});
        }
        expected_size += size;

        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = static_cast<std::size_t>(in.gcount());
            if (count == 0) {
                break;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(count));
            auto hashed = hasher.update(std::as_bytes(std::span(buffer.data(), count)));
            if (!hashed) {
                out.close();
                return fail(hashed.error());
            }
            written += count;
        }
        if (in.bad()) {
            session.received.erase(index);
            out.close();
            return fail(error{error_code::chunk_read_failed,
                              "chunk " + std::to_string(index) + " could not be read"});
        }
    }

    out.close();
    if (!out) {
        return fail(error{error_code::assembly_failed, "write failed for " + temp_path.string()});
    }
    if (written != expected_size) {
        return fail(error{error_code::assembly_failed,
                          "assembled " + std::to_string(written) + " bytes, expected " +
                              std::to_string(expected_size)});
    }

    auto digest = hasher.finish();
    if (!digest) {
        return fail(digest.error());
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        return fail(error{error_code::assembly_failed,
                          "cannot move artifact into place: " + ec.message()});
    }

    for (uint64_t index = 0; index < session.total_chunks; ++index) {
        std::filesystem::remove(chunk_path(session.id, index), ec);
    }

    session.status = protocol::session_state::completed;
    session.completed_at = iso8601_now();
    session.artifact_path = final_path;
    session.artifact_size = written;
    session.sha256 = std::move(digest.value());

    auto ctx = context_for(session);
    ctx.file_size = written;
    UP_LOG_INFO_CTX(log_category::session, "upload assembled", ctx);
    return {};
}

auto upload_session_manager::make_receipt(const upload_session& session,
                                          uint64_t chunk_index) const
    -> protocol::chunk_receipt {
    protocol::chunk_receipt receipt;
    receipt.upload_id = session.id;
    receipt.status = session.status;
    receipt.progress = session.progress();
    receipt.received_chunks = session.received.size();
    receipt.total_chunks = session.total_chunks;

    if (session.status == protocol::session_state::completed) {
        receipt.message = "Upload completed successfully";
        receipt.evidence_id = session.id;
        receipt.sha256 = session.sha256;
        return receipt;
    }

    receipt.message = "Chunk " + std::to_string(chunk_index + 1) + "/" +
                      std::to_string(session.total_chunks) + " received";
    if (chunk_index + 1 == session.total_chunks) {
        receipt.missing_chunks = session.missing();
    }
    return receipt;
}

// ============================================================================
// Queries and cleanup
// ============================================================================

auto upload_session_manager::status(const std::string& upload_id) const
    -> result<protocol::session_status> {
    auto entry = find_entry(upload_id);
    if (!entry) {
        return unexpected(error{error_code::session_not_found,
                                "Upload ID " + upload_id + " does not exist"});
    }

    std::lock_guard lock(entry->mutex);
    const auto& s = entry->session;

    protocol::session_status status;
    status.upload_id = s.id;
    status.status = s.status;
    status.progress = s.progress();
    status.received_chunks = s.received.size();
    status.total_chunks = s.total_chunks;
    status.created_at = s.created_at;
    status.completed_at = s.completed_at;
    return status;
}

auto upload_session_manager::cancel(const std::string& upload_id) -> result<void> {
    std::shared_ptr<session_entry> entry;
    {
        std::unique_lock lock(sessions_mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            return unexpected(error{error_code::session_not_found,
                                    "Upload ID " + upload_id + " does not exist"});
        }
        entry = std::move(it->second);
        sessions_.erase(it);
    }

    std::lock_guard lock(entry->mutex);
    entry->removed = true;
    remove_files(entry->session);
    auto ctx = context_for(entry->session);
    UP_LOG_INFO_CTX(log_category::session, "upload session cancelled", ctx);
    return {};
}

void upload_session_manager::remove_files(const upload_session& session) const {
    std::error_code ec;
    for (uint64_t index = 0; index < session.total_chunks; ++index) {
        std::filesystem::remove(chunk_path(session.id, index), ec);
    }
    std::filesystem::remove(record_path(session.id), ec);
}

auto upload_session_manager::list_completed() const -> std::vector<protocol::evidence_record> {
    std::vector<std::shared_ptr<session_entry>> entries;
    {
        std::shared_lock lock(sessions_mutex_);
        for (const auto& [id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<protocol::evidence_record> records;
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        const auto& s = entry->session;
        if (s.status != protocol::session_state::completed) {
            continue;
        }
        protocol::evidence_record record;
        record.id = s.id;
        record.file_name = s.file_name;
        record.metadata = s.metadata;
        record.uploaded_at = s.completed_at.value_or(s.created_at);
        record.size = s.artifact_size;
        record.sha256 = s.sha256;
        records.push_back(std::move(record));
    }

    std::sort(records.begin(), records.end(),
              [](const auto& a, const auto& b) { return a.uploaded_at < b.uploaded_at; });
    return records;
}

auto upload_session_manager::active_session_count() const -> std::size_t {
    std::vector<std::shared_ptr<session_entry>> entries;
    {
        std::shared_lock lock(sessions_mutex_);
        for (const auto& [id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::size_t count = 0;
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        if (entry->session.status == protocol::session_state::uploading) {
            ++count;
        }
    }
    return count;
}

auto upload_session_manager::expire_sessions(std::chrono::milliseconds max_age) -> std::size_t {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> expired;
    {
        std::shared_lock lock(sessions_mutex_);
        for (const auto& [id, entry] : sessions_) {
            std::lock_guard session_lock(entry->mutex);
            if (entry->session.status == protocol::session_state::uploading &&
                now - entry->session.last_activity > max_age) {
                expired.push_back(id);
            }
        }
    }

    std::size_t removed = 0;
    for (const auto& id : expired) {
        if (cancel(id)) {
            ++removed;
        }
    }
    if (removed > 0) {
        UP_LOG_INFO(log_category::session,
                    "expired " + std::to_string(removed) + " idle upload session(s)");
    }
    return removed;
}

void upload_session_manager::persist(const upload_session& session) const {
    if (!config_.persist_sessions) {
        return;
    }
    auto written = write_file_atomic(
        record_path(session.id),
        nlohmann::json(session).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    if (!written) {
        UP_LOG_WARN(log_category::session,
                    "cannot persist session " + session.id + ": " + written.error().message);
    }
}

}  // namespace upload_pipeline
