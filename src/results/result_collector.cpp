#include "results/result_collector.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentyard::results {

struct OutputReader::Stream {
    std::mutex write_mutex;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<OutputChunk> window;
    std::uint64_t next_seq = 0;
    std::uint64_t bytes = 0;
    bool finished = false;
};

OutputReader::OutputReader(ResultCollector& collector, std::string task_id, std::shared_ptr<Stream> stream)
    : collector_(collector)
    , task_id_(std::move(task_id))
    , stream_(std::move(stream)) {}

OutputReader::ReadResult OutputReader::Next(std::chrono::milliseconds timeout) {
    ReadResult result{};
    {
        std::unique_lock<std::mutex> lock(stream_->mutex);
        const bool ready = stream_->cv.wait_for(lock, timeout, [this] {
            return cursor_ < stream_->next_seq || stream_->finished;
        });
        if (!ready) {
            result.status = Status::kTimeout;
            return result;
        }
        if (cursor_ >= stream_->next_seq) {
            result.status = Status::kEnd;
            return result;
        }
        if (!stream_->window.empty() && stream_->window.front().seq <= cursor_) {
            result.status = Status::kChunk;
            result.chunk = stream_->window[cursor_ - stream_->window.front().seq];
            ++cursor_;
            return result;
        }
    }

    // Evicted from the window: read back from the log.
    auto chunk = collector_.LoadChunk(task_id_, cursor_);
    if (!chunk) {
        throw store::StoreError("missing output chunk " + std::to_string(cursor_) + " for " + task_id_);
    }
    result.status = Status::kChunk;
    result.chunk = std::move(*chunk);
    ++cursor_;
    return result;
}

std::string OutputReader::ReadAll(std::chrono::milliseconds idle) {
    std::string output;
    while (true) {
        auto next = Next(idle);
        if (next.status != Status::kChunk) {
            break;
        }
        output += next.chunk.data;
    }
    return output;
}

ResultCollector::ResultCollector(store::Database& db, std::size_t window_chunks)
    : db_(db)
    , window_chunks_(window_chunks == 0 ? 1 : window_chunks) {
    auto lock = db_.Lock();
    db_.Exec("CREATE TABLE IF NOT EXISTS output_streams ("
             "task_id TEXT PRIMARY KEY,"
             "finished INTEGER NOT NULL DEFAULT 0,"
             "bytes INTEGER NOT NULL DEFAULT 0,"
             "outcome TEXT,"
             "created_at_ms INTEGER,"
             "updated_at_ms INTEGER"
             ");");
    db_.Exec("CREATE TABLE IF NOT EXISTS output_chunks ("
             "task_id TEXT NOT NULL,"
             "seq INTEGER NOT NULL,"
             "data BLOB,"
             "created_at_ms INTEGER,"
             "PRIMARY KEY(task_id, seq)"
             ");");
}

void ResultCollector::Open(const std::string& task_id) {
    {
        auto lock = db_.Lock();
        store::Statement stmt(db_,
            "INSERT OR IGNORE INTO output_streams(task_id, finished, bytes, created_at_ms, updated_at_ms) "
            "VALUES(?, 0, 0, ?, ?);");
        const auto now = utils::ToMillis(utils::Now());
        stmt.Bind(1, task_id).Bind(2, now).Bind(3, now);
        stmt.Step();
    }
    std::lock_guard<std::mutex> lock(streams_mutex_);
    if (streams_.find(task_id) == streams_.end()) {
        streams_.emplace(task_id, std::make_shared<Stream>());
    }
}

bool ResultCollector::Append(const std::string& task_id, const std::string& data) {
    auto stream = FindStream(task_id);
    if (!stream) {
        throw store::StoreError("no output stream for " + task_id);
    }
    std::lock_guard<std::mutex> write_lock(stream->write_mutex);
    std::uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (stream->finished) {
            utils::LogWarn("output") << task_id << " dropping chunk after finish";
            return false;
        }
        seq = stream->next_seq;
    }

    OutputChunk chunk{.seq = seq, .data = data, .at = utils::Now()};
    {
        auto lock = db_.Lock();
        db_.Exec("BEGIN TRANSACTION;");
        try {
            store::Statement insert(db_,
                "INSERT INTO output_chunks(task_id, seq, data, created_at_ms) VALUES(?, ?, ?, ?);");
            insert.Bind(1, task_id)
                .Bind(2, static_cast<long long>(seq))
                .BindBlob(3, data)
                .Bind(4, utils::ToMillis(chunk.at));
            insert.Step();
            store::Statement update(db_,
                "UPDATE output_streams SET bytes = bytes + ?, updated_at_ms = ? WHERE task_id = ?;");
            update.Bind(1, static_cast<long long>(data.size()))
                .Bind(2, utils::ToMillis(chunk.at))
                .Bind(3, task_id);
            update.Step();
            db_.Exec("COMMIT;");
        } catch (const store::StoreError&) {
            db_.Exec("ROLLBACK;");
            throw;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        stream->window.push_back(std::move(chunk));
        while (stream->window.size() > window_chunks_) {
            stream->window.pop_front();
        }
        stream->next_seq = seq + 1;
        stream->bytes += data.size();
    }
    stream->cv.notify_all();
    return true;
}

void ResultCollector::Finish(const std::string& task_id) {
    {
        auto lock = db_.Lock();
        store::Statement stmt(db_, "UPDATE output_streams SET finished = 1, updated_at_ms = ? WHERE task_id = ?;");
        stmt.Bind(1, utils::ToMillis(utils::Now())).Bind(2, task_id);
        stmt.Step();
    }
    auto stream = FindStream(task_id);
    if (!stream) {
        return;
    }
    {
        std::lock_guard<std::mutex> write_lock(stream->write_mutex);
        std::lock_guard<std::mutex> lock(stream->mutex);
        stream->finished = true;
    }
    stream->cv.notify_all();
}

void ResultCollector::SaveOutcome(const std::string& task_id, const nlohmann::json& outcome) {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "UPDATE output_streams SET outcome = ?, updated_at_ms = ? WHERE task_id = ?;");
    stmt.Bind(1, outcome.dump()).Bind(2, utils::ToMillis(utils::Now())).Bind(3, task_id);
    stmt.Step();
}

std::optional<nlohmann::json> ResultCollector::LoadOutcome(const std::string& task_id) const {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "SELECT outcome FROM output_streams WHERE task_id = ?;");
    stmt.Bind(1, task_id);
    if (!stmt.Step() || stmt.ColumnIsNull(0)) {
        return std::nullopt;
    }
    auto parsed = nlohmann::json::parse(stmt.ColumnText(0), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

std::uint64_t ResultCollector::Bytes(const std::string& task_id) const {
    auto stream = FindStream(task_id);
    if (!stream) {
        stream = LoadStream(task_id);
    }
    if (!stream) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->bytes;
}

std::uint64_t ResultCollector::ChunkCount(const std::string& task_id) const {
    auto stream = FindStream(task_id);
    if (!stream) {
        stream = LoadStream(task_id);
    }
    if (!stream) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->next_seq;
}

bool ResultCollector::IsFinished(const std::string& task_id) const {
    auto stream = FindStream(task_id);
    if (!stream) {
        stream = LoadStream(task_id);
    }
    if (!stream) {
        return false;
    }
    std::lock_guard<std::mutex> lock(stream->mutex);
    return stream->finished;
}

bool ResultCollector::Exists(const std::string& task_id) const {
    return FindStream(task_id) != nullptr || LoadStream(task_id) != nullptr;
}

std::unique_ptr<OutputReader> ResultCollector::OpenReader(const std::string& task_id) {
    auto stream = FindStream(task_id);
    if (!stream) {
        stream = LoadStream(task_id);
        if (!stream) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(streams_mutex_);
        stream = streams_.emplace(task_id, stream).first->second;
    }
    return std::unique_ptr<OutputReader>(new OutputReader(*this, task_id, std::move(stream)));
}

void ResultCollector::Purge(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.erase(task_id);
    }
    auto lock = db_.Lock();
    store::Statement chunks(db_, "DELETE FROM output_chunks WHERE task_id = ?;");
    chunks.Bind(1, task_id);
    chunks.Step();
    store::Statement stream(db_, "DELETE FROM output_streams WHERE task_id = ?;");
    stream.Bind(1, task_id);
    stream.Step();
}

std::shared_ptr<ResultCollector::Stream> ResultCollector::FindStream(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(task_id);
    return it == streams_.end() ? nullptr : it->second;
}

std::shared_ptr<ResultCollector::Stream> ResultCollector::LoadStream(const std::string& task_id) const {
    auto lock = db_.Lock();
    store::Statement stmt(db_,
        "SELECT s.finished, s.bytes, (SELECT COUNT(*) FROM output_chunks c WHERE c.task_id = s.task_id) "
        "FROM output_streams s WHERE s.task_id = ?;");
    stmt.Bind(1, task_id);
    if (!stmt.Step()) {
        return nullptr;
    }
    auto stream = std::make_shared<Stream>();
    stream->finished = stmt.ColumnInt64(0) != 0;
    stream->bytes = static_cast<std::uint64_t>(stmt.ColumnInt64(1));
    stream->next_seq = static_cast<std::uint64_t>(stmt.ColumnInt64(2));
    return stream;
}

std::optional<OutputChunk> ResultCollector::LoadChunk(const std::string& task_id, std::uint64_t seq) const {
    auto lock = db_.Lock();
    store::Statement stmt(db_, "SELECT data, created_at_ms FROM output_chunks WHERE task_id = ? AND seq = ?;");
    stmt.Bind(1, task_id).Bind(2, static_cast<long long>(seq));
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return OutputChunk{
        .seq = seq,
        .data = stmt.ColumnBlob(0),
        .at = utils::FromMillis(stmt.ColumnInt64(1))};
}

}  // namespace agentyard::results
