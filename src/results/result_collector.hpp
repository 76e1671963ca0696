#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "nlohmann/json.hpp"
#include "store/database.hpp"

namespace agentyard::results {

struct OutputChunk {
    std::uint64_t seq = 0;
    std::string data;
    std::chrono::system_clock::time_point at{};
};

class ResultCollector;

// Independent cursor over one task's output. Starts at chunk 0 and sees
// chunks in emission order; finite once the stream is finished.
class OutputReader {
public:
    enum class Status {
        kChunk,
        kEnd,
        kTimeout
    };

    struct ReadResult {
        Status status = Status::kTimeout;
        OutputChunk chunk;
    };

    ReadResult Next(std::chrono::milliseconds timeout);

    // Concatenates every remaining chunk. Stops early when no chunk arrives
    // within `idle`; returns whatever was read so far.
    std::string ReadAll(std::chrono::milliseconds idle);

    std::uint64_t Position() const { return cursor_; }

private:
    friend class ResultCollector;
    struct Stream;

    OutputReader(ResultCollector& collector, std::string task_id, std::shared_ptr<Stream> stream);

    ResultCollector& collector_;
    std::string task_id_;
    std::shared_ptr<Stream> stream_;
    std::uint64_t cursor_ = 0;
};

// Per-task output log. Every chunk reaches SQLite before any reader can see
// it; the last `window_chunks` chunks are also served from memory.
class ResultCollector {
public:
    ResultCollector(store::Database& db, std::size_t window_chunks);

    void Open(const std::string& task_id);

    // Returns false when the stream is already finished and the chunk is dropped.
    bool Append(const std::string& task_id, const std::string& data);
    void Finish(const std::string& task_id);

    void SaveOutcome(const std::string& task_id, const nlohmann::json& outcome);
    std::optional<nlohmann::json> LoadOutcome(const std::string& task_id) const;

    std::uint64_t Bytes(const std::string& task_id) const;
    std::uint64_t ChunkCount(const std::string& task_id) const;
    bool IsFinished(const std::string& task_id) const;
    bool Exists(const std::string& task_id) const;

    // nullptr when the task has no stream.
    std::unique_ptr<OutputReader> OpenReader(const std::string& task_id);

    void Purge(const std::string& task_id);

private:
    friend class OutputReader;
    using Stream = OutputReader::Stream;

    std::shared_ptr<Stream> FindStream(const std::string& task_id) const;
    std::shared_ptr<Stream> LoadStream(const std::string& task_id) const;
    std::optional<OutputChunk> LoadChunk(const std::string& task_id, std::uint64_t seq) const;

    store::Database& db_;
    std::size_t window_chunks_;
    mutable std::mutex streams_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<Stream>> streams_;
};

}  // namespace agentyard::results
