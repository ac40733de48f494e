#pragma once

#include "slide_ingest/core/events.hpp"
#include "slide_ingest/core/types.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace slide_ingest::pipeline {

// Where processed images are recorded. Keyed by the enhanced file name.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void upsert(const fs::path& original, const fs::path& archived,
                        const fs::path& enhanced, const EnhancementResult& result,
                        const std::vector<Tag>& tags) = 0;

    virtual void remove(const std::string& filename) = 0;
};

// Optional scene tagger. Never required for a file to succeed.
class Tagger {
public:
    virtual ~Tagger() = default;

    virtual bool available() const = 0;
    virtual std::vector<Tag> generate_tags(const fs::path& enhanced) = 0;
};

struct StatusUpdate {
    std::string file;
    Stage stage = Stage::QUEUED;
    float progress = 0.0f;
    std::string error;
};

// Best-effort progress channel; failures are logged by the caller and ignored.
class StatusSink {
public:
    virtual ~StatusSink() = default;

    virtual void publish(const StatusUpdate& update) = 0;
};

/**
 * Append-only JSON-lines catalog. Each upsert appends the full record,
 * each removal appends a tombstone; entries() replays the file so the last
 * line for a name wins.
 */
class JsonlCatalog : public PersistenceSink {
public:
    explicit JsonlCatalog(fs::path file);

    void upsert(const fs::path& original, const fs::path& archived,
                const fs::path& enhanced, const EnhancementResult& result,
                const std::vector<Tag>& tags) override;

    void remove(const std::string& filename) override;

    std::map<std::string, nlohmann::json> entries() const;
    const fs::path& file() const { return file_; }

private:
    void append(const nlohmann::json& record);

    fs::path file_;
    mutable std::mutex mutex_;
};

// Forwards stage transitions to the JSON-lines event stream.
class EventStatusSink : public StatusSink {
public:
    explicit EventStatusSink(core::EventEmitter& events) : events_(events) {}

    void publish(const StatusUpdate& update) override;

private:
    core::EventEmitter& events_;
};

} // namespace slide_ingest::pipeline
