#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace slide_ingest::core {

using json = nlohmann::json;

/**
 * JSON-lines event stream. One object per line with "type", "run_id" and
 * "ts" keys. Safe to call from several threads.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void stage_start(const std::string& file, Stage stage);
    void stage_progress(const std::string& file, Stage stage, float progress,
                        const std::string& error = "");

    void file_complete(const std::string& file, double seconds, const json& extra);
    void file_error(const std::string& file, Stage stage, const std::string& message);
    void file_deleted(const std::string& file);

    void duplicate_scan(const json& report);
    void alert(const Alert& alert);

    void warning(const std::string& message);

    void emit(const std::string& type, const json& data);

private:
    void write(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace slide_ingest::core
