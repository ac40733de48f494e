#include "slide_ingest/core/events.hpp"
#include "slide_ingest/core/utils.hpp"

namespace slide_ingest::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    write(event);
}

void EventEmitter::stage_start(const std::string& file, Stage stage) {
    json event = base_event("stage_start");
    event["file"] = file;
    event["stage"] = stage_to_string(stage);
    write(event);
}

void EventEmitter::stage_progress(const std::string& file, Stage stage, float progress,
                                  const std::string& error) {
    json event = base_event("stage_progress");
    event["file"] = file;
    event["stage"] = stage_to_string(stage);
    event["progress"] = progress;
    if (!error.empty()) {
        event["error"] = error;
    }
    write(event);
}

void EventEmitter::file_complete(const std::string& file, double seconds, const json& extra) {
    json event = base_event("file_complete");
    event["file"] = file;
    event["seconds"] = seconds;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::file_error(const std::string& file, Stage stage, const std::string& message) {
    json event = base_event("file_error");
    event["file"] = file;
    event["stage"] = stage_to_string(stage);
    event["message"] = message;
    write(event);
}

void EventEmitter::file_deleted(const std::string& file) {
    json event = base_event("file_deleted");
    event["file"] = file;
    write(event);
}

void EventEmitter::duplicate_scan(const json& report) {
    emit("duplicate_scan", report);
}

void EventEmitter::alert(const Alert& alert) {
    json event = base_event("alert");
    event["alert_type"] = alert.type;
    event["severity"] = alert.severity;
    event["message"] = alert.message;
    write(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    write(event);
}

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = base_event(type);
    if (data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }
    write(event);
}

} // namespace slide_ingest::core
