#include "slide_ingest/pipeline/collaborators.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/json_io.hpp"
#include "slide_ingest/core/utils.hpp"

#include <fstream>

namespace slide_ingest::pipeline {

JsonlCatalog::JsonlCatalog(fs::path file)
    : file_(std::move(file)) {}

void JsonlCatalog::append(const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.has_parent_path()) {
        core::ensure_directory(file_.parent_path());
    }
    std::ofstream out(file_, std::ios::app);
    if (!out) {
        throw IOError("Cannot open catalog: " + file_.string());
    }
    out << record.dump() << "\n";
    if (!out) {
        throw IOError("Cannot append to catalog: " + file_.string());
    }
}

void JsonlCatalog::upsert(const fs::path& original, const fs::path& archived,
                          const fs::path& enhanced, const EnhancementResult& result,
                          const std::vector<Tag>& tags) {
    std::error_code ec;
    const auto size = fs::file_size(enhanced, ec);

    nlohmann::json record = {
        {"op", "upsert"},
        {"filename", enhanced.filename().string()},
        {"original_path", original.string()},
        {"archived_path", archived.string()},
        {"enhanced_path", enhanced.string()},
        {"file_size", ec ? 0 : size},
        {"result", result},
        {"tags", tags},
        {"status", "complete"},
        {"ts", core::get_iso_timestamp()}
    };
    append(record);
}

void JsonlCatalog::remove(const std::string& filename) {
    append({
        {"op", "delete"},
        {"filename", filename},
        {"ts", core::get_iso_timestamp()}
    });
}

std::map<std::string, nlohmann::json> JsonlCatalog::entries() const {
    std::map<std::string, nlohmann::json> out;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(file_);
    if (!in) return out;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto record = nlohmann::json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object() || !record.contains("filename") ||
            !record["filename"].is_string()) {
            core::log_line("CATALOG", "Skipping malformed line " + std::to_string(line_no) +
                                          " in " + file_.string());
            continue;
        }

        const std::string name = record["filename"].get<std::string>();
        if (record.value("op", "") == "delete") {
            out.erase(name);
        } else {
            out[name] = std::move(record);
        }
    }
    return out;
}

void EventStatusSink::publish(const StatusUpdate& update) {
    events_.stage_progress(update.file, update.stage, update.progress, update.error);
}

} // namespace slide_ingest::pipeline
