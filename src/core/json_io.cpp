#include "slide_ingest/core/json_io.hpp"

#include <cmath>

namespace slide_ingest {

namespace {

double round3(double v) {
    return std::round(v * 1000.0) / 1000.0;
}

} // namespace

void to_json(nlohmann::json& j, const EnhancementParams& p) {
    j = nlohmann::json{
        {"histogram_clip", p.histogram_clip},
        {"clahe_clip", p.clahe_clip}
    };
    if (p.preset) {
        j["preset"] = *p.preset;
    }
}

void to_json(nlohmann::json& j, const EnhancementResult& r) {
    j = nlohmann::json{
        {"width", r.original_width},
        {"height", r.original_height},
        {"params", r.params},
        {"faces_detected", r.faces_detected},
        {"face_count", r.face_count},
        {"quality_score", round3(r.quality_score)}
    };
}

void to_json(nlohmann::json& j, const DuplicateMatch& m) {
    j = nlohmann::json{
        {"path", m.path.string()},
        {"similarity", round3(m.similarity)}
    };
}

void to_json(nlohmann::json& j, const DuplicateGroup& g) {
    j = nlohmann::json{
        {"seed", g.seed.string()},
        {"matches", g.matches},
        {"count", g.matches.size() + 1},
        {"avg_similarity", round3(g.mean_similarity)},
        {"type", duplicate_kind_to_string(g.kind)},
        {"action", duplicate_action_to_string(g.action)}
    };
}

void to_json(nlohmann::json& j, const InboundDuplicate& d) {
    j = nlohmann::json{
        {"type", duplicate_kind_to_string(d.kind)},
        {"input_file", d.input.string()},
        {"match", d.match.string()},
        {"similarity", round3(d.similarity)},
        {"action", duplicate_action_to_string(d.action)}
    };
}

void to_json(nlohmann::json& j, const InboundScanReport& r) {
    j = nlohmann::json{
        {"groups", r.records},
        {"skip_count", r.skip_count},
        {"alert_count", r.alert_count},
        {"total_input", r.total_input}
    };
}

void to_json(nlohmann::json& j, const ErrorRecord& e) {
    j = nlohmann::json{
        {"filename", e.filename},
        {"error", e.message},
        {"timestamp", e.timestamp},
        {"stage", e.stage}
    };
}

void to_json(nlohmann::json& j, const Tag& t) {
    j = nlohmann::json{
        {"tag", t.label},
        {"confidence", t.confidence},
        {"category", t.category}
    };
}

void to_json(nlohmann::json& j, const Alert& a) {
    j = nlohmann::json{
        {"type", a.type},
        {"severity", a.severity},
        {"message", a.message},
        {"timestamp", a.timestamp}
    };
}

nlohmann::json saved_outputs_to_json(const SavedOutputs& outputs) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [fmt, path] : outputs) {
        j[output_format_to_string(fmt)] = path.string();
    }
    return j;
}

} // namespace slide_ingest
