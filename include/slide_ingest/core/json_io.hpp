#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

// nlohmann::json conversions for records that leave the process
// (event stream, catalog, CLI output).
namespace slide_ingest {

void to_json(nlohmann::json& j, const EnhancementParams& p);
void to_json(nlohmann::json& j, const EnhancementResult& r);
void to_json(nlohmann::json& j, const DuplicateMatch& m);
void to_json(nlohmann::json& j, const DuplicateGroup& g);
void to_json(nlohmann::json& j, const InboundDuplicate& d);
void to_json(nlohmann::json& j, const InboundScanReport& r);
void to_json(nlohmann::json& j, const ErrorRecord& e);
void to_json(nlohmann::json& j, const Tag& t);
void to_json(nlohmann::json& j, const Alert& a);

nlohmann::json saved_outputs_to_json(const SavedOutputs& outputs);

} // namespace slide_ingest
