#pragma once
// JSON codec for the record vocabulary

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace sabha {

using json = nlohmann::json;

inline void to_json(json& j, const Payload& p) {
    j = json{{"tags", p.tags}, {"numbers", p.numbers}};
}

inline void from_json(const json& j, Payload& p) {
    p.tags.clear();
    p.numbers.clear();
    if (j.contains("tags")) {
        for (const auto& t : j.at("tags")) p.tags.push_back(t.get<std::string>());
    }
    if (j.contains("numbers")) {
        for (const auto& [k, v] : j.at("numbers").items()) {
            p.numbers[k] = v.get<double>();
        }
    }
}

inline json record_to_json(const MemoryRecord& r, bool with_vector = false) {
    json j = {
        {"id", r.id.to_string()},
        {"agent_id", r.agent_id},
        {"kind", kind_name(r.kind)},
        {"summary", r.summary},
        {"importance", r.importance},
        {"created", r.created},
        {"symbol", r.symbol},
        {"payload", r.payload},
    };
    j["outcome"] = r.outcome ? json(outcome_name(*r.outcome)) : json(nullptr);
    if (with_vector) j["vector"] = r.vector;
    return j;
}

} // namespace sabha
