#include "AnalysisPlan.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <fstream>
#include <sstream>

AnalysisPlan AnalysisPlan::fromJson(const JsonValue& root) {
    if (!root.isObject()) throw Augur::PlanException("plan must be a JSON object");
    const JsonValue* metrics = root.find("metrics");
    if (!metrics || !metrics->isArray()) throw Augur::PlanException("plan requires a 'metrics' array");

    AnalysisPlan plan;
    for (size_t i = 0; i < metrics->arrayValue.size(); ++i) {
        const JsonValue& entry = metrics->arrayValue[i];
        const std::string where = "metrics[" + std::to_string(i) + "]";
        if (!entry.isObject()) throw Augur::PlanException(where + " must be an object");
        const JsonValue* name = entry.find("name");
        const JsonValue* code = entry.find("code");
        if (!name || !name->isString() || CommonUtils::trim(name->stringValue).empty()) {
            throw Augur::PlanException(where + " requires a non-empty string 'name'");
        }
        if (!code || !code->isString()) throw Augur::PlanException(where + " requires a string 'code'");
        plan.metrics.push_back({name->stringValue, code->stringValue});
    }
    return plan;
}

AnalysisPlan AnalysisPlan::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Augur::IOException("Could not open plan file: " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    try {
        return fromJson(parseJsonText(buffer.str()));
    } catch (const Augur::JsonException& e) {
        throw Augur::PlanException(path + ": " + e.what());
    }
}

JsonValue MetricResult::toJson() const {
    if (!failed) return value;
    JsonValue marker = JsonValue::object();
    marker.set("metric", JsonValue::string(name));
    marker.set("error", JsonValue::string(error));
    return marker;
}

void MetricResults::add(MetricResult result) {
    for (auto& existing : entries_) {
        if (existing.name == result.name) {
            existing = std::move(result);
            return;
        }
    }
    entries_.push_back(std::move(result));
}

const MetricResult* MetricResults::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

JsonValue MetricResults::toJson() const {
    JsonValue out = JsonValue::object();
    for (const auto& entry : entries_) out.set(entry.name, entry.toJson());
    return out;
}

std::string metricIdentifier(const std::string& metricName) {
    std::string id = CommonUtils::toLower(CommonUtils::trim(metricName));
    for (char& c : id) {
        if (c == ' ') c = '_';
    }
    return id;
}
