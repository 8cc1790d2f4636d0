#pragma once

#include "FrameOps.h"
#include "ScriptInterpreter.h"
#include "ScriptParser.h"
#include "TypedDataset.h"

#include <string>
#include <vector>

namespace TestHelpers {

// Small ad-campaign table shared by the script and executor tests.
inline TypedDataset campaignDataset() {
    return TypedDataset::fromRecords(
        {"WIDGET_NAME", "LAYOUT", "VIEWS", "CLICKS", "DATE"},
        {{"Alpha", "grid", "100", "10", "2024-01-01"},
         {"Beta", "list", "200", "30", "2024-01-02"},
         {"Alpha", "grid", "300", "20", "2024-01-03"},
         {"Gamma", "list", "0", "5", "2024-01-04"},
         {"Beta", "grid", "400", "40", "2024-01-05"}});
}

inline Script::Value frameOf(const TypedDataset& dataset) {
    return Script::Value(Script::FrameOps::fromDataset(dataset));
}

// Runs a snippet against `df` and returns whatever it bound to `result`.
inline Script::Value runSnippet(const std::string& code, const Script::Value& frame) {
    Script::ScriptInterpreter interpreter;
    interpreter.bind("df", frame);
    return interpreter.run(Script::ScriptParser::parse(code));
}

inline Script::Series numberSeries(const std::vector<double>& values) {
    std::vector<Script::Scalar> cells;
    cells.reserve(values.size());
    for (double v : values) cells.emplace_back(v);
    return Script::Series::make(std::string("values"), std::move(cells));
}

} // namespace TestHelpers
