#include "SandboxExecutor.h"
#include "AugurExceptions.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FrameOps.h"
#include "ScriptInterpreter.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace {
bool nameHasMarker(const std::string& name, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        if (name.find(CommonUtils::toUpper(marker)) != std::string::npos) return true;
    }
    return false;
}

TypedColumn coerceToNumeric(const TypedColumn& column) {
    const size_t n = column.size();
    std::vector<double> values(n, 0.0);
    if (column.type == ColumnType::NUMERIC) {
        const auto& src = std::get<std::vector<double>>(column.values);
        for (size_t r = 0; r < n; ++r) {
            if (!column.isMissing(r) && std::isfinite(src[r])) values[r] = src[r];
        }
    } else {
        for (size_t r = 0; r < n; ++r) {
            if (column.isMissing(r)) continue;
            std::string text = CommonUtils::trim(column.cellAsString(r));
            text.erase(std::remove(text.begin(), text.end(), ','), text.end());
            double parsed = 0.0;
            if (TypedDataset::parseNumericToken(text, parsed, TypedDataset::NumericSeparatorPolicy::US_THOUSANDS) &&
                std::isfinite(parsed)) {
                values[r] = parsed;
            }
        }
    }
    return TypedColumn::numeric(column.name, std::move(values), MissingMask(n, 0));
}
} // namespace

SandboxExecutor::SandboxExecutor(const EngineConfig& config)
    : config_(config), validator_(config.deniedNames), normalizer_(config) {}

TypedDataset SandboxExecutor::prepareDataset(const TypedDataset& dataset) const {
    TypedDataset out = dataset;

    std::vector<std::string> names;
    names.reserve(out.colCount());
    for (const auto& col : out.columns()) names.push_back(CommonUtils::toUpper(col.name));
    names = CSVUtils::normalizeHeader(names);
    for (size_t c = 0; c < out.colCount(); ++c) out.columns()[c].name = names[c];

    MissingMask keep(out.rowCount(), 1);
    size_t headerRows = 0;
    size_t placeholderRows = 0;
    for (const auto& col : out.columns()) {
        const bool placeholderColumn = std::find(config_.placeholderColumns.begin(), config_.placeholderColumns.end(),
                                                 col.name) != config_.placeholderColumns.end();
        for (size_t r = 0; r < out.rowCount(); ++r) {
            if (!keep[r] || col.isMissing(r)) continue;
            const std::string cell = col.cellAsString(r);
            if (cell.find(col.name) != std::string::npos) {
                keep[r] = 0;
                ++headerRows;
                continue;
            }
            if (!placeholderColumn) continue;
            const std::string value = CommonUtils::toLower(CommonUtils::trim(cell));
            for (const auto& term : config_.placeholderTerms) {
                if (value == CommonUtils::toLower(term)) {
                    keep[r] = 0;
                    ++placeholderRows;
                    break;
                }
            }
        }
    }
    if (headerRows + placeholderRows > 0) {
        out.removeRows(keep);
        if (config_.verbose) {
            std::cout << "[Augur][Executor] Dropped " << headerRows << " header-like and " << placeholderRows
                      << " placeholder rows\n";
        }
    }

    for (auto& col : out.columns()) {
        if (nameHasMarker(col.name, config_.numericCoercionMarkers)) col = coerceToNumeric(col);
    }

    if (config_.verbose) {
        std::cout << "[Augur][Executor] Available columns:";
        for (const auto& col : out.columns()) std::cout << " " << col.name;
        std::cout << "\n";
    }
    return out;
}

SandboxExecutor::Bindings SandboxExecutor::priorBindings(const MetricResults& results) {
    Bindings out;
    out.reserve(results.size());
    for (const auto& entry : results.entries()) {
        out.emplace_back(metricIdentifier(entry.name),
                         entry.failed ? Script::Value::none() : ResultNormalizer::toScriptValue(entry.value));
    }
    return out;
}

SandboxExecutor::Outcome SandboxExecutor::execute(const Script::Program& program,
                                                  const Script::Value& frame,
                                                  const Bindings& priors) const {
    Outcome out;
    Script::ScriptInterpreter interpreter(config_.verbose ? &std::cout : nullptr);
    for (const auto& prior : priors) interpreter.bind(prior.first, prior.second);
    interpreter.bind("df", frame);
    try {
        out.value = interpreter.run(program);
        out.ok = true;
    } catch (const Augur::AugurException& e) {
        out.error = e.what();
    } catch (const std::exception& e) {
        out.error = std::string("RuntimeError: ") + e.what();
    }
    return out;
}

MetricResults SandboxExecutor::runMetric(MetricResults results, const MetricSpec& metric, const Script::Value& frame) const {
    if (config_.verbose) std::cout << "[Augur][Executor] Calculating metric: " << metric.name << "\n";

    MetricResult entry;
    entry.name = metric.name;

    const ValidationResult validated = validator_.validate(metric.code);
    if (!validated.ok) {
        std::cerr << "[Augur][Executor] Metric '" << metric.name << "' rejected: " << validated.error
                  << "\nCode that failed:\n" << metric.code << "\n";
        entry.failed = true;
        entry.error = validated.error;
        results.add(std::move(entry));
        return results;
    }

    const Outcome outcome = execute(validated.program, frame, priorBindings(results));
    if (!outcome.ok) {
        std::cerr << "[Augur][Executor] Error calculating metric '" << metric.name << "': " << outcome.error
                  << "\nCode that failed:\n" << validated.sanitizedCode;
        entry.failed = true;
        entry.error = outcome.error;
    } else if (outcome.value.isNone()) {
        std::cerr << "[Augur][Executor] Warning: metric '" << metric.name << "' produced no result\n";
    } else {
        entry.value = normalizer_.normalize(outcome.value, frame.frame());
        if (config_.verbose) {
            std::cout << "[Augur][Executor] " << metric.name << " = " << entry.value.dump() << "\n";
        }
    }
    results.add(std::move(entry));
    return results;
}

MetricResults SandboxExecutor::executePlan(const TypedDataset& prepared, const AnalysisPlan& plan) const {
    const Script::Value frame(Script::FrameOps::fromDataset(prepared));
    return std::accumulate(plan.metrics.begin(), plan.metrics.end(), MetricResults{},
                           [&](MetricResults acc, const MetricSpec& metric) {
                               return runMetric(std::move(acc), metric, frame);
                           });
}
