#include "reporting/VerdictSerializer.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace stratvalidator
{
namespace reporting
{

Value VerdictSerializer::serializeDouble(double value)
{
    Value v;
    if (std::isfinite(value))
        v.SetDouble(value);
    return v;
}

Value VerdictSerializer::serializeVerdict(const std::string& strategyId,
                                          const ValidationVerdict& verdict,
                                          Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("strategy_id", Value(strategyId.c_str(), allocator), allocator);
    obj.AddMember("validator_name", Value(verdict.getValidatorName().c_str(), allocator), allocator);
    obj.AddMember("passed", verdict.passed(), allocator);
    obj.AddMember("statistic_value", serializeDouble(verdict.getStatistic()), allocator);
    obj.AddMember("threshold_value", serializeDouble(verdict.getThreshold()), allocator);
    obj.AddMember("n_periods", static_cast<uint64_t>(verdict.getNumPeriods()), allocator);
    obj.AddMember("diagnostic_message", Value(verdict.getDiagnostic().c_str(), allocator), allocator);
    obj.AddMember("comparison", Value(verdict.getComparisonLabel().c_str(), allocator), allocator);

    Value warnings(kArrayType);
    for (auto warning : verdict.getWarnings())
        warnings.PushBack(Value(validation::getValidationWarningString(warning).c_str(), allocator), allocator);
    obj.AddMember("warnings", warnings, allocator);

    return obj;
}

Value VerdictSerializer::serializeResult(const StrategyValidationResult& result, Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("strategy_id", Value(result.getStrategyId().c_str(), allocator), allocator);
    obj.AddMember("overall_passed", result.overallPassed(), allocator);

    Value checks(kArrayType);
    for (const auto& name : result.getChecksRun())
        checks.PushBack(Value(name.c_str(), allocator), allocator);
    obj.AddMember("checks_run", checks, allocator);

    Value parameters(kObjectType);
    for (const auto& [key, value] : result.getParameters())
        parameters.AddMember(Value(key.c_str(), allocator), Value(value.c_str(), allocator), allocator);
    obj.AddMember("parameters", parameters, allocator);

    Value verdicts(kArrayType);
    for (const auto& verdict : result.getVerdicts())
        verdicts.PushBack(serializeVerdict(result.getStrategyId(), verdict, allocator), allocator);
    obj.AddMember("verdicts", verdicts, allocator);

    if (result.getFatalError())
        obj.AddMember("fatal_error", Value(result.getFatalError()->c_str(), allocator), allocator);
    else
        obj.AddMember("fatal_error", Value(), allocator);

    return obj;
}

Value VerdictSerializer::serializeSummary(const ValidationSummary& summary, Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("total", static_cast<uint64_t>(summary.getTotalCount()), allocator);
    obj.AddMember("passed", static_cast<uint64_t>(summary.getPassedCount()), allocator);
    obj.AddMember("failed", static_cast<uint64_t>(summary.getFailedCount()), allocator);
    obj.AddMember("fatal", static_cast<uint64_t>(summary.getFatalCount()), allocator);
    obj.AddMember("pass_rate", summary.getPassRate(), allocator);

    Value validators(kObjectType);
    for (const auto& [name, tally] : summary.getValidatorTallies())
    {
        Value counts(kObjectType);
        counts.AddMember("passed", static_cast<uint64_t>(tally.passed), allocator);
        counts.AddMember("failed", static_cast<uint64_t>(tally.failed), allocator);
        validators.AddMember(Value(name.c_str(), allocator), counts, allocator);
    }
    obj.AddMember("validators", validators, allocator);

    Value failed(kArrayType);
    for (const auto& id : summary.getFailedStrategies())
        failed.PushBack(Value(id.c_str(), allocator), allocator);
    obj.AddMember("failed_strategies", failed, allocator);

    return obj;
}

std::string VerdictSerializer::toString(const Value& value)
{
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    value.Accept(writer);

    return buffer.GetString();
}

std::string VerdictSerializer::verdictToJson(const std::string& strategyId, const ValidationVerdict& verdict)
{
    Document doc;
    Value obj = serializeVerdict(strategyId, verdict, doc.GetAllocator());
    return toString(obj);
}

std::string VerdictSerializer::resultToJson(const StrategyValidationResult& result)
{
    Document doc;
    Value obj = serializeResult(result, doc.GetAllocator());
    return toString(obj);
}

std::string VerdictSerializer::exportToJson(const std::vector<StrategyValidationResult>& results,
                                            const ValidationSummary& summary)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("summary", serializeSummary(summary, allocator), allocator);

    Value strategies(kArrayType);
    for (const auto& result : results)
        strategies.PushBack(serializeResult(result, allocator), allocator);
    doc.AddMember("strategies", strategies, allocator);

    return toString(doc);
}

bool VerdictSerializer::saveToFile(const std::vector<StrategyValidationResult>& results,
                                   const ValidationSummary& summary,
                                   const std::string& filePath)
{
    std::ofstream file(filePath);
    if (!file.is_open())
    {
        std::cerr << "Error: Cannot open file for writing: " << filePath << std::endl;
        return false;
    }

    file << exportToJson(results, summary) << "\n";
    if (!file)
    {
        std::cerr << "Error: Failed writing validation results to " << filePath << std::endl;
        return false;
    }

    return true;
}

} // namespace reporting
} // namespace stratvalidator
