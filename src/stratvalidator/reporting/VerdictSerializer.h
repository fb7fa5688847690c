#pragma once

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "reporting/ValidationSummary.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace reporting
{

using validation::StrategyValidationResult;
using validation::ValidationVerdict;

/**
 * @brief Converts validation results to JSON records.
 *
 * Verdict fields: strategy_id, validator_name, passed, statistic_value,
 * threshold_value, n_periods, diagnostic_message, comparison, warnings.
 * Every verdict is a threshold comparison and is labeled as such in
 * "comparison"; no record carries a p_value. Non-finite statistics are
 * written as null.
 */
class VerdictSerializer
{
public:
    /**
     * @brief JSON object of a single verdict
     * @param strategyId Strategy the verdict belongs to
     * @param verdict The verdict to convert
     * @return Pretty-printed JSON string
     */
    static std::string verdictToJson(const std::string& strategyId, const ValidationVerdict& verdict);

    /**
     * @brief JSON object of one strategy: strategy_id, overall_passed, checks_run,
     *        parameters, verdicts and fatal_error (null when none)
     */
    static std::string resultToJson(const StrategyValidationResult& result);

    /**
     * @brief JSON document of a whole batch: {"summary": {...}, "strategies": [...]}
     */
    static std::string exportToJson(const std::vector<StrategyValidationResult>& results,
                                    const ValidationSummary& summary);

    /**
     * @brief Write the batch document to a file
     * @return True if successful, false otherwise
     */
    static bool saveToFile(const std::vector<StrategyValidationResult>& results,
                           const ValidationSummary& summary,
                           const std::string& filePath);

private:
    static rapidjson::Value serializeVerdict(const std::string& strategyId,
                                             const ValidationVerdict& verdict,
                                             rapidjson::Document::AllocatorType& allocator);

    static rapidjson::Value serializeResult(const StrategyValidationResult& result,
                                            rapidjson::Document::AllocatorType& allocator);

    static rapidjson::Value serializeSummary(const ValidationSummary& summary,
                                             rapidjson::Document::AllocatorType& allocator);

    static rapidjson::Value serializeDouble(double value);

    static std::string toString(const rapidjson::Value& value);
};

} // namespace reporting
} // namespace stratvalidator
