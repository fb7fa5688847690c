#include <cstdio>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "BacktestReport.h"
#include "MarketUniverse.h"
#include "MarketUniverseCsvReader.h"
#include "ReturnsSeriesCsvReader.h"
#include "ValidationConfiguration.h"
#include "reporting/ValidationSummary.h"
#include "reporting/VerdictSerializer.h"
#include "validation/ValidationOrchestrator.h"

using namespace stratvalidator;

void usage()
{
    printf("Usage: stratvalidator <config file> <returns file> [<returns file> ...]\n");
    printf("  Each returns file (Date,Return) is validated as one candidate strategy\n");
    printf("  named after the file stem.\n");
}

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        usage();
        return 1;
    }

    // -- Configuration --
    std::shared_ptr<ValidationConfiguration> config;
    try
    {
        ValidationConfigurationFileReader reader(argv[1]);
        config = reader.readConfigurationFile();
    }
    catch (const ValidationConfigurationException& e)
    {
        std::cout << "ValidationConfigurationException thrown when reading configuration file: " << e.what() << std::endl;
        return 1;
    }

    // -- Market universe for the baseline comparison (optional) --
    std::shared_ptr<const stratval::MarketUniverse> universe;
    const std::string& universeFile = config->getBaselineParameters().universeFile;
    if (!universeFile.empty())
    {
        try
        {
            stratval::MarketUniverseCsvReader universeReader(universeFile);
            universe = universeReader.readFile();
            std::cout << "Loaded market universe: " << universe->getNumSecurities() << " securities, "
                      << universe->getNumDates() << " dates" << std::endl;
        }
        catch (const std::exception& e)
        {
            std::cout << "Error reading market universe " << universeFile << ": " << e.what() << std::endl;
            return 1;
        }
    }
    else
    {
        std::cout << "No UniverseFile configured, baseline comparison disabled." << std::endl;
    }

    // -- Candidate strategies --
    std::vector<validation::CandidateStrategy> candidates;
    for (int i = 2; i < argc; ++i)
    {
        const std::string fileName(argv[i]);
        const std::string strategyId = boost::filesystem::path(fileName).stem().string();

        try
        {
            stratval::ReturnsSeriesCsvReader returnsReader(fileName, config->getCalibration().timeFrame);
            returnsReader.readFile();

            auto report = std::make_shared<stratval::SeriesBacktestReport>(strategyId,
                                                                           *returnsReader.getReturnsSeries());
            candidates.push_back(validation::CandidateStrategy{ strategyId,
                                                                { { "source_file", fileName } },
                                                                report });
        }
        catch (const std::exception& e)
        {
            std::cout << "Skipping " << fileName << ": " << e.what() << std::endl;
        }
    }

    if (candidates.empty())
    {
        std::cout << "No readable returns files, nothing to validate." << std::endl;
        return 1;
    }

    // -- Baseline cache, persisted when a cache directory is configured --
    std::shared_ptr<validation::BaselineCache> baselineCache;
    const std::string& cacheDirectory = config->getBaselineParameters().cacheDirectory;
    if (universe && !cacheDirectory.empty())
    {
        try
        {
            baselineCache = std::make_shared<validation::BaselineCache>(cacheDirectory);
            std::cout << "Baseline cache directory: " << cacheDirectory << std::endl;
        }
        catch (const std::exception& e)
        {
            std::cout << "Error opening baseline cache " << cacheDirectory << ": " << e.what() << std::endl;
            return 1;
        }
    }

    // -- Validation --
    validation::ValidationOrchestrator orchestrator(*config, universe, baselineCache);
    const auto results = orchestrator.validateBatch(candidates, std::cout);

    reporting::ValidationSummary summary(results);
    summary.print(std::cout);

    if (!reporting::VerdictSerializer::saveToFile(results, summary, config->getOutputFile()))
        return 2;

    if (baselineCache && baselineCache->diskWriteFailures() > 0)
        std::cout << "Warning: " << baselineCache->diskWriteFailures()
                  << " baseline cache entries could not be written to " << cacheDirectory << std::endl;

    std::cout << "Validation results written to " << config->getOutputFile() << std::endl;
    return 0;
}
