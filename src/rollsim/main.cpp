#include <iostream>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/lexical_cast/bad_lexical_cast.hpp>
#include "number.h"
#include "RollTimeSeries.h"
#include "RollSeriesJsonReader.h"
#include "RollSeriesValidator.h"
#include "ContractCoverageAnalyzer.h"
#include "BacktestConfiguration.h"
#include "BacktestResultsPublisher.h"
#include "PerpetualRollBacktester.h"
#include "BacktestConfigurationFileReader.h"
#include "reporting/BacktestReporter.h"
#include "reporting/ResultsCsvWriter.h"
#include "reporting/ResultsJsonWriter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace rollsim;
using Num = num::DefaultNumber;

void printUsage(const po::options_description& desc) {
    std::cout << "RollSim - Perpetual futures roll backtester\n\n";
    std::cout << "Usage: rollsim --data <file.json> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Full history with default settings\n";
    std::cout << "  rollsim --data gold_analysis.json\n\n";
    std::cout << "  # Fixed position, two years, results to a directory\n";
    std::cout << "  rollsim --data gold_analysis.json --start 2022-01-01 --end 2023-12-31 --never-compound --output-dir results\n\n";
    std::cout << "  # Settings from a configuration file, report mirrored to a file\n";
    std::cout << "  rollsim --data gold_analysis.json --config rollsim.csv --report-file report.txt\n\n";
    std::cout << "  # List the contracts in the data and any gaps between them\n";
    std::cout << "  rollsim --data gold_analysis.json --coverage\n";
}

static boost::gregorian::date parseDateOption(const std::string& optionName, const std::string& value) {
    try {
        boost::gregorian::date d = boost::gregorian::from_simple_string(value);
        if (d.is_special())
            throw BacktestConfigurationException("--" + optionName + " is not a calendar date: " + value);
        return d;
    } catch (const std::out_of_range& e) {
        throw BacktestConfigurationException("--" + optionName + " '" + value + "': " + e.what());
    } catch (const boost::bad_lexical_cast&) {
        throw BacktestConfigurationException("--" + optionName + " '" + value + "' is not a date (YYYY-MM-DD)");
    }
}

static Num parseDecimalOption(const std::string& optionName, const std::string& value) {
    if (!num::isDecimalString(value))
        throw BacktestConfigurationException("--" + optionName + " is not a number: '" + value + "'");

    return num::fromString<Num>(value);
}

static unsigned int parseLotsOption(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9)
        throw BacktestConfigurationException("--lots must be a whole number: '" + value + "'");

    return static_cast<unsigned int>(std::stoul(value));
}

// Command line settings take precedence over the configuration file
static BacktestConfiguration<Num> applyOverrides(const BacktestConfiguration<Num>& base,
                                                 const po::variables_map& vm) {
    std::optional<boost::gregorian::date> startDate = base.getStartDate();
    std::optional<boost::gregorian::date> endDate = base.getEndDate();
    if (vm.count("start"))
        startDate = parseDateOption("start", vm["start"].as<std::string>());
    if (vm.count("end"))
        endDate = parseDateOption("end", vm["end"].as<std::string>());

    unsigned int lots = vm.count("lots") ? parseLotsOption(vm["lots"].as<std::string>())
                                         : base.getInitialLots();
    Num margin = vm.count("margin") ? parseDecimalOption("margin", vm["margin"].as<std::string>())
                                    : base.getInitialMarginPercent();
    Num cost = vm.count("cost") ? parseDecimalOption("cost", vm["cost"].as<std::string>())
                                : base.getTransactionCost();
    Num factor = vm.count("compounding-factor")
        ? parseDecimalOption("compounding-factor", vm["compounding-factor"].as<std::string>())
        : base.getCompoundingFactor();

    FuturesContractAttributes<Num> contract = base.getContractAttributes();
    if (vm.count("multiplier"))
        contract = createMcxGoldAttributes<Num>(parseDecimalOption("multiplier", vm["multiplier"].as<std::string>()));

    bool neverCompound = base.isNeverCompound() || vm.count("never-compound") > 0;
    bool expiryGuard = base.isExpiryGuardEnforced() && vm.count("no-expiry-guard") == 0;
    StaleRolloverHandling staleHandling = vm.count("suppress-stale")
        ? StaleRolloverHandling::Suppress
        : base.getStaleRolloverHandling();

    return BacktestConfiguration<Num>(startDate,
                                      endDate,
                                      lots,
                                      margin,
                                      cost,
                                      factor,
                                      base.isCompounding(),
                                      neverCompound,
                                      contract,
                                      expiryGuard,
                                      staleHandling,
                                      base.getMaxSimulationDays());
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("data,d", po::value<std::string>(), "Daily near/far analytics file (JSON array)")
            ("config,c", po::value<std::string>(), "Configuration file (one CSV row)")
            ("start", po::value<std::string>(), "First day of the simulation (YYYY-MM-DD)")
            ("end", po::value<std::string>(), "Last day of the simulation (YYYY-MM-DD)")
            ("lots", po::value<std::string>(), "Initial number of lots")
            ("margin", po::value<std::string>(), "Initial margin percent of notional")
            ("cost", po::value<std::string>(), "Transaction cost per lot per rollover")
            ("compounding-factor", po::value<std::string>(), "Equity growth percent that doubles the position")
            ("never-compound", "Hold a fixed number of lots")
            ("multiplier", po::value<std::string>(), "Contract multiplier (value of one point per lot)")
            ("no-expiry-guard", "Execute rollovers even when the old contract has already expired")
            ("suppress-stale", "Count blocked rollovers without listing them in the trade log")
            ("coverage", "Report the near contracts found in the data and gaps between them")
            ("output-dir,o", po::value<std::string>(), "Directory for the equity curve and trade log CSV files")
            ("report-file", po::value<std::string>(), "Also write the text report to this file")
            ("json", po::value<std::string>(), "Write the results as a JSON document to this file");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("data")) {
            std::cerr << "Error: --data is required\n\n";
            printUsage(desc);
            return 1;
        }

        std::string dataFile = vm["data"].as<std::string>();
        if (!fs::exists(dataFile)) {
            std::cerr << "Error: data file " << dataFile << " does not exist" << std::endl;
            return 1;
        }

        BacktestConfiguration<Num> baseConfig;
        if (vm.count("config")) {
            BacktestConfigurationFileReader configReader(vm["config"].as<std::string>());
            baseConfig = *configReader.readConfigurationFile();
            std::cout << "Configuration read from " << configReader.getConfigurationFileName() << std::endl;
        }

        BacktestConfiguration<Num> config = applyOverrides(baseConfig, vm);

        RollSeriesJsonReader<Num> reader(dataFile);
        reader.readFile();
        std::shared_ptr<RollTimeSeries<Num>> series = reader.getTimeSeries();

        std::cout << "Loaded " << series->getNumEntries() << " observations from " << reader.getFileName() << std::endl;

        RollSeriesValidator<Num> validator(*series);
        unsigned long numWarnings = validator.validate();
        if (numWarnings > 0)
            std::cout << numWarnings << " data warning(s)" << std::endl;

        if (vm.count("coverage")) {
            ContractCoverageAnalyzer<Num> coverage(*series);
            std::cout << std::endl;
            coverage.writeReport(std::cout);
            std::cout << coverage.getNumContracts() << " contracts, "
                      << coverage.getNumGaps() << " gap(s), "
                      << coverage.getNumStaleRollovers() << " stale rollover(s)" << std::endl << std::endl;
        }

        PerpetualRollBacktester<Num> backtester;
        RollSeriesFilterResult<Num> selection = backtester.selectObservations(*series, config);

        if (selection.getStatus() == SeriesFilterStatus::InsufficientData) {
            std::cout << "Not enough data to run a backtest: the selected window holds "
                      << selection.getNumObservations() << " observation(s), at least "
                      << RollSeriesFilter<Num>::kMinimumObservations << " are needed" << std::endl;
            return 0;
        }

        if (selection.getStatus() == SeriesFilterStatus::TooManyObservations) {
            std::cerr << "Error: the selected window holds " << selection.getNumObservations()
                      << " observations, more than the limit of " << config.getMaxSimulationDays() << std::endl;
            return 1;
        }

        BacktestResultsPublisher<Num> publisher;
        unsigned long ticket = publisher.beginRun();
        publisher.publish(ticket, backtester.run(*series, config));

        BacktestResultsPublisher<Num>::ResultsPtr results = publisher.getLatest();
        if (!results) {
            std::cerr << "Error: the backtest produced no results" << std::endl;
            return 1;
        }

        std::cout << std::endl;
        if (vm.count("report-file")) {
            std::string reportFile = vm["report-file"].as<std::string>();
            std::ofstream reportStream(reportFile);
            if (!reportStream.is_open()) {
                std::cerr << "Error: cannot open report file " << reportFile << std::endl;
                return 1;
            }

            utils::TeeStream tee(std::cout, reportStream);
            reporting::BacktestReporter::writeBacktestReport(tee, *results, config);
            tee.flush();
        } else {
            reporting::BacktestReporter::writeBacktestReport(std::cout, *results, config);
        }

        if (vm.count("output-dir")) {
            std::string outputDir = vm["output-dir"].as<std::string>();
            const std::string& symbol = config.getContractAttributes().getSymbol();

            std::string equityFile = utils::createOutputFileName(outputDir, symbol, "Equity.csv");
            std::string tradesFile = utils::createOutputFileName(outputDir, symbol, "Trades.csv");

            reporting::ResultsCsvWriter::writeEquityCurveFile(equityFile, *results);
            reporting::ResultsCsvWriter::writeTradeLogFile(tradesFile, *results);

            std::cout << "\nEquity curve written to " << equityFile << std::endl;
            std::cout << "Trade log written to " << tradesFile << std::endl;
        }

        if (vm.count("json")) {
            std::string jsonFile = vm["json"].as<std::string>();
            reporting::ResultsJsonWriter::saveToFile(*results, jsonFile);
            std::cout << "Results written to " << jsonFile << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
