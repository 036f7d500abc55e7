#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include "number.h"
#include "BoostDateHelper.h"
#include "TimeFrameUtility.h"
#include "CsvDirectoryDataSource.h"
#include "RebalanceConfiguration.h"
#include "RebalanceConfigurationFileReader.h"
#include "RebalanceBackTester.h"
#include "SelectionStrategy.h"
#include "ParallelExecutors.h"
#include "PerformanceMetrics.h"
#include "PerformanceReporter.h"
#include "RunHistoryCsvWriter.h"
#include "OutputUtils.h"

namespace po = boost::program_options;

using namespace rebalancer;
using Num = num::DefaultNumber;

void printUsage(const po::options_description& desc) {
    std::cout << "Periodic rebalance backtester\n\n";
    std::cout << "Usage: rebalancer --data-dir <dir> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Quarterly momentum portfolio over the default dates\n";
    std::cout << "  rebalancer --data-dir data/\n\n";
    std::cout << "  # Monthly value portfolio with a settings file and two overrides\n";
    std::cout << "  rebalancer --data-dir data/ --strategy value --freq monthly \\\n";
    std::cout << "      --config settings.csv --set max_positions=10 --set cash_reserve=0.05\n\n";
    std::cout << "  # Write the snapshot history and trade log, and keep a log file\n";
    std::cout << "  rebalancer --data-dir data/ --output-dir results/ --log-file run.log\n";
}

static RebalanceConfiguration<Num> buildConfiguration(const po::variables_map& vm)
{
    RebalanceConfiguration<Num> config;

    if (vm.count("config")) {
        RebalanceConfigurationFileReader reader(vm["config"].as<std::string>());
        config = reader.readConfigurationFile(config);
    }

    if (vm.count("set")) {
        for (const std::string& setting : vm["set"].as<std::vector<std::string>>()) {
            const std::string::size_type eq = setting.find('=');
            if (eq == std::string::npos || eq == 0)
                throw RebalanceConfigurationException("--set expects key=value, got '" + setting + "'");

            RebalanceConfigurationFileReader::applySetting(config,
                                                           boost::trim_copy(setting.substr(0, eq)),
                                                           boost::trim_copy(setting.substr(eq + 1)));
        }
    }

    // Dedicated flags win over the settings file and --set
    if (vm.count("start"))
        config.startDate = parseDateString(vm["start"].as<std::string>());

    if (vm.count("end"))
        config.endDate = parseDateString(vm["end"].as<std::string>());

    if (vm.count("freq"))
        config.rebalanceFrequency = getTimeFrameFromString(vm["freq"].as<std::string>());

    if (vm.count("capital"))
        config.initialCapital = num::fromString<Num>(vm["capital"].as<std::string>());

    if (vm.count("max-positions"))
        config.maxPositions = vm["max-positions"].as<unsigned int>();

    config.validate();
    return config;
}

static void writeRunHistory(const RunResult<Num>& run, const std::string& outputDir, std::ostream& out)
{
    const std::string frequency = timeFrameToString(run.rebalanceFrequency);

    const std::string historyFile = utils::createOutputFileName(outputDir, run.strategyName, frequency, "history");
    RunHistoryCsvWriter<Num> historyWriter(historyFile, run, RunHistoryCsvWriter<Num>::Snapshots);
    historyWriter.writeFile();
    out << "Snapshot history written to " << historyFile << std::endl;

    const std::string tradesFile = utils::createOutputFileName(outputDir, run.strategyName, frequency, "trades");
    RunHistoryCsvWriter<Num> tradeWriter(tradesFile, run, RunHistoryCsvWriter<Num>::Trades);
    tradeWriter.writeFile();
    out << "Trade log written to " << tradesFile << std::endl;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("data-dir,d", po::value<std::string>(), "Directory holding universe.csv and one <code>.csv per instrument")
            ("strategy,s", po::value<std::string>()->default_value("momentum"), "Selection strategy (momentum, value, growth)")
            ("config,c", po::value<std::string>(), "Settings file of key,value rows")
            ("set", po::value<std::vector<std::string>>()->composing(), "Override one setting, key=value (repeatable)")
            ("start", po::value<std::string>(), "First date considered, YYYY-MM-DD or YYYYMMDD")
            ("end", po::value<std::string>(), "Last date considered, YYYY-MM-DD or YYYYMMDD")
            ("freq,f", po::value<std::string>(), "Rebalance frequency (monthly, quarterly, yearly)")
            ("capital", po::value<std::string>(), "Initial capital")
            ("max-positions", po::value<unsigned int>(), "Maximum number of holdings")
            ("threads,t", po::value<std::size_t>()->default_value(0), "Worker threads for instrument evaluation (0 = hardware concurrency, 1 = single threaded)")
            ("output-dir,o", po::value<std::string>(), "Write the snapshot history and trade log as CSV into this directory")
            ("log-file", po::value<std::string>(), "Mirror all output into this file")
            ("verbose,v", "Log every rebalance and trade");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("data-dir")) {
            std::cerr << "Error: --data-dir is required\n\n";
            printUsage(desc);
            return 1;
        }

        std::ofstream logFile;
        std::unique_ptr<utils::TeeStream> tee;
        if (vm.count("log-file")) {
            const std::string logFileName = vm["log-file"].as<std::string>();
            logFile.open(logFileName);
            if (!logFile) {
                std::cerr << "Error: unable to open log file " << logFileName << std::endl;
                return 1;
            }
            tee = std::make_unique<utils::TeeStream>(std::cout, logFile);
        }
        std::ostream& out = tee ? static_cast<std::ostream&>(*tee) : std::cout;

        const RebalanceConfiguration<Num> config = buildConfiguration(vm);
        const SelectionStrategy<Num> strategy = createBuiltInStrategy<Num>(vm["strategy"].as<std::string>());
        const bool verbose = vm.count("verbose") > 0;

        out << "Loading market data from " << vm["data-dir"].as<std::string>() << std::endl;
        CsvDirectoryDataSource<Num> dataSource(vm["data-dir"].as<std::string>(), config.minDataDays, &out);
        out << "Universe: " << dataSource.getUniverse().size() << " instruments ("
            << dataSource.getNumDropped() << " dropped by the data quality filter)" << std::endl;

        out << std::endl << strategy.describe() << std::endl << std::endl;

        std::shared_ptr<concurrency::IParallelExecutor> executor =
            concurrency::makeExecutor(vm["threads"].as<std::size_t>());

        out << "Running " << strategy.getName() << " from "
            << boost::gregorian::to_iso_extended_string(config.startDate) << " to "
            << boost::gregorian::to_iso_extended_string(config.endDate) << ", rebalancing "
            << boost::to_lower_copy(timeFrameToString(config.rebalanceFrequency)) << std::endl;

        RebalanceBackTester<Num> backTester(dataSource, config, executor, verbose ? &out : nullptr);
        const RunResult<Num> run = backTester.run(strategy);

        if (run.snapshots.empty()) {
            out << "No rebalance dates fall inside the requested range" << std::endl;
            return 0;
        }

        const PerformanceMetrics<Num> metrics = computeMetrics(run, config);

        out << std::endl;
        PerformanceReporter reporter(out);
        reporter.writeReport(run, metrics);

        if (vm.count("output-dir")) {
            out << std::endl;
            writeRunHistory(run, vm["output-dir"].as<std::string>(), out);
        }

        out.flush();
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
