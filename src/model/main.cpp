#include <iostream>
#include <memory>
#include <string>
#include <algorithm>

#include "model/CaseData.hpp"
#include "model/KernelEstimator.hpp"
#include "model/BootstrapEstimator.hpp"
#include "model/TemporalEstimator.hpp"
#include "model/parameters/TransdistSettings.hpp"

#include "utils/FileUtils.hpp"
#include "utils/ReadCaseData.hpp"
#include "utils/ReadTransdistConfiguration.hpp"
#include "utils/ResultWriter.hpp"
#include "utils/WorkerPool.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include "exceptions/CSVReadException.hpp"

using namespace std;
using namespace transdist;

void printUsage(const char* programName) {
    cout << "Usage: " << programName << " <cases.csv> [settings.txt] [--mode|-m <mode>] [--help|-h]" << endl;
    cout << "Options:" << endl;
    cout << "  <cases.csv>              Case table with columns x, y, t" << endl;
    cout << "  [settings.txt]           Settings file (default: data/config/transdist_settings.txt)" << endl;
    cout << "  --mode, -m <mode>        'point' (default), 'bootstrap', 'temporal' or 'temporal-bootstrap'" << endl;
    cout << "  --help, -h               Show this help message" << endl;
}

enum class RunMode {
    POINT,
    BOOTSTRAP,
    TEMPORAL,
    TEMPORAL_BOOTSTRAP
};

RunMode parseMode(const string& mode) {
    string mode_lower = mode;
    transform(mode_lower.begin(), mode_lower.end(), mode_lower.begin(), ::tolower);

    if (mode_lower == "point") return RunMode::POINT;
    if (mode_lower == "bootstrap") return RunMode::BOOTSTRAP;
    if (mode_lower == "temporal") return RunMode::TEMPORAL;
    if (mode_lower == "temporal-bootstrap") return RunMode::TEMPORAL_BOOTSTRAP;
    throw invalid_argument("Unknown mode: " + mode);
}

int main(int argc, char* argv[]) {
    // === COMMAND LINE PARSING ===
    RunMode mode = RunMode::POINT;
    string cases_path;
    string settings_path;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--mode" || arg == "-m") {
            if (i + 1 < argc) {
                try {
                    mode = parseMode(argv[i + 1]);
                    i++;
                } catch (const invalid_argument& e) {
                    cerr << "Error: " << e.what() << endl;
                    printUsage(argv[0]);
                    return 1;
                }
            } else {
                cerr << "Error: --mode option requires a value" << endl;
                printUsage(argv[0]);
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            cerr << "Error: Unknown option: " << arg << endl;
            printUsage(argv[0]);
            return 1;
        } else if (cases_path.empty()) {
            cases_path = arg;
        } else if (settings_path.empty()) {
            settings_path = arg;
        } else {
            cerr << "Error: Unexpected argument: " << arg << endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (cases_path.empty()) {
        cerr << "Error: a case table is required" << endl;
        printUsage(argv[0]);
        return 1;
    }

    // === LOGGER SETUP ===
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting transmission distance estimation...");

    try {
        if (settings_path.empty()) {
            settings_path = FileUtils::getConfigPath("transdist_settings.txt");
        }
        Logger::getInstance().info("main", "Loading settings from: " + settings_path);
        const TransdistSettings settings = readTransdistSettings(settings_path);

        Logger::getInstance().info("main", "Loading case table from: " + cases_path);
        const CaseTable cases = readCaseTable(cases_path);

        const WorkerPool pool(settings.parallelConfig());
        Logger::getInstance().info("main", pool.isParallel()
            ? "Running on " + to_string(pool.getNumWorkers()) + " workers."
            : string("Running sequentially."));

        auto estimator = make_shared<const KernelEstimator>(settings.generationTime(), settings);

        switch (mode) {
            case RunMode::POINT: {
                const KernelEstimate estimate = estimator->estimate(cases, settings.seed, pool);
                Logger::getInstance().info("main", "mu = " + to_string(estimate.mu) +
                    ", sigma = " + to_string(estimate.sigma) + " from " + to_string(estimate.n_pairs) + " pairs.");
                writeKernelEstimate(FileUtils::getOutputPath("kernel_estimate.csv"), estimate);
                break;
            }
            case RunMode::BOOTSTRAP: {
                const BootstrapEstimator bootstrap(estimator, settings.boot_iter, settings.ci_low, settings.ci_high);
                const BootstrapResult result = bootstrap.run(cases, settings.seed, pool);
                writeBootstrapResult(FileUtils::getOutputPath("kernel_bootstrap.csv"), result);
                break;
            }
            case RunMode::TEMPORAL: {
                const TemporalEstimator temporal(estimator, settings.min_cases);
                const TemporalSeries series = temporal.run(cases, settings.seed, pool);
                writeTemporalSeries(FileUtils::getOutputPath("kernel_temporal.csv"), series);
                break;
            }
            case RunMode::TEMPORAL_BOOTSTRAP: {
                const TemporalEstimator temporal(estimator, settings.min_cases);
                const BootstrapEstimator bootstrap(estimator, settings.boot_iter, settings.ci_low, settings.ci_high);
                const TemporalBootstrapSeries series = temporal.run(cases, bootstrap, settings.seed, pool);
                writeTemporalSeries(FileUtils::getOutputPath("kernel_temporal_bootstrap.csv"), series);
                break;
            }
        }

        Logger::getInstance().info("main", "Estimation completed successfully.");
        return 0;
    }

    // === EXCEPTION HANDLING ===
    catch (const transdist::FileIOException& e) {
        Logger::getInstance().fatal("main", "File IO Error: " + std::string(e.what()));
        cerr << "Critical Error: File operation failed. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::CSVReadException& e) {
        Logger::getInstance().fatal("main", "CSV Read Error: " + std::string(e.what()));
        cerr << "Critical Error: Failed to read the case table. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::DataFormatException& e) {
        Logger::getInstance().fatal("main", "Data Format Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid data format encountered. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::InvalidParameterException& e) {
        Logger::getInstance().fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid parameter provided. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::InsufficientDataError& e) {
        Logger::getInstance().fatal("main", "Insufficient Data: " + std::string(e.what()));
        cerr << "Critical Error: Not enough cases to estimate the kernel. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::ShapeMismatchError& e) {
        Logger::getInstance().fatal("main", "Shape Mismatch: " + std::string(e.what()));
        cerr << "Critical Error: Inconsistent input shapes. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::DomainError& e) {
        Logger::getInstance().fatal("main", "Domain Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid input values. " << e.what() << endl;
        return 1;
    }
    catch (const transdist::TransdistException& e) {
        Logger::getInstance().fatal("main", "Estimation Error: " + std::string(e.what()));
        cerr << "Critical Error: " << e.what() << endl;
        return 1;
    }
    catch (const std::exception& e) {
        Logger::getInstance().fatal("main", "Standard Exception: " + std::string(e.what()));
        cerr << "Error: An unexpected error occurred: " << e.what() << endl;
        return 1;
    }
}
