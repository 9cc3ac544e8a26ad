#include "utils/ResultWriter.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>
#include <iomanip>
#include <optional>

namespace transdist {

namespace {

const char* kEstimateHeader = "t_start,t_end,n_cases,n_pairs,mu,sigma,mu_bound,sigma_bound";
const char* kBootstrapHeader = "mu_ci_low,mu_ci_high,sigma_ci_low,sigma_ci_high,"
                               "mu_replicate_mean,mu_replicate_sd,sigma_replicate_mean,sigma_replicate_sd,iterations";

std::ofstream openForWriting(const std::string& filename, const std::string& caller) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        Logger::getInstance().error(caller, "Unable to open file for writing: " + filename);
        throw FileIOException(caller, "Unable to open file for writing: " + filename);
    }
    file << std::setprecision(10);
    return file;
}

void writeOptional(std::ostream& out, const std::optional<double>& value) {
    if (value) {
        out << *value;
    } else {
        out << "NA";
    }
}

void writeEstimateFields(std::ostream& out, const KernelEstimate& e) {
    out << e.t_start << "," << e.t_end << "," << e.n_cases << "," << e.n_pairs << ","
        << e.mu << "," << e.sigma << ",";
    writeOptional(out, e.mu_bound);
    out << ",";
    writeOptional(out, e.sigma_bound);
}

void writeBootstrapFields(std::ostream& out, const BootstrapResult& r) {
    out << r.mu_ci_low << "," << r.mu_ci_high << "," << r.sigma_ci_low << "," << r.sigma_ci_high << ","
        << r.mu_replicate_mean << "," << r.mu_replicate_sd << ","
        << r.sigma_replicate_mean << "," << r.sigma_replicate_sd << "," << r.iterations;
}

// Number of comma-separated fields in a header.
int fieldCount(const char* header) {
    int n = 1;
    for (const char* c = header; *c; ++c) {
        if (*c == ',') ++n;
    }
    return n;
}

void writeMissing(std::ostream& out, int fields) {
    for (int i = 0; i < fields; ++i) {
        out << (i == 0 ? "" : ",") << "NA";
    }
}

} // namespace

void writeKernelEstimate(const std::string& filename, const KernelEstimate& estimate) {
    std::ofstream file = openForWriting(filename, "writeKernelEstimate");
    file << kEstimateHeader << "\n";
    writeEstimateFields(file, estimate);
    file << "\n";
    Logger::getInstance().info("writeKernelEstimate", "Kernel estimate written to " + filename);
}

void writeBootstrapResult(const std::string& filename, const BootstrapResult& result) {
    std::ofstream file = openForWriting(filename, "writeBootstrapResult");
    file << kEstimateHeader << "," << kBootstrapHeader << "\n";
    writeEstimateFields(file, result.estimate);
    file << ",";
    writeBootstrapFields(file, result);
    file << "\n";
    Logger::getInstance().info("writeBootstrapResult", "Bootstrap result written to " + filename);
}

void writeTemporalSeries(const std::string& filename, const TemporalSeries& series) {
    std::ofstream file = openForWriting(filename, "writeTemporalSeries");
    file << "time,window_cases," << kEstimateHeader << "\n";
    for (const auto& entry : series) {
        file << entry.time << "," << entry.n_cases << ",";
        if (entry.value) {
            writeEstimateFields(file, *entry.value);
        } else {
            writeMissing(file, fieldCount(kEstimateHeader));
        }
        file << "\n";
    }
    Logger::getInstance().info("writeTemporalSeries", std::to_string(series.size()) + " windows written to " + filename);
}

void writeTemporalSeries(const std::string& filename, const TemporalBootstrapSeries& series) {
    std::ofstream file = openForWriting(filename, "writeTemporalSeries");
    file << "time,window_cases," << kEstimateHeader << "," << kBootstrapHeader << "\n";
    for (const auto& entry : series) {
        file << entry.time << "," << entry.n_cases << ",";
        if (entry.value) {
            writeEstimateFields(file, entry.value->estimate);
            file << ",";
            writeBootstrapFields(file, *entry.value);
        } else {
            writeMissing(file, fieldCount(kEstimateHeader) + fieldCount(kBootstrapHeader));
        }
        file << "\n";
    }
    Logger::getInstance().info("writeTemporalSeries", std::to_string(series.size()) + " windows written to " + filename);
}

} // namespace transdist
