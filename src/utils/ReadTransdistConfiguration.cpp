#include "utils/ReadTransdistConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace transdist {

namespace {

double parseNumber(const std::string& token, const std::string& calling_function_name, int line_number) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::invalid_argument&) {
        consumed = 0;
    } catch (const std::out_of_range&) {
        throw DataFormatException(calling_function_name,
            "Number out of range on line " + std::to_string(line_number) + ": '" + token + "'");
    }
    if (consumed != token.size()) {
        throw DataFormatException(calling_function_name,
            "Invalid number on line " + std::to_string(line_number) + ": '" + token + "'");
    }
    return value;
}

double requireScalar(const std::string& name, const std::vector<double>& values) {
    if (values.size() != 1) {
        throw DataFormatException("readTransdistSettings",
            "Expected exactly one value for " + name + ", got " + std::to_string(values.size()));
    }
    return values[0];
}

long requireInteger(const std::string& name, const std::vector<double>& values) {
    const double value = requireScalar(name, values);
    if (!std::isfinite(value) || std::floor(value) != value) {
        throw DataFormatException("readTransdistSettings",
            "Expected an integer value for " + name + ", got " + std::to_string(value));
    }
    // 2^63 is exactly representable; anything at or above it overflows long.
    if (value < static_cast<double>(std::numeric_limits<long>::min()) ||
        value >= -static_cast<double>(std::numeric_limits<long>::min())) {
        throw DataFormatException("readTransdistSettings",
            "Value for " + name + " is out of range: " + std::to_string(value));
    }
    return static_cast<long>(value);
}

int requireInt(const std::string& name, const std::vector<double>& values) {
    const long value = requireInteger(name, values);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw DataFormatException("readTransdistSettings",
            "Value for " + name + " is out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

bool requireFlag(const std::string& name, const std::vector<double>& values) {
    const long value = requireInteger(name, values);
    if (value != 0 && value != 1) {
        throw DataFormatException("readTransdistSettings",
            "Expected 0 or 1 for " + name + ", got " + std::to_string(value));
    }
    return value == 1;
}

} // namespace

std::map<std::string, std::vector<double>> readSettingsFile(const std::string& filename,
                                                            const std::string& calling_function_name) {
    std::map<std::string, std::vector<double>> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::getInstance().error("ReadTransdistConfiguration::" + calling_function_name, "Error opening settings file: " + filename);
        throw FileIOException(calling_function_name, "Error opening settings file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
        line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string setting_name;
        iss >> setting_name;
        std::vector<double> values;
        std::string token;
        while (iss >> token) {
            if (token[0] == '#') break;
            values.push_back(parseNumber(token, calling_function_name, line_number));
        }
        if (values.empty()) {
            Logger::getInstance().error("ReadTransdistConfiguration::" + calling_function_name, "Invalid line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw DataFormatException(calling_function_name, "Invalid line in settings file: " + line);
        }
        settings[setting_name] = values;
    }
    Logger::getInstance().info("ReadTransdistConfiguration::" + calling_function_name, "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

TransdistSettings readTransdistSettings(const std::string& filename) {
    const std::string funcName = "readTransdistSettings";
    const auto raw = readSettingsFile(filename, funcName);

    TransdistSettings settings;
    bool has_mean = false;
    bool has_sd = false;
    for (const auto& [name, values] : raw) {
        if      (name == "gen_t_mean") { settings.gen_t_mean = requireScalar(name, values); has_mean = true; }
        else if (name == "gen_t_sd") { settings.gen_t_sd = requireScalar(name, values); has_sd = true; }
        else if (name == "gen_t_family") {
            const long family = requireInteger(name, values);
            if (family != 0 && family != 1) {
                throw DataFormatException(funcName, "gen_t_family must be 0 (gamma) or 1 (normal), got " + std::to_string(family));
            }
            settings.gen_t_family = family == 0 ? GenerationTimeFamily::Gamma : GenerationTimeFamily::Normal;
        }
        else if (name == "gen_t_pmf") settings.gen_t_pmf = values;
        else if (name == "strict_precedence") settings.strict_precedence = requireFlag(name, values);
        else if (name == "t1") settings.t1 = requireScalar(name, values);
        else if (name == "max_sep") settings.max_sep = requireInt(name, values);
        else if (name == "max_dist") settings.max_dist = requireScalar(name, values);
        else if (name == "n_transtree_reps") settings.n_transtree_reps = requireInt(name, values);
        else if (name == "mean_equals_sd") settings.mean_equals_sd = requireFlag(name, values);
        else if (name == "boot_iter") settings.boot_iter = requireInt(name, values);
        else if (name == "ci_low") settings.ci_low = requireScalar(name, values);
        else if (name == "ci_high") settings.ci_high = requireScalar(name, values);
        else if (name == "min_cases") settings.min_cases = requireInt(name, values);
        else if (name == "use_parallel") settings.use_parallel = requireFlag(name, values);
        else if (name == "num_workers") settings.num_workers = requireInt(name, values);
        else if (name == "seed") {
            const long seed = requireInteger(name, values);
            if (seed < 0) {
                throw DataFormatException(funcName, "seed cannot be negative.");
            }
            settings.seed = static_cast<unsigned long>(seed);
        }
        else {
            Logger::getInstance().warning(funcName, "Unrecognized setting '" + name + "' in " + filename + ". Ignoring.");
        }
    }

    if (settings.gen_t_pmf.empty() && !(has_mean && has_sd)) {
        throw DataFormatException(funcName, "gen_t_mean and gen_t_sd are required unless gen_t_pmf is given: " + filename);
    }
    settings.validate();
    return settings;
}

} // namespace transdist
