#include "utils/ReadCaseData.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace transdist {

namespace {

std::string cleanCell(std::string cell) {
    cell.erase(0, cell.find_first_not_of(" \t\r\""));
    cell.erase(cell.find_last_not_of(" \t\r\"") + 1);
    return cell;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(cleanCell(cell));
    }
    return cells;
}

} // namespace

CaseTable readCaseTable(const std::string& filename) {
    const std::string funcName = "transdist::readCaseTable";
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw CSVReadException(CSVReadException::ErrorType::FileOpenError, funcName, filename);
    }

    std::string line;
    while (std::getline(file, line) && cleanCell(line).empty()) {}
    if (cleanCell(line).empty()) {
        throw CSVReadException(CSVReadException::ErrorType::NotEnoughRows, funcName, "empty file " + filename);
    }

    const std::vector<std::string> header = splitRow(line);
    auto columnOf = [&](const std::string& name) {
        auto it = std::find(header.begin(), header.end(), name);
        if (it == header.end()) {
            throw CSVReadException(CSVReadException::ErrorType::MissingColumn, funcName,
                "'" + name + "' in " + filename);
        }
        return static_cast<size_t>(it - header.begin());
    };
    const size_t col_x = columnOf("x");
    const size_t col_y = columnOf("y");
    const size_t col_t = columnOf("t");
    const size_t needed = std::max({col_x, col_y, col_t}) + 1;

    CaseTable cases;
    int row = 1;
    while (std::getline(file, line)) {
        ++row;
        if (cleanCell(line).empty()) continue;
        const std::vector<std::string> cells = splitRow(line);
        if (cells.size() < needed) {
            throw CSVReadException(CSVReadException::ErrorType::NotEnoughColumns, funcName,
                "row " + std::to_string(row) + " in " + filename);
        }
        auto parse = [&](size_t col) {
            const std::string& cell = cells[col];
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(cell, &consumed);
            } catch (const std::invalid_argument&) {
                consumed = 0;
            } catch (const std::out_of_range&) {
                throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                    "Number out of range at row " + std::to_string(row) + ", column " +
                    std::to_string(col + 1) + ": '" + cell + "' in " + filename);
            }
            if (cell.empty() || consumed != cell.size()) {
                throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                    "row " + std::to_string(row) + ", column " + std::to_string(col + 1) +
                    ": '" + cell + "' in " + filename);
            }
            return value;
        };
        Case c;
        c.x = parse(col_x);
        c.y = parse(col_y);
        c.t = parse(col_t);
        c.id = static_cast<int>(cases.size());
        cases.push_back(c);
    }

    if (cases.empty()) {
        throw CSVReadException(CSVReadException::ErrorType::NotEnoughRows, funcName, "No data rows found in file: " + filename);
    }
    Logger::getInstance().info(funcName, "Read " + std::to_string(cases.size()) + " cases from " + filename);
    return cases;
}

} // namespace transdist
