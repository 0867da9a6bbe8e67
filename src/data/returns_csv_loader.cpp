// src/data/returns_csv_loader.cpp

#include "alloc_ngin/data/returns_csv_loader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "alloc_ngin/core/logger.hpp"
#include "alloc_ngin/core/time_utils.hpp"

namespace alloc_ngin {

ReturnsCSVLoader::ReturnsCSVLoader() {
    Logger::register_component("ReturnsCSVLoader");
}

Result<ReturnsMatrix> ReturnsCSVLoader::load(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<ReturnsMatrix>(ErrorCode::FILE_NOT_FOUND,
                                         "Returns file not found: " + path, "ReturnsCSVLoader");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<ReturnsMatrix>(ErrorCode::FILE_IO_ERROR,
                                         "Failed to open returns file: " + path,
                                         "ReturnsCSVLoader");
    }

    auto result = parse(file, path);
    if (result.is_ok()) {
        INFO("Loaded " << result.value().num_periods() << " periods for "
                       << result.value().num_assets() << " assets from " << path);
    }
    return result;
}

Result<ReturnsMatrix> ReturnsCSVLoader::parse(std::istream& input,
                                              const std::string& source) const {
    std::string line;
    size_t line_number = 0;

    auto line_error = [&](const std::string& what) {
        return make_error<ReturnsMatrix>(
            ErrorCode::INVALID_DATA,
            source + ":" + std::to_string(line_number) + ": " + what, "ReturnsCSVLoader");
    };

    std::vector<AssetId> assets;
    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty())
            continue;

        auto header = split(line, ',');
        if (header.size() < 2 || trim(header[0]) != "date") {
            return line_error("header must be 'date,<asset>,...'");
        }
        for (size_t i = 1; i < header.size(); ++i) {
            assets.push_back(trim(header[i]));
        }
        break;
    }

    if (assets.empty()) {
        return make_error<ReturnsMatrix>(ErrorCode::EMPTY_UNIVERSE,
                                         source + ": no header or no asset columns",
                                         "ReturnsCSVLoader");
    }

    std::vector<Timestamp> dates;
    std::vector<std::vector<double>> rows;

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty())
            continue;

        auto fields = split(line, ',');
        if (fields.size() != assets.size() + 1) {
            return line_error("expected " + std::to_string(assets.size() + 1) + " fields, got " +
                              std::to_string(fields.size()));
        }

        auto date = core::parse_iso_date(trim(fields[0]));
        if (!date) {
            return line_error("invalid date '" + fields[0] + "'");
        }
        if (!dates.empty() && *date <= dates.back()) {
            return line_error("date " + trim(fields[0]) + " is not after the previous row");
        }

        std::vector<double> row(assets.size());
        for (size_t i = 0; i < assets.size(); ++i) {
            if (!parse_number(trim(fields[i + 1]), row[i])) {
                return line_error("invalid return '" + fields[i + 1] + "' for " + assets[i]);
            }
        }

        dates.push_back(*date);
        rows.push_back(std::move(row));
    }

    Eigen::MatrixXd values(static_cast<Eigen::Index>(rows.size()),
                           static_cast<Eigen::Index>(assets.size()));
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < assets.size(); ++c) {
            values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }

    return ReturnsMatrix::create(std::move(dates), std::move(assets), std::move(values));
}

std::vector<std::string> ReturnsCSVLoader::split(const std::string& line, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delimiter) {
        tokens.emplace_back();
    }
    return tokens;
}

std::string ReturnsCSVLoader::trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

bool ReturnsCSVLoader::parse_number(const std::string& text, double& value) {
    if (text.empty())
        return false;
    errno = 0;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        return false;
    }
    return std::isfinite(value);
}

}  // namespace alloc_ngin
