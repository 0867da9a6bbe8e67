// include/alloc_ngin/data/returns_csv_loader.hpp

#pragma once

#include <istream>
#include <string>
#include <vector>
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/data/returns_matrix.hpp"

namespace alloc_ngin {

/**
 * @brief Strict reader for periodic return files
 *
 * Expected layout:
 *   date,ASSET_1,ASSET_2,...
 *   2015-01-31,0.0123,-0.0045,...
 *
 * Blank lines are ignored. Any other malformed line (bad date, wrong
 * field count, non-numeric or non-finite value, out-of-order date)
 * fails the whole load with INVALID_DATA naming the offending line.
 */
class ReturnsCSVLoader {
public:
    ReturnsCSVLoader();

    /**
     * @brief Load a returns matrix from a file
     * @param path Path to the CSV file
     * @return The validated matrix, FILE_NOT_FOUND or INVALID_DATA
     */
    Result<ReturnsMatrix> load(const std::string& path) const;

    /**
     * @brief Parse a returns matrix from a stream
     * @param input Stream positioned at the header line
     * @param source Name used in error messages
     */
    Result<ReturnsMatrix> parse(std::istream& input, const std::string& source = "<stream>") const;

private:
    static std::vector<std::string> split(const std::string& line, char delimiter);
    static std::string trim(const std::string& text);
    static bool parse_number(const std::string& text, double& value);
};

}  // namespace alloc_ngin
