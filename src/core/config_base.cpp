// src/core/config_base.cpp

#include "alloc_ngin/core/config_base.hpp"
#include <iomanip>
#include <stdexcept>

namespace alloc_ngin {

Result<nlohmann::json> read_json_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open file for reading: " + filepath,
                                          "ConfigBase");
    }
    try {
        nlohmann::json document = nlohmann::json::parse(file);
        return document;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          filepath + ": " + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath,
                                    config_name());
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Error saving " + config_name() + ": " + e.what(),
                                config_name());
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    auto document = read_json_file(filepath);
    if (document.is_error()) {
        return forward_error<void>(document, config_name());
    }
    return load_from_json(document.value());
}

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    try {
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid " + config_name() + ": " + e.what(), config_name());
    } catch (const std::invalid_argument& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid " + config_name() + ": " + e.what(), config_name());
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Error loading " + config_name() + ": " + e.what(),
                                config_name());
    }
}

}  // namespace alloc_ngin
