// include/stock_advisor/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "stock_advisor/core/error.hpp"

namespace stock_advisor {

/**
 * @brief JSON-backed settings section
 *
 * Every component config (screening, resolver, allocator, trend, logger) derives from
 * this. Keys missing from the JSON leave the compiled-in default untouched, so a partial
 * advisor.json only overrides what it names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to a file, pretty-printed
     * @return FILE_IO_ERROR when the file cannot be opened for writing
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a JSON file and apply it through from_json()
     * @return FILE_NOT_FOUND when unreadable, JSON_PARSE_ERROR for malformed text,
     *         INVALID_DATA when a value has the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    // Overrides only the keys present in j
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace stock_advisor
