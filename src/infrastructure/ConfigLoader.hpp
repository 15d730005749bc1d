/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the tiering configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place instead of scattering it
 * across the stores and the command-line front end.
 */

#pragma once

#include <string>
#include "domain/EngramConfig.hpp"

namespace engram::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from dataRoot.
     * @param dataRoot Directory holding settings.json.
     * @return Loaded config. A missing file yields defaults; a malformed file is
     * logged and also yields defaults. Keys absent from the file keep their defaults.
     * The result is not validated; call EngramConfig::validate().
     */
    static domain::EngramConfig Load(const std::string& dataRoot);

    /**
     * @brief Writes every key of config to settings.json (4-space indent),
     * preserving unrelated keys already in the file.
     */
    static void Save(const std::string& dataRoot, const domain::EngramConfig& config);
};

} // namespace engram::infrastructure
