#pragma once

#include "procchain/config/extraction_config.hpp"

#include <string>

namespace procchain::config {

/**
 * @brief Builds an ExtractionConfig from the text of the two settings documents.
 *
 * processing_yaml holds per-series preprocessing (alignment, negative value
 * replacement, uniform resampling), extraction_yaml the per-series method
 * selection and the `defaults` section. Both are keyed by process kind, either
 * by canonical name ("upper-injection") or in the nested form
 * ("injection_molding: upper_workpiece:"). Entry order follows extraction_yaml.
 *
 * @throws core::ConfigError on malformed YAML, unknown kinds, methods or
 *         feature sets, wrong value types and missing required keys.
 */
ExtractionConfig parseSettings(const std::string &processing_yaml, const std::string &extraction_yaml);

/**
 * @brief Reads processing.yml and extraction.yml from a directory.
 * @throws core::ConfigError if either file is missing or invalid.
 */
ExtractionConfig loadSettings(const std::string &settings_dir);

} // namespace procchain::config
