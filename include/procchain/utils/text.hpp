#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procchain::utils {

std::string_view trim(std::string_view text);

bool contains(std::string_view haystack, std::string_view needle);

/**
 * @brief Splits one delimited-text record into fields.
 *
 * Double-quoted fields may contain the delimiter; a doubled quote inside a
 * quoted field is a literal quote. Surrounding whitespace is not removed.
 */
std::vector<std::string> splitRecord(std::string_view line, char delimiter);

/// Quotes a field for delimited output when it contains the delimiter, a quote or a line break.
std::string quoteField(const std::string &field, char delimiter);

std::optional<int64_t> parseInteger(std::string_view text);
std::optional<double> parseDouble(std::string_view text);

/// Shortest readable form of a number ("1.5", "1e-20", "nan", "inf").
std::string formatNumber(double value);

std::string join(const std::vector<std::string> &parts, std::string_view separator);

} // namespace procchain::utils
