#include "procchain/utils/text.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace procchain::utils {

std::string_view trim(std::string_view text) {
	const auto *whitespace = " \t\r\n";
	auto begin = text.find_first_not_of(whitespace);
	if (begin == std::string_view::npos) {
		return {};
	}
	auto end = text.find_last_not_of(whitespace);
	return text.substr(begin, end - begin + 1);
}

bool contains(std::string_view haystack, std::string_view needle) {
	return haystack.find(needle) != std::string_view::npos;
}

std::vector<std::string> splitRecord(std::string_view line, char delimiter) {
	std::vector<std::string> fields;
	std::string current;
	bool in_quotes = false;
	for (size_t i = 0; i < line.size(); ++i) {
		char c = line[i];
		if (in_quotes) {
			if (c == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					current.push_back('"');
					++i;
				} else {
					in_quotes = false;
				}
			} else {
				current.push_back(c);
			}
		} else if (c == '"') {
			in_quotes = true;
		} else if (c == delimiter) {
			fields.push_back(std::move(current));
			current.clear();
		} else if (c != '\r') {
			current.push_back(c);
		}
	}
	fields.push_back(std::move(current));
	return fields;
}

std::string quoteField(const std::string &field, char delimiter) {
	if (field.find_first_of(std::string {delimiter, '"', '\n', '\r'}) == std::string::npos) {
		return field;
	}
	std::string quoted = "\"";
	for (char c : field) {
		if (c == '"') {
			quoted.push_back('"');
		}
		quoted.push_back(c);
	}
	quoted.push_back('"');
	return quoted;
}

std::optional<int64_t> parseInteger(std::string_view text) {
	auto trimmed = std::string(trim(text));
	if (trimmed.empty()) {
		return std::nullopt;
	}
	errno = 0;
	char *end = nullptr;
	long long value = std::strtoll(trimmed.c_str(), &end, 10);
	if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
		return std::nullopt;
	}
	return static_cast<int64_t>(value);
}

std::optional<double> parseDouble(std::string_view text) {
	auto trimmed = std::string(trim(text));
	if (trimmed.empty()) {
		return std::nullopt;
	}
	char *end = nullptr;
	double value = std::strtod(trimmed.c_str(), &end);
	if (end != trimmed.c_str() + trimmed.size()) {
		return std::nullopt;
	}
	return value;
}

std::string formatNumber(double value) {
	if (std::isnan(value)) {
		return "nan";
	}
	if (std::isinf(value)) {
		return value > 0 ? "inf" : "-inf";
	}
	// Fewest significant digits that read back to the same double.
	std::string text;
	for (int precision = 15; precision <= 17; ++precision) {
		std::ostringstream oss;
		oss.precision(precision);
		oss << value;
		text = oss.str();
		if (std::strtod(text.c_str(), nullptr) == value) {
			break;
		}
	}
	return text;
}

std::string join(const std::vector<std::string> &parts, std::string_view separator) {
	std::string result;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i > 0) {
			result.append(separator);
		}
		result.append(parts[i]);
	}
	return result;
}

} // namespace procchain::utils
