#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace procchain::core {

/**
 * @class Error
 * @brief Base class of every error raised by the extraction pipeline.
 */
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/// A source file or location does not exist. Recovered into "process absent" at experiment scope.
class NotFoundError : public Error {
public:
	using Error::Error;
};

/// A source exists but could not be parsed.
class ParseError : public Error {
public:
	using Error::Error;
};

/// Malformed or inconsistent extraction/preprocessing configuration.
class ConfigError : public Error {
public:
	using Error::Error;
};

/// Non-finite values or degenerate statistics where a method cannot tolerate them.
class DataQualityError : public Error {
public:
	using Error::Error;
};

/// The same workpiece id was requested twice for one dataset.
class DuplicateIdError : public Error {
public:
	explicit DuplicateIdError(int64_t workpiece_id);

	int64_t workpieceId() const noexcept {
		return workpiece_id_;
	}

private:
	int64_t workpiece_id_;
};

/**
 * @class BuildError
 * @brief Aggregates the per-id failures of a bulk dataset construction.
 */
class BuildError : public Error {
public:
	struct Failure {
		int64_t workpiece_id = 0;
		std::string message;
	};

	explicit BuildError(std::vector<Failure> failures);

	const std::vector<Failure> &failures() const noexcept {
		return failures_;
	}

private:
	static std::string summarize(const std::vector<Failure> &failures);

	std::vector<Failure> failures_;
};

} // namespace procchain::core
