#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace procchain::core {

using WorkpieceId = int64_t;
using Series = std::vector<double>;

/// The four process streams recorded for one workpiece.
enum class ProcessKind {
	UpperInjection,
	LowerInjection,
	ScrewLeft,
	ScrewRight
};

inline constexpr std::array<ProcessKind, 4> kAllProcessKinds = {
    ProcessKind::UpperInjection, ProcessKind::LowerInjection, ProcessKind::ScrewLeft, ProcessKind::ScrewRight};

/// Canonical name used in column prefixes and configuration keys, e.g. "upper-injection".
std::string_view processKindName(ProcessKind kind);

/**
 * @brief Parses a canonical kind name or its configuration-path alias
 *        (e.g. "injection_molding.upper_workpiece", "screw_driving.left").
 * @return The kind, or std::nullopt for an unknown name.
 */
std::optional<ProcessKind> parseProcessKind(std::string_view name);

bool isScrewDriving(ProcessKind kind);

/// A static attribute value as read from a source table.
using StaticValue = std::variant<std::monostate, int64_t, double, std::string>;

bool isEmpty(const StaticValue &value);

/// Numeric view of a static value; strings and empty values have none.
std::optional<double> toNumber(const StaticValue &value);

/// Text form of a static value; empty values render as an empty string.
std::string toText(const StaticValue &value);

} // namespace procchain::core
