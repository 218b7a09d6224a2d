#include "procchain/core/types.hpp"
#include "procchain/utils/text.hpp"

namespace procchain::core {

namespace {

struct KindNames {
	ProcessKind kind;
	std::string_view name;
	std::string_view alias;
};

constexpr std::array<KindNames, 4> kKindNames = {{
    {ProcessKind::UpperInjection, "upper-injection", "injection_molding.upper_workpiece"},
    {ProcessKind::LowerInjection, "lower-injection", "injection_molding.lower_workpiece"},
    {ProcessKind::ScrewLeft, "screw-left", "screw_driving.left"},
    {ProcessKind::ScrewRight, "screw-right", "screw_driving.right"},
}};

} // namespace

std::string_view processKindName(ProcessKind kind) {
	for (const auto &entry : kKindNames) {
		if (entry.kind == kind) {
			return entry.name;
		}
	}
	return "unknown";
}

std::optional<ProcessKind> parseProcessKind(std::string_view name) {
	for (const auto &entry : kKindNames) {
		if (entry.name == name || entry.alias == name) {
			return entry.kind;
		}
	}
	return std::nullopt;
}

bool isScrewDriving(ProcessKind kind) {
	return kind == ProcessKind::ScrewLeft || kind == ProcessKind::ScrewRight;
}

bool isEmpty(const StaticValue &value) {
	return std::holds_alternative<std::monostate>(value);
}

std::optional<double> toNumber(const StaticValue &value) {
	if (std::holds_alternative<int64_t>(value)) {
		return static_cast<double>(std::get<int64_t>(value));
	}
	if (std::holds_alternative<double>(value)) {
		return std::get<double>(value);
	}
	return std::nullopt;
}

std::string toText(const StaticValue &value) {
	struct Visitor {
		std::string operator()(std::monostate) const {
			return "";
		}
		std::string operator()(int64_t v) const {
			return std::to_string(v);
		}
		std::string operator()(double v) const {
			return utils::formatNumber(v);
		}
		std::string operator()(const std::string &v) const {
			return v;
		}
	};
	return std::visit(Visitor {}, value);
}

} // namespace procchain::core
