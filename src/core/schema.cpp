#include "procchain/core/schema.hpp"

#include <stdexcept>

namespace procchain::core {

namespace {

std::vector<RecordingSchema> buildSchemas() {
	std::vector<RecordingSchema> schemas;

	RecordingSchema upper;
	upper.kind = ProcessKind::UpperInjection;
	upper.format = SourceFormat::CsvTable;
	upper.directory = "injection_molding/upper_workpiece";
	upper.time_series = "time";
	upper.series = {"injection_pressure_target", "injection_pressure_actual", "injection_velocity", "melt_volume",
	                "state"};
	schemas.push_back(upper);

	RecordingSchema lower;
	lower.kind = ProcessKind::LowerInjection;
	lower.format = SourceFormat::MarkedText;
	lower.directory = "injection_molding/lower_workpiece";
	lower.time_series = "time";
	lower.source_columns = {"time", "injection_pressure_target", "injection_pressure_actual", "melt_volume",
	                        "injection_velocity"};
	lower.series = {"injection_pressure_target", "injection_pressure_actual", "injection_velocity", "melt_volume"};
	schemas.push_back(lower);

	for (auto kind : {ProcessKind::ScrewLeft, ProcessKind::ScrewRight}) {
		RecordingSchema screw;
		screw.kind = kind;
		screw.format = SourceFormat::JsonSteps;
		screw.directory = "screw_driving";
		screw.location = kind == ProcessKind::ScrewLeft ? "left" : "right";
		screw.static_index_column = true;
		screw.time_series = "time";
		screw.series = {"torque", "angle", "gradient", "torqueRed", "angleRed"};
		schemas.push_back(screw);
	}
	return schemas;
}

} // namespace

const RecordingSchema &schemaFor(ProcessKind kind) {
	static const std::vector<RecordingSchema> schemas = buildSchemas();
	for (const auto &schema : schemas) {
		if (schema.kind == kind) {
			return schema;
		}
	}
	throw std::invalid_argument("No recording schema for kind " + std::string(processKindName(kind)));
}

} // namespace procchain::core
