#include "procchain/io/file_data_source.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/io/delimited_text_parser.hpp"
#include "procchain/io/json_step_parser.hpp"
#include "procchain/utils/logging.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace procchain::io {

namespace fs = std::filesystem;

FileDataSource::FileDataSource(std::string root) : root_(std::move(root)) {
	parsers_[core::SourceFormat::CsvTable] = std::make_unique<CsvTableParser>(',');
	parsers_[core::SourceFormat::MarkedText] = std::make_unique<MarkedTextParser>(';');
	parsers_[core::SourceFormat::JsonSteps] = std::make_unique<JsonStepParser>();
}

std::shared_ptr<const StaticTable> FileDataSource::staticTable(const core::RecordingSchema &schema) const {
	auto path = (fs::path(root_) / schema.directory / kStaticFileName).string();
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = static_tables_.find(path);
	if (it != static_tables_.end()) {
		return it->second;
	}
	auto table = std::make_shared<const StaticTable>(StaticTable::readFile(path, ';', schema.static_index_column));
	PROCCHAIN_DEBUG("Loaded static table {} ({} rows)", path, table->rowCount());
	static_tables_.emplace(path, table);
	return table;
}

const IRecordParser &FileDataSource::parserFor(core::SourceFormat format) const {
	auto it = parsers_.find(format);
	if (it == parsers_.end()) {
		throw std::logic_error("No parser registered for source format.");
	}
	return *it->second;
}

SourceLocation FileDataSource::resolvePath(core::WorkpieceId workpiece_id, core::ProcessKind kind) const {
	const auto &schema = core::schemaFor(kind);
	auto table = staticTable(schema);
	auto row = table->findWorkpiece(workpiece_id, schema.location);
	if (!row) {
		throw core::NotFoundError("No " + std::string(core::processKindName(kind)) + " static row for workpiece " +
		                          std::to_string(workpiece_id) + ".");
	}

	SourceLocation location;
	location.workpiece_id = workpiece_id;
	location.kind = kind;
	location.static_row = table->rowAttributes(*row);

	auto file_name = location.static_row.getText(kFileNameColumn);
	if (!file_name) {
		throw core::NotFoundError("Static row of workpiece " + std::to_string(workpiece_id) + " (" +
		                          std::string(core::processKindName(kind)) + ") names no serial file.");
	}
	location.serial_path = (fs::path(root_) / schema.directory / kSerialDirectory / *file_name).string();
	return location;
}

core::RawRecording FileDataSource::parse(const SourceLocation &location) const {
	const auto &schema = core::schemaFor(location.kind);
	std::ifstream input(location.serial_path);
	if (!input) {
		throw core::NotFoundError("Serial file '" + location.serial_path + "' not found.");
	}

	core::RawRecording recording;
	try {
		recording = parserFor(schema.format).parse(input, schema);
	} catch (const core::ParseError &e) {
		throw core::ParseError(location.serial_path + ": " + e.what());
	}

	// Attributes derived from the serial data come after the static row and may not shadow it.
	auto static_data = location.static_row;
	for (const auto &name : recording.static_data.names()) {
		if (!static_data.has(name)) {
			static_data.set(name, recording.static_data.at(name));
		}
	}
	recording.static_data = std::move(static_data);
	return recording;
}

} // namespace procchain::io
