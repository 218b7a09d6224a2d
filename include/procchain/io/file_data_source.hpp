#pragma once

#include "procchain/io/data_source.hpp"
#include "procchain/io/static_table.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace procchain::io {

/**
 * @class FileDataSource
 * @brief Reads recordings from the on-disk corpus.
 *
 * Layout below the root, per kind directory:
 *   <dir>/static_data.csv          semicolon separated, keyed by upper_workpiece_id
 *   <dir>/serial_data/<file_name>  the serial source named by the static row
 *
 * Each static table is read once and cached; the cache is guarded so one
 * source may be shared between threads.
 */
class FileDataSource final : public IDataSource {
public:
	explicit FileDataSource(std::string root);

	SourceLocation resolvePath(core::WorkpieceId workpiece_id, core::ProcessKind kind) const override;
	core::RawRecording parse(const SourceLocation &location) const override;

	const std::string &root() const noexcept {
		return root_;
	}

	static constexpr const char *kStaticFileName = "static_data.csv";
	static constexpr const char *kSerialDirectory = "serial_data";
	static constexpr const char *kFileNameColumn = "file_name";

private:
	std::shared_ptr<const StaticTable> staticTable(const core::RecordingSchema &schema) const;
	const IRecordParser &parserFor(core::SourceFormat format) const;

	std::string root_;
	mutable std::mutex mutex_;
	mutable std::map<std::string, std::shared_ptr<const StaticTable>> static_tables_;
	std::map<core::SourceFormat, std::unique_ptr<IRecordParser>> parsers_;
};

} // namespace procchain::io
