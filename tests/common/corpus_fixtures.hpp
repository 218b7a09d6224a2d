#pragma once

#include "procchain/core/errors.hpp"
#include "procchain/io/data_source.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tests::fixtures {

/// A fresh directory below the system temp path, removed on destruction.
class TempDirectory {
public:
	TempDirectory() {
		static std::atomic<int> counter {0};
		auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() /
		        ("procchain_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
		std::filesystem::create_directories(path_);
	}

	~TempDirectory() {
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &path() const {
		return path_;
	}

	std::string file(const std::string &relative) const {
		return (path_ / relative).string();
	}

	void write(const std::string &relative, const std::string &content) const {
		auto target = path_ / relative;
		std::filesystem::create_directories(target.parent_path());
		std::ofstream out(target);
		out << content;
	}

private:
	std::filesystem::path path_;
};

/**
 * A small corpus with two complete workpieces (17401, 17402), one without
 * screw driving data (17403) and label rows for all of them.
 */
inline void writeSampleCorpus(const TempDirectory &dir) {
	dir.write("class_values.csv", ",upper_workpiece_id,lower_workpiece_id,class_value_upper_work_piece,"
	                              "class_value_lower_work_piece,class_value_screw_driving\n"
	                              "0,17401,27401,control,control,ok\n"
	                              "1,17402,27402,recyclate_10,control,ok\n"
	                              "2,17403,27403,recyclate_20,recyclate_20,nok\n"
	                              "3,workpiece_not_used,27404,control,control,ok\n");

	dir.write("injection_molding/upper_workpiece/static_data.csv",
	          "upper_workpiece_id;file_name;cycle_time;machine\n"
	          "17401;u17401.csv;21.5;A\n"
	          "17402;u17402.csv;22;B\n"
	          "17403;u17403.csv;;A\n");
	const char *upper_csv = ",time,injection_pressure_target,injection_pressure_actual,injection_velocity,melt_volume,"
	                        "state\n"
	                        "0,0.0,100,1,10,50,1\n"
	                        "1,0.1,100,2,12,48,1\n"
	                        "2,0.2,100,3,14,46,2\n"
	                        "3,0.3,100,4,16,44,2\n"
	                        "4,0.4,100,5,18,42,3\n";
	dir.write("injection_molding/upper_workpiece/serial_data/u17401.csv", upper_csv);
	dir.write("injection_molding/upper_workpiece/serial_data/u17402.csv", upper_csv);
	dir.write("injection_molding/upper_workpiece/serial_data/u17403.csv", upper_csv);

	dir.write("injection_molding/lower_workpiece/static_data.csv",
	          "upper_workpiece_id;lower_workpiece_id;file_name\n"
	          "17401;27401;l17401.txt\n"
	          "17402;27402;l17402.txt\n"
	          "17403;27403;l17403.txt\n");
	const char *lower_txt = "machine: lower press\n"
	                        "operator: shift 2\n"
	                        "-start data-\n"
	                        "0.0;90;5;40;7\n"
	                        "0.1;90;6;39;8\n"
	                        "\n"
	                        "0.2;90;7;38;9\n";
	dir.write("injection_molding/lower_workpiece/serial_data/l17401.txt", lower_txt);
	dir.write("injection_molding/lower_workpiece/serial_data/l17402.txt", lower_txt);
	dir.write("injection_molding/lower_workpiece/serial_data/l17403.txt", lower_txt);

	dir.write("screw_driving/static_data.csv",
	          ";file_name;upper_workpiece_id;class_value;workpiece_location;workpiece_result\n"
	          "0;s17401_l.json;17401;ok;left;OK\n"
	          "1;s17401_r.json;17401;ok;right;OK\n"
	          "2;s17402_l.json;17402;ok;left;OK\n"
	          "3;s17402_r.json;17402;ok;right;NOK\n");
	const char *screw_json = R"({
  "tightening steps": [
    {"name": "Finding", "graph": {"time values": [0.0, 0.1, 0.2], "torque values": [0.1, 0.2, 0.3],
                                  "angle values": [1, 2, 3], "gradient values": [0, 0, 0]}},
    {"name": "Tightening", "graph": {"time values": [0.3, 0.4], "torque values": [1.0, 1.5, 9.9],
                                     "angle values": [4], "gradient values": [0.5, 0.5]}}
  ]
})";
	dir.write("screw_driving/serial_data/s17401_l.json", screw_json);
	dir.write("screw_driving/serial_data/s17401_r.json", screw_json);
	dir.write("screw_driving/serial_data/s17402_l.json", screw_json);
	dir.write("screw_driving/serial_data/s17402_r.json", screw_json);
}

/// In-memory data source keyed by (id, kind).
class StubDataSource final : public procchain::io::IDataSource {
public:
	void add(procchain::core::WorkpieceId id, procchain::core::ProcessKind kind,
	         procchain::core::RawRecording recording) {
		recordings_[{id, kind}] = std::move(recording);
	}

	void failWith(procchain::core::WorkpieceId id, procchain::core::ProcessKind kind, std::string message) {
		broken_[{id, kind}] = std::move(message);
	}

	procchain::io::SourceLocation resolvePath(procchain::core::WorkpieceId id,
	                                          procchain::core::ProcessKind kind) const override {
		++resolve_calls;
		if (recordings_.count({id, kind}) == 0 && broken_.count({id, kind}) == 0) {
			throw procchain::core::NotFoundError("stub: nothing for " + std::to_string(id));
		}
		procchain::io::SourceLocation location;
		location.workpiece_id = id;
		location.kind = kind;
		location.serial_path = "stub://" + std::to_string(id);
		return location;
	}

	procchain::core::RawRecording parse(const procchain::io::SourceLocation &location) const override {
		auto broken = broken_.find({location.workpiece_id, location.kind});
		if (broken != broken_.end()) {
			throw procchain::core::ParseError(broken->second);
		}
		return recordings_.at({location.workpiece_id, location.kind});
	}

	mutable int resolve_calls = 0;

private:
	using Key = std::pair<procchain::core::WorkpieceId, procchain::core::ProcessKind>;
	std::map<Key, procchain::core::RawRecording> recordings_;
	std::map<Key, std::string> broken_;
};

inline procchain::core::RawRecording makeRecording(std::map<std::string, std::vector<double>> series) {
	procchain::core::RawRecording recording;
	for (auto &entry : series) {
		recording.serial_data.set(entry.first, std::move(entry.second));
	}
	return recording;
}

} // namespace tests::fixtures
