#include "procchain/core/record_data.hpp"

#include <stdexcept>

namespace procchain::core {

void StaticAttributes::set(std::string name, StaticValue value) {
	values_[std::move(name)] = std::move(value);
}

bool StaticAttributes::has(std::string_view name) const {
	return values_.find(name) != values_.end();
}

const StaticValue *StaticAttributes::find(std::string_view name) const {
	auto it = values_.find(name);
	return it == values_.end() ? nullptr : &it->second;
}

const StaticValue &StaticAttributes::at(std::string_view name) const {
	auto it = values_.find(name);
	if (it == values_.end()) {
		throw std::out_of_range("Static attribute '" + std::string(name) + "' does not exist.");
	}
	return it->second;
}

std::optional<double> StaticAttributes::getNumber(std::string_view name) const {
	const auto *value = find(name);
	if (!value) {
		return std::nullopt;
	}
	return toNumber(*value);
}

std::optional<std::string> StaticAttributes::getText(std::string_view name) const {
	const auto *value = find(name);
	if (!value || isEmpty(*value)) {
		return std::nullopt;
	}
	return toText(*value);
}

std::vector<std::string> StaticAttributes::names() const {
	std::vector<std::string> result;
	result.reserve(values_.size());
	for (const auto &entry : values_) {
		result.push_back(entry.first);
	}
	return result;
}

void SerialSeries::set(std::string name, Series values) {
	series_[std::move(name)] = std::move(values);
}

void SerialSeries::setTimeAxis(Series time) {
	time_ = std::move(time);
}

void SerialSeries::setSteps(std::vector<StepSegment> steps) {
	steps_ = std::move(steps);
}

bool SerialSeries::has(std::string_view name) const {
	return series_.find(name) != series_.end();
}

const Series *SerialSeries::find(std::string_view name) const {
	auto it = series_.find(name);
	return it == series_.end() ? nullptr : &it->second;
}

const Series &SerialSeries::at(std::string_view name) const {
	auto it = series_.find(name);
	if (it == series_.end()) {
		throw std::out_of_range("Serial series '" + std::string(name) + "' does not exist.");
	}
	return it->second;
}

std::vector<std::string> SerialSeries::names() const {
	std::vector<std::string> result;
	result.reserve(series_.size());
	for (const auto &entry : series_) {
		result.push_back(entry.first);
	}
	return result;
}

} // namespace procchain::core
