#pragma once

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace tests::helpers {

inline bool approxEqual(double lhs, double rhs, double eps = 1e-9) {
	if (std::isnan(lhs) && std::isnan(rhs)) {
		return true;
	}
	return std::fabs(lhs - rhs) <= eps;
}

inline void expectSeriesEqual(const std::vector<double> &lhs, const std::vector<double> &rhs, double eps = 1e-9) {
	REQUIRE(lhs.size() == rhs.size());
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		CAPTURE(i, lhs[i], rhs[i]);
		REQUIRE(approxEqual(lhs[i], rhs[i], eps));
	}
}

inline std::vector<double> ramp(std::size_t length, double start = 0.0, double step = 1.0) {
	std::vector<double> data;
	data.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		data.push_back(start + step * static_cast<double>(i));
	}
	return data;
}

inline std::vector<double> noisySine(std::size_t length, unsigned seed = 42) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 0.3);
	constexpr double pi = 3.14159265358979323846;

	std::vector<double> data;
	data.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		data.push_back(2.0 * std::sin(2.0 * pi * static_cast<double>(i) / 25.0) + noise(rng));
	}
	return data;
}

} // namespace tests::helpers
