#include "procchain/features/canonical.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <complex>
#include <iterator>
#include <limits>
#include <numeric>

namespace procchain::features {

namespace {

constexpr double kPi = 3.14159265358979323846;

using Complex = std::complex<double>;

double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

double Mean(const double *y, size_t size) {
	if (size == 0) {
		return NaN();
	}
	return std::accumulate(y, y + size, 0.0) / static_cast<double>(size);
}

double Mean(const Series &y) {
	return Mean(y.data(), y.size());
}

// Sample standard deviation (n - 1).
double StdDev(const double *y, size_t size) {
	if (size < 2) {
		return NaN();
	}
	double m = Mean(y, size);
	double sum = 0.0;
	for (size_t i = 0; i < size; ++i) {
		sum += (y[i] - m) * (y[i] - m);
	}
	return std::sqrt(sum / static_cast<double>(size - 1));
}

double StdDev(const Series &y) {
	return StdDev(y.data(), y.size());
}

double Median(std::vector<double> values) {
	if (values.empty()) {
		return NaN();
	}
	std::sort(values.begin(), values.end());
	size_t n = values.size();
	return n % 2 == 1 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

double Quantile(const Series &y, double quant) {
	std::vector<double> sorted = y;
	std::sort(sorted.begin(), sorted.end());
	const auto size = static_cast<double>(sorted.size());
	const double q = 0.5 / size;
	if (quant < q) {
		return sorted.front();
	}
	if (quant > 1.0 - q) {
		return sorted.back();
	}
	const double idx = size * quant - 0.5;
	const auto left = static_cast<size_t>(std::floor(idx));
	const auto right = static_cast<size_t>(std::ceil(idx));
	if (left == right) {
		return sorted[left];
	}
	return sorted[left] + (idx - static_cast<double>(left)) * (sorted[right] - sorted[left]) /
	                          static_cast<double>(right - left);
}

// Pearson correlation of two equally long ranges.
double Correlation(const double *x, const double *y, size_t size) {
	double mx = Mean(x, size);
	double my = Mean(y, size);
	double nom = 0.0;
	double dx = 0.0;
	double dy = 0.0;
	for (size_t i = 0; i < size; ++i) {
		nom += (x[i] - mx) * (y[i] - my);
		dx += (x[i] - mx) * (x[i] - mx);
		dy += (y[i] - my) * (y[i] - my);
	}
	return nom / std::sqrt(dx * dy);
}

// Sample covariance of two equally long ranges.
double Covariance(const double *x, const double *y, size_t size) {
	double mx = Mean(x, size);
	double my = Mean(y, size);
	double sum = 0.0;
	for (size_t i = 0; i < size; ++i) {
		sum += (x[i] - mx) * (y[i] - my);
	}
	return sum / static_cast<double>(size - 1);
}

size_t NextPow2(size_t n) {
	size_t p = 1;
	while (p < n) {
		p <<= 1;
	}
	return p;
}

// In-place iterative radix-2 FFT; data.size() must be a power of two.
void Fft(std::vector<Complex> &data, bool inverse = false) {
	const size_t n = data.size();
	for (size_t i = 1, j = 0; i < n; ++i) {
		size_t bit = n >> 1;
		for (; j & bit; bit >>= 1) {
			j ^= bit;
		}
		j ^= bit;
		if (i < j) {
			std::swap(data[i], data[j]);
		}
	}
	for (size_t len = 2; len <= n; len <<= 1) {
		const double angle = 2.0 * kPi / static_cast<double>(len) * (inverse ? 1.0 : -1.0);
		const Complex wlen(std::cos(angle), std::sin(angle));
		for (size_t i = 0; i < n; i += len) {
			Complex w(1.0, 0.0);
			for (size_t k = 0; k < len / 2; ++k) {
				Complex u = data[i + k];
				Complex v = data[i + k + len / 2] * w;
				data[i + k] = u + v;
				data[i + k + len / 2] = u - v;
				w *= wlen;
			}
		}
	}
	if (inverse) {
		for (auto &value : data) {
			value /= static_cast<double>(n);
		}
	}
}

struct LineFit {
	double slope;
	double intercept;
};

LineFit FitLine(const double *x, const double *y, size_t size) {
	double sumx = 0.0;
	double sumy = 0.0;
	double sumxx = 0.0;
	double sumxy = 0.0;
	for (size_t i = 0; i < size; ++i) {
		sumx += x[i];
		sumy += y[i];
		sumxx += x[i] * x[i];
		sumxy += x[i] * y[i];
	}
	const auto n = static_cast<double>(size);
	const double denom = n * sumxx - sumx * sumx;
	if (denom == 0.0) {
		return {NaN(), NaN()};
	}
	const double slope = (n * sumxy - sumx * sumy) / denom;
	return {slope, (sumy - slope * sumx) / n};
}

// Equal-width histogram over [min, max]; edges has num_bins + 1 entries.
std::vector<int> HistCounts(const Series &y, int num_bins, std::vector<double> &edges) {
	auto [min_it, max_it] = std::minmax_element(y.begin(), y.end());
	const double min_val = *min_it;
	const double bin_step = (*max_it - min_val) / num_bins;
	std::vector<int> counts(static_cast<size_t>(num_bins), 0);
	for (double value : y) {
		int idx = bin_step > 0.0 ? static_cast<int>((value - min_val) / bin_step) : 0;
		idx = std::clamp(idx, 0, num_bins - 1);
		++counts[static_cast<size_t>(idx)];
	}
	edges.resize(static_cast<size_t>(num_bins) + 1);
	for (int i = 0; i <= num_bins; ++i) {
		edges[static_cast<size_t>(i)] = min_val + i * bin_step;
	}
	return counts;
}

int NumBinsAuto(const Series &y) {
	const double sd = StdDev(y);
	if (!(sd >= 0.001)) {
		return 0;
	}
	auto [min_it, max_it] = std::minmax_element(y.begin(), y.end());
	return static_cast<int>(
	    std::ceil((*max_it - *min_it) / (3.5 * sd / std::pow(static_cast<double>(y.size()), 1.0 / 3.0))));
}

// Labels 1..num_groups by quantile bands.
std::vector<int> CoarseGrainQuantile(const Series &y, int num_groups) {
	std::vector<double> thresholds(static_cast<size_t>(num_groups) + 1);
	for (int i = 0; i <= num_groups; ++i) {
		thresholds[static_cast<size_t>(i)] = Quantile(y, static_cast<double>(i) / num_groups);
	}
	thresholds[0] -= 1.0;
	std::vector<int> labels(y.size(), 0);
	for (int i = 0; i < num_groups; ++i) {
		for (size_t j = 0; j < y.size(); ++j) {
			if (y[j] > thresholds[static_cast<size_t>(i)] && y[j] <= thresholds[static_cast<size_t>(i) + 1]) {
				labels[j] = i + 1;
			}
		}
	}
	return labels;
}

// Residuals of predicting each sample by the mean of the previous train_length samples.
Series LocalMeanResiduals(const Series &y, size_t train_length) {
	Series res;
	if (y.size() <= train_length) {
		return res;
	}
	res.reserve(y.size() - train_length);
	for (size_t i = 0; i + train_length < y.size(); ++i) {
		res.push_back(y[i + train_length] - Mean(y.data() + i, train_length));
	}
	return res;
}

// Least-squares cubic spline with two pieces and C2 continuity at the middle break.
Series SplineFit(const Series &y) {
	const auto size = static_cast<Eigen::Index>(y.size());
	const double last = static_cast<double>(size - 1);
	const double knot = std::floor(last / 2.0) / last;
	Eigen::MatrixXd basis(size, 5);
	Eigen::VectorXd target(size);
	for (Eigen::Index i = 0; i < size; ++i) {
		const double x = static_cast<double>(i) / last;
		const double tail = std::max(0.0, x - knot);
		basis(i, 0) = 1.0;
		basis(i, 1) = x;
		basis(i, 2) = x * x;
		basis(i, 3) = x * x * x;
		basis(i, 4) = tail * tail * tail;
		target(i) = y[static_cast<size_t>(i)];
	}
	Eigen::VectorXd coeffs = basis.colPivHouseholderQr().solve(target);
	Eigen::VectorXd fitted = basis * coeffs;
	return Series(fitted.data(), fitted.data() + fitted.size());
}

double FluctuationAnalysis(const Series &y, size_t lag, bool dfa) {
	const size_t size = y.size();
	constexpr int kTauSteps = 50;
	const double lin_low = std::log(5.0);
	const double lin_high = std::log(static_cast<double>(size / 2));
	const double tau_step = (lin_high - lin_low) / (kTauSteps - 1);

	std::vector<size_t> tau;
	for (int i = 0; i < kTauSteps; ++i) {
		tau.push_back(static_cast<size_t>(std::round(std::exp(lin_low + i * tau_step))));
	}
	tau.erase(std::unique(tau.begin(), tau.end()), tau.end());
	const size_t n_tau = tau.size();
	if (n_tau < 12) {
		return 0.0;
	}

	const size_t size_cs = size / lag;
	std::vector<double> y_cs(size_cs);
	y_cs[0] = y[0];
	for (size_t i = 0; i + 1 < size_cs; ++i) {
		y_cs[i + 1] = y_cs[i] + y[(i + 1) * lag];
	}

	std::vector<double> x_reg(tau.back());
	std::iota(x_reg.begin(), x_reg.end(), 1.0);

	std::vector<double> fluct(n_tau, 0.0);
	std::vector<double> buffer;
	for (size_t i = 0; i < n_tau; ++i) {
		const size_t n_buffer = size_cs / tau[i];
		buffer.assign(tau[i], 0.0);
		for (size_t j = 0; j < n_buffer; ++j) {
			const double *segment = y_cs.data() + j * tau[i];
			const auto fit = FitLine(x_reg.data(), segment, tau[i]);
			for (size_t k = 0; k < tau[i]; ++k) {
				buffer[k] = segment[k] - (fit.slope * static_cast<double>(k + 1) + fit.intercept);
			}
			if (dfa) {
				for (double value : buffer) {
					fluct[i] += value * value;
				}
			} else {
				auto [lo, hi] = std::minmax_element(buffer.begin(), buffer.end());
				fluct[i] += (*hi - *lo) * (*hi - *lo);
			}
		}
		fluct[i] = dfa ? std::sqrt(fluct[i] / static_cast<double>(n_buffer * tau[i]))
		               : std::sqrt(fluct[i] / static_cast<double>(n_buffer));
	}

	std::vector<double> log_tt(n_tau);
	std::vector<double> log_ff(n_tau);
	for (size_t i = 0; i < n_tau; ++i) {
		log_tt[i] = std::log(static_cast<double>(tau[i]));
		log_ff[i] = std::log(fluct[i]);
	}

	constexpr size_t kMinPoints = 6;
	std::vector<double> sserr;
	for (size_t i = kMinPoints; i < n_tau - kMinPoints + 1; ++i) {
		const auto left = FitLine(log_tt.data(), log_ff.data(), i);
		const auto right = FitLine(log_tt.data() + i - 1, log_ff.data() + i - 1, n_tau - i + 1);
		double err_left = 0.0;
		for (size_t j = 0; j < i; ++j) {
			const double r = log_tt[j] * left.slope + left.intercept - log_ff[j];
			err_left += r * r;
		}
		double err_right = 0.0;
		for (size_t j = 0; j < n_tau - i + 1; ++j) {
			const double r = log_tt[j + i - 1] * right.slope + right.intercept - log_ff[j + i - 1];
			err_right += r * r;
		}
		sserr.push_back(std::sqrt(err_left) + std::sqrt(err_right));
	}

	const double minimum = *std::min_element(sserr.begin(), sserr.end());
	size_t first_min = 0;
	for (size_t i = 0; i < sserr.size(); ++i) {
		if (sserr[i] == minimum) {
			first_min = i + kMinPoints - 1;
			break;
		}
	}
	return static_cast<double>(first_min + 1) / static_cast<double>(n_tau);
}

// One rectangular Welch segment over the whole series; returns angular frequencies and power.
void WelchRect(const Series &y, std::vector<double> &w, std::vector<double> &sw) {
	const size_t size = y.size();
	const size_t nfft = NextPow2(size);
	const double m = Mean(y);
	std::vector<Complex> spectrum(nfft, Complex(0.0, 0.0));
	for (size_t i = 0; i < size; ++i) {
		spectrum[i] = Complex(y[i] - m, 0.0);
	}
	Fft(spectrum);

	const size_t n_out = nfft / 2 + 1;
	const double df = 1.0 / static_cast<double>(nfft);
	const auto kmu = static_cast<double>(size);
	w.resize(n_out);
	sw.resize(n_out);
	for (size_t i = 0; i < n_out; ++i) {
		double pxx = std::norm(spectrum[i]) / kmu;
		if (i > 0 && i < n_out - 1) {
			pxx *= 2.0;
		}
		w[i] = 2.0 * kPi * static_cast<double>(i) * df;
		sw[i] = pxx / (2.0 * kPi);
	}
}

} // namespace

namespace catch22 {

std::vector<double> AutoCorrelations(const Series &y) {
	const size_t size = y.size();
	const size_t nfft = NextPow2(size) << 1;
	const double m = Mean(y);
	std::vector<Complex> data(nfft, Complex(0.0, 0.0));
	for (size_t i = 0; i < size; ++i) {
		data[i] = Complex(y[i] - m, 0.0);
	}
	Fft(data);
	for (auto &value : data) {
		value *= std::conj(value);
	}
	Fft(data, true);
	std::vector<double> acf(size);
	const double divisor = data[0].real();
	for (size_t i = 0; i < size; ++i) {
		acf[i] = data[i].real() / divisor;
	}
	return acf;
}

int FirstZero(const Series &y, int max_tau) {
	const auto acf = AutoCorrelations(y);
	int idx = 0;
	while (idx < max_tau && static_cast<size_t>(idx) < acf.size() && acf[static_cast<size_t>(idx)] > 0) {
		++idx;
	}
	return idx;
}

double DN_HistogramMode(const Series &y, int num_bins) {
	std::vector<double> edges;
	const auto counts = HistCounts(y, num_bins, edges);
	int max_count = 0;
	int num_maxs = 1;
	double out = 0.0;
	for (size_t i = 0; i < counts.size(); ++i) {
		const double center = (edges[i] + edges[i + 1]) * 0.5;
		if (counts[i] > max_count) {
			max_count = counts[i];
			num_maxs = 1;
			out = center;
		} else if (counts[i] == max_count) {
			++num_maxs;
			out += center;
		}
	}
	return out / num_maxs;
}

double CO_f1ecac(const Series &y) {
	const auto acf = AutoCorrelations(y);
	const double thresh = 1.0 / std::exp(1.0);
	for (size_t i = 0; i + 2 < y.size(); ++i) {
		if (acf[i + 1] < thresh) {
			const double slope = acf[i + 1] - acf[i];
			return static_cast<double>(i) + (thresh - acf[i]) / slope;
		}
	}
	return static_cast<double>(y.size());
}

double CO_FirstMin_ac(const Series &y) {
	const auto acf = AutoCorrelations(y);
	for (size_t i = 1; i + 1 < y.size(); ++i) {
		if (acf[i] < acf[i - 1] && acf[i] < acf[i + 1]) {
			return static_cast<double>(i);
		}
	}
	return static_cast<double>(y.size());
}

double CO_HistogramAMI_even_2_5(const Series &y) {
	constexpr size_t kTau = 2;
	constexpr int kBins = 5;
	auto [min_it, max_it] = std::minmax_element(y.begin(), y.end());
	const double bin_step = (*max_it - *min_it + 0.2) / kBins;
	std::vector<double> edges(kBins + 1);
	for (int i = 0; i <= kBins; ++i) {
		edges[static_cast<size_t>(i)] = *min_it + bin_step * i - 0.1;
	}
	auto assign = [&](double value) {
		for (size_t j = 0; j < edges.size(); ++j) {
			if (value < edges[j]) {
				return static_cast<int>(j);
			}
		}
		return 0;
	};

	double joint[kBins][kBins] = {};
	size_t total = 0;
	for (size_t i = 0; i + kTau < y.size(); ++i) {
		const int b1 = assign(y[i]);
		const int b2 = assign(y[i + kTau]);
		if (b1 < 1 || b2 < 1) {
			continue;
		}
		joint[b1 - 1][b2 - 1] += 1.0;
		++total;
	}
	double p1[kBins] = {};
	double p2[kBins] = {};
	for (int i = 0; i < kBins; ++i) {
		for (int j = 0; j < kBins; ++j) {
			joint[i][j] /= static_cast<double>(total);
			p1[i] += joint[i][j];
			p2[j] += joint[i][j];
		}
	}
	double ami = 0.0;
	for (int i = 0; i < kBins; ++i) {
		for (int j = 0; j < kBins; ++j) {
			if (joint[i][j] > 0.0) {
				ami += joint[i][j] * std::log(joint[i][j] / (p1[i] * p2[j]));
			}
		}
	}
	return ami;
}

double CO_trev_1_num(const Series &y) {
	double sum = 0.0;
	for (size_t i = 0; i + 1 < y.size(); ++i) {
		const double d = y[i + 1] - y[i];
		sum += d * d * d;
	}
	return sum / static_cast<double>(y.size() - 1);
}

double MD_hrv_classic_pnn40(const Series &y) {
	constexpr double kPnn = 40.0;
	size_t count = 0;
	for (size_t i = 0; i + 1 < y.size(); ++i) {
		if (std::fabs(y[i + 1] - y[i]) * 1000.0 > kPnn) {
			++count;
		}
	}
	return static_cast<double>(count) / static_cast<double>(y.size() - 1);
}

double SB_BinaryStats_mean_longstretch1(const Series &y) {
	const double m = Mean(y);
	const size_t n = y.size() - 1;
	int max_stretch = 0;
	size_t last = 0;
	for (size_t i = 0; i < n; ++i) {
		const bool below = y[i] - m <= 0.0;
		if (below || i == n - 1) {
			max_stretch = std::max(max_stretch, static_cast<int>(i - last));
			last = i;
		}
	}
	return static_cast<double>(max_stretch);
}

double SB_BinaryStats_diff_longstretch0(const Series &y) {
	const size_t n = y.size() - 1;
	int max_stretch = 0;
	size_t last = 0;
	for (size_t i = 0; i < n; ++i) {
		const bool rising = y[i + 1] - y[i] >= 0.0;
		if (rising || i == n - 1) {
			max_stretch = std::max(max_stretch, static_cast<int>(i - last));
			last = i;
		}
	}
	return static_cast<double>(max_stretch);
}

double SB_TransitionMatrix_3ac_sumdiagcov(const Series &y) {
	constexpr int kGroups = 3;
	const int tau = FirstZero(y, static_cast<int>(y.size()));
	if (tau <= 0) {
		return NaN();
	}
	Series down;
	for (size_t i = 0; i < y.size(); i += static_cast<size_t>(tau)) {
		down.push_back(y[i]);
	}
	if (down.size() < 2) {
		return NaN();
	}
	const auto labels = CoarseGrainQuantile(down, kGroups);

	double transitions[kGroups][kGroups] = {};
	for (size_t j = 0; j + 1 < down.size(); ++j) {
		if (labels[j] < 1 || labels[j + 1] < 1) {
			continue;
		}
		transitions[labels[j] - 1][labels[j + 1] - 1] += 1.0;
	}
	std::vector<std::vector<double>> columns(kGroups, std::vector<double>(kGroups));
	for (int i = 0; i < kGroups; ++i) {
		for (int j = 0; j < kGroups; ++j) {
			columns[static_cast<size_t>(j)][static_cast<size_t>(i)] =
			    transitions[i][j] / static_cast<double>(down.size() - 1);
		}
	}
	double sum = 0.0;
	for (const auto &column : columns) {
		sum += Covariance(column.data(), column.data(), column.size());
	}
	return sum;
}

double PD_PeriodicityWang_th0_01(const Series &y) {
	constexpr double kThreshold = 0.01;
	const auto spline = SplineFit(y);
	Series detrended(y.size());
	for (size_t i = 0; i < y.size(); ++i) {
		detrended[i] = y[i] - spline[i];
	}

	const auto ac_max = static_cast<size_t>(std::ceil(static_cast<double>(y.size()) / 3.0));
	std::vector<double> acf(ac_max);
	for (size_t tau = 1; tau <= ac_max; ++tau) {
		const size_t n = y.size() - tau;
		acf[tau - 1] = Covariance(detrended.data(), detrended.data() + tau, n);
	}

	std::vector<size_t> troughs;
	std::vector<size_t> peaks;
	for (size_t i = 1; i + 1 < ac_max; ++i) {
		const double slope_in = acf[i] - acf[i - 1];
		const double slope_out = acf[i + 1] - acf[i];
		if (slope_in < 0 && slope_out > 0) {
			troughs.push_back(i);
		} else if (slope_in > 0 && slope_out < 0) {
			peaks.push_back(i);
		}
	}

	for (size_t peak : peaks) {
		const double the_peak = acf[peak];
		auto trough_it = std::lower_bound(troughs.begin(), troughs.end(), peak);
		if (trough_it == troughs.begin()) {
			continue;
		}
		const double the_trough = acf[*std::prev(trough_it)];
		if (the_peak - the_trough < kThreshold || the_peak < 0) {
			continue;
		}
		return static_cast<double>(peak);
	}
	return 0.0;
}

double CO_Embed2_Dist_tau_d_expfit_meandiff(const Series &y) {
	const size_t size = y.size();
	auto tau = static_cast<size_t>(FirstZero(y, static_cast<int>(size)));
	if (static_cast<double>(tau) > static_cast<double>(size) / 10.0) {
		tau = static_cast<size_t>(std::floor(static_cast<double>(size) / 10.0));
	}
	if (size < tau + 2) {
		return NaN();
	}

	Series dist(size - tau - 1);
	for (size_t i = 0; i < dist.size(); ++i) {
		const double a = y[i + 1] - y[i];
		const double b = y[i + tau + 1] - y[i + tau];
		dist[i] = std::sqrt(a * a + b * b);
	}
	const double l = Mean(dist);
	const int num_bins = NumBinsAuto(dist);
	if (num_bins == 0) {
		return 0.0;
	}
	std::vector<double> edges;
	const auto counts = HistCounts(dist, num_bins, edges);
	double diff_sum = 0.0;
	for (size_t i = 0; i < counts.size(); ++i) {
		const double norm = static_cast<double>(counts[i]) / static_cast<double>(dist.size());
		double expf = std::exp(-(edges[i] + edges[i + 1]) * 0.5 / l) / l;
		expf = std::max(expf, 0.0);
		diff_sum += std::fabs(norm - expf);
	}
	return diff_sum / static_cast<double>(counts.size());
}

double IN_AutoMutualInfoStats_40_gaussian_fmmi(const Series &y) {
	const size_t size = y.size();
	auto tau = static_cast<size_t>(40);
	tau = std::min(tau, static_cast<size_t>(std::ceil(static_cast<double>(size) / 2.0)));

	std::vector<double> ami(tau);
	for (size_t i = 0; i < tau; ++i) {
		const size_t lag = i + 1;
		const double ac = Correlation(y.data(), y.data() + lag, size - lag);
		ami[i] = -0.5 * std::log(1.0 - ac * ac);
	}
	for (size_t i = 1; i + 1 < tau; ++i) {
		if (ami[i] < ami[i - 1] && ami[i] < ami[i + 1]) {
			return static_cast<double>(i);
		}
	}
	return static_cast<double>(tau);
}

double FC_LocalSimple_mean_tauresrat(const Series &y, int train_length) {
	const auto res = LocalMeanResiduals(y, static_cast<size_t>(train_length));
	if (res.size() < 2) {
		return NaN();
	}
	const double res_zero = FirstZero(res, static_cast<int>(res.size()));
	const double y_zero = FirstZero(y, static_cast<int>(y.size()));
	return res_zero / y_zero;
}

double FC_LocalSimple_mean_stderr(const Series &y, int train_length) {
	return StdDev(LocalMeanResiduals(y, static_cast<size_t>(train_length)));
}

double DN_OutlierInclude_mdrmd(const Series &y, int sign) {
	constexpr double kInc = 0.01;
	const size_t size = y.size();
	Series work(size);
	size_t total = 0;
	bool constant = true;
	for (size_t i = 0; i < size; ++i) {
		constant = constant && y[i] == y[0];
		work[i] = sign * y[i];
		if (work[i] >= 0) {
			++total;
		}
	}
	if (constant) {
		return 0.0;
	}
	const double max_val = *std::max_element(work.begin(), work.end());
	if (max_val < kInc) {
		return 0.0;
	}
	const auto n_thresh = static_cast<size_t>(max_val / kInc + 1);

	std::vector<double> ms_dti1(n_thresh);
	std::vector<double> ms_dti3(n_thresh);
	std::vector<double> ms_dti4(n_thresh);
	std::vector<double> hits;
	std::vector<double> intervals;
	for (size_t i = 0; i < n_thresh; ++i) {
		hits.clear();
		for (size_t j = 0; j < size; ++j) {
			if (work[j] >= static_cast<double>(i) * kInc) {
				hits.push_back(static_cast<double>(j + 1));
			}
		}
		intervals.clear();
		for (size_t j = 0; j + 1 < hits.size(); ++j) {
			intervals.push_back(hits[j + 1] - hits[j]);
		}
		ms_dti1[i] = Mean(intervals);
		ms_dti3[i] = (static_cast<double>(hits.size()) - 1.0) * 100.0 / static_cast<double>(total);
		ms_dti4[i] = Median(hits) / (static_cast<double>(size) / 2.0) - 1.0;
	}

	constexpr double kTrim = 2.0;
	size_t mj = 0;
	size_t fbi = n_thresh - 1;
	for (size_t i = 0; i < n_thresh; ++i) {
		if (ms_dti3[i] > kTrim) {
			mj = i;
		}
		if (std::isnan(ms_dti1[n_thresh - 1 - i])) {
			fbi = n_thresh - 1 - i;
		}
	}
	const size_t trim = std::min(mj, fbi);
	return Median(std::vector<double>(ms_dti4.begin(), ms_dti4.begin() + static_cast<std::ptrdiff_t>(trim + 1)));
}

double SP_Summaries_welch_rect_area_5_1(const Series &y) {
	std::vector<double> w;
	std::vector<double> sw;
	WelchRect(y, w, sw);
	const double dw = w[1] - w[0];
	double area = 0.0;
	for (size_t i = 0; i < sw.size() / 5; ++i) {
		area += sw[i];
	}
	return area * dw;
}

double SP_Summaries_welch_rect_centroid(const Series &y) {
	std::vector<double> w;
	std::vector<double> sw;
	WelchRect(y, w, sw);
	std::vector<double> cumulative(sw.size());
	std::partial_sum(sw.begin(), sw.end(), cumulative.begin());
	const double half = cumulative.back() * 0.5;
	for (size_t i = 0; i < cumulative.size(); ++i) {
		if (cumulative[i] > half) {
			return w[i];
		}
	}
	return 0.0;
}

double SB_MotifThree_quantile_hh(const Series &y) {
	constexpr int kAlphabet = 3;
	const auto labels = CoarseGrainQuantile(y, kAlphabet);
	double counts[kAlphabet][kAlphabet] = {};
	for (size_t k = 0; k + 1 < labels.size(); ++k) {
		if (labels[k] < 1 || labels[k + 1] < 1) {
			continue;
		}
		counts[labels[k] - 1][labels[k + 1] - 1] += 1.0;
	}
	double entropy = 0.0;
	for (auto &row : counts) {
		for (double count : row) {
			const double p = count / static_cast<double>(y.size() - 1);
			if (p > 0.0) {
				entropy -= p * std::log(p);
			}
		}
	}
	return entropy;
}

double SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1(const Series &y) {
	return FluctuationAnalysis(y, 1, false);
}

double SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1(const Series &y) {
	return FluctuationAnalysis(y, 2, true);
}

} // namespace catch22

const std::vector<std::string> &CanonicalFeatureNames(bool catch24) {
	static const std::vector<std::string> names24 = {"DN_HistogramMode_5",
	                                                 "DN_HistogramMode_10",
	                                                 "CO_f1ecac",
	                                                 "CO_FirstMin_ac",
	                                                 "CO_HistogramAMI_even_2_5",
	                                                 "CO_trev_1_num",
	                                                 "MD_hrv_classic_pnn40",
	                                                 "SB_BinaryStats_mean_longstretch1",
	                                                 "SB_TransitionMatrix_3ac_sumdiagcov",
	                                                 "PD_PeriodicityWang_th0_01",
	                                                 "CO_Embed2_Dist_tau_d_expfit_meandiff",
	                                                 "IN_AutoMutualInfoStats_40_gaussian_fmmi",
	                                                 "FC_LocalSimple_mean1_tauresrat",
	                                                 "DN_OutlierInclude_p_001_mdrmd",
	                                                 "DN_OutlierInclude_n_001_mdrmd",
	                                                 "SP_Summaries_welch_rect_area_5_1",
	                                                 "SB_BinaryStats_diff_longstretch0",
	                                                 "SB_MotifThree_quantile_hh",
	                                                 "SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1",
	                                                 "SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1",
	                                                 "SP_Summaries_welch_rect_centroid",
	                                                 "FC_LocalSimple_mean3_stderr",
	                                                 "DN_Mean",
	                                                 "DN_Spread_Std"};
	static const std::vector<std::string> names22(names24.begin(), names24.begin() + kCatch22Count);
	return catch24 ? names24 : names22;
}

std::vector<double> ComputeCanonicalFeatures(const Series &series, bool catch24) {
	std::vector<double> out(catch24 ? kCatch24Count : kCatch22Count, NaN());
	if (catch24 && !series.empty()) {
		out[22] = Mean(series);
		out[23] = StdDev(series);
	}

	if (series.size() < 10) {
		return out;
	}
	for (double value : series) {
		if (!std::isfinite(value)) {
			return out;
		}
	}
	const double mean = Mean(series);
	const double sd = StdDev(series);
	if (!(sd > 0.0)) {
		return out;
	}
	Series z(series.size());
	for (size_t i = 0; i < series.size(); ++i) {
		z[i] = (series[i] - mean) / sd;
	}

	using namespace catch22;
	out[0] = DN_HistogramMode(z, 5);
	out[1] = DN_HistogramMode(z, 10);
	out[2] = CO_f1ecac(z);
	out[3] = CO_FirstMin_ac(z);
	out[4] = CO_HistogramAMI_even_2_5(z);
	out[5] = CO_trev_1_num(z);
	out[6] = MD_hrv_classic_pnn40(z);
	out[7] = SB_BinaryStats_mean_longstretch1(z);
	out[8] = SB_TransitionMatrix_3ac_sumdiagcov(z);
	out[9] = PD_PeriodicityWang_th0_01(z);
	out[10] = CO_Embed2_Dist_tau_d_expfit_meandiff(z);
	out[11] = IN_AutoMutualInfoStats_40_gaussian_fmmi(z);
	out[12] = FC_LocalSimple_mean_tauresrat(z, 1);
	out[13] = DN_OutlierInclude_mdrmd(z, 1);
	out[14] = DN_OutlierInclude_mdrmd(z, -1);
	out[15] = SP_Summaries_welch_rect_area_5_1(z);
	out[16] = SB_BinaryStats_diff_longstretch0(z);
	out[17] = SB_MotifThree_quantile_hh(z);
	out[18] = SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1(z);
	out[19] = SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1(z);
	out[20] = SP_Summaries_welch_rect_centroid(z);
	out[21] = FC_LocalSimple_mean_stderr(z, 3);
	return out;
}

} // namespace procchain::features
