#pragma once

#include "procchain/features/feature_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace procchain::features {

inline constexpr std::size_t kCatch22Count = 22;
inline constexpr std::size_t kCatch24Count = 24;

/// Descriptor names in output order (22, or 24 with DN_Mean and DN_Spread_Std).
const std::vector<std::string> &CanonicalFeatureNames(bool catch24 = false);

/**
 * @brief Computes the catch22 descriptors of a series.
 *
 * The 22 descriptors are computed on the z-scored series; the catch24
 * extras (mean and standard deviation) on the raw series. A series shorter
 * than 10 samples, with non-finite values or with zero variance yields NaN
 * for each of the 22.
 */
std::vector<double> ComputeCanonicalFeatures(const Series &series, bool catch24 = false);

/// Individual descriptors. Inputs are expected to be z-scored, finite and at least 10 samples long.
namespace catch22 {

double DN_HistogramMode(const Series &y, int num_bins);
double CO_f1ecac(const Series &y);
double CO_FirstMin_ac(const Series &y);
double CO_HistogramAMI_even_2_5(const Series &y);
double CO_trev_1_num(const Series &y);
double MD_hrv_classic_pnn40(const Series &y);
double SB_BinaryStats_mean_longstretch1(const Series &y);
double SB_BinaryStats_diff_longstretch0(const Series &y);
double SB_TransitionMatrix_3ac_sumdiagcov(const Series &y);
double PD_PeriodicityWang_th0_01(const Series &y);
double CO_Embed2_Dist_tau_d_expfit_meandiff(const Series &y);
double IN_AutoMutualInfoStats_40_gaussian_fmmi(const Series &y);
double FC_LocalSimple_mean_tauresrat(const Series &y, int train_length);
double FC_LocalSimple_mean_stderr(const Series &y, int train_length);
double DN_OutlierInclude_mdrmd(const Series &y, int sign);
double SP_Summaries_welch_rect_area_5_1(const Series &y);
double SP_Summaries_welch_rect_centroid(const Series &y);
double SB_MotifThree_quantile_hh(const Series &y);
double SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1(const Series &y);
double SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1(const Series &y);

/// Normalized autocorrelation at lags 0 .. n-1, computed by FFT.
std::vector<double> AutoCorrelations(const Series &y);

/// First lag at which the autocorrelation is no longer positive, capped at max_tau.
int FirstZero(const Series &y, int max_tau);

} // namespace catch22

} // namespace procchain::features
