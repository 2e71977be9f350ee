#include <field_alert/engine/cwsi_calculator.hpp>
#include <field_alert/utils/logger.hpp>
#include <cmath>

namespace {
    static const char* TAG = "CWSI";

    static bool isUsable(const CwsiBaseline& b) {
        return std::isfinite(b.lower_intercept_c) && std::isfinite(b.lower_slope_c_per_kpa) &&
               std::isfinite(b.upper_intercept_c) && std::isfinite(b.upper_slope_c_per_kpa);
    }
}

CwsiCalculator::CwsiCalculator()
    : configured_baseline{}, current{}, configured(false), fit_enabled(false), samples() {}

CwsiCalculator::CwsiCalculator(const CwsiBaseline& baseline, bool fit_enabled_in)
    : configured_baseline(baseline), current{}, configured(isUsable(baseline)),
      fit_enabled(fit_enabled_in), samples() {
    current.baseline = baseline;
}

bool CwsiCalculator::baselineForCrop(CropType crop, CwsiBaseline& out_baseline) {
    for (const auto& entry : Config::Cwsi::baselines) {
        if (entry.crop == crop) {
            out_baseline = entry.baseline;
            return true;
        }
    }
    return false;
}

bool CwsiCalculator::isConfigured() const {
    return configured;
}

EngineError CwsiCalculator::compute(float canopy_temp_c, float air_temp_c, float vpd_kpa,
                                    CwsiState& out_state) const {
    if (!configured) {
        return EngineError::CONFIG;
    }
    if (!std::isfinite(canopy_temp_c) || !std::isfinite(air_temp_c) || !std::isfinite(vpd_kpa)) {
        return EngineError::COMPUTATION;
    }

    const CwsiBaseline& b = current.baseline;
    const float delta_t = canopy_temp_c - air_temp_c;
    const float lower = b.lower_intercept_c + b.lower_slope_c_per_kpa * vpd_kpa;
    const float upper = b.upper_intercept_c + b.upper_slope_c_per_kpa * vpd_kpa;
    const float spread = upper - lower;
    if (!(spread > Config::Cwsi::min_baseline_spread_c)) {
        LOG_WARN(TAG, "Degenerate baselines at VPD %.2f kPa (lower %.2f, upper %.2f)", vpd_kpa, lower, upper);
        return EngineError::COMPUTATION;
    }

    float index = (delta_t - lower) / spread;
    if (index < 0.0f) index = 0.0f;
    if (index > 1.0f) index = 1.0f;

    CwsiState next = current;
    next.valid = true;
    next.index = index;
    next.delta_t_c = delta_t;
    next.vpd_kpa = vpd_kpa;
    out_state = next;
    return EngineError::NONE;
}

void CwsiCalculator::accept(const CwsiState& state, float smd_fraction, bool fit_sample) {
    current = state;
    if (!fit_enabled || !fit_sample || !state.valid || smd_fraction > Config::Cwsi::well_watered_smd_fraction) {
        return;
    }
    BaselineSample sample{ state.vpd_kpa, state.delta_t_c };
    (void)samples.pushOverwrite(sample);
    (void)refitLowerBaseline();
}

bool CwsiCalculator::refitLowerBaseline() {
    const std::size_t n = samples.size();
    if (n < Config::Cwsi::min_fit_samples) {
        return false;
    }

    float vpd_min = samples.at(0).vpd_kpa;
    float vpd_max = vpd_min;
    float sum_x = 0.0f;
    float sum_y = 0.0f;
    for (std::size_t i = 0; i < n; ++i) {
        const BaselineSample& s = samples.at(i);
        vpd_min = (s.vpd_kpa < vpd_min) ? s.vpd_kpa : vpd_min;
        vpd_max = (s.vpd_kpa > vpd_max) ? s.vpd_kpa : vpd_max;
        sum_x += s.vpd_kpa;
        sum_y += s.delta_t_c;
    }
    if ((vpd_max - vpd_min) < Config::Cwsi::min_fit_vpd_span_kpa) {
        return false;
    }

    const float mean_x = sum_x / static_cast<float>(n);
    const float mean_y = sum_y / static_cast<float>(n);
    float sxx = 0.0f;
    float sxy = 0.0f;
    for (std::size_t i = 0; i < n; ++i) {
        const BaselineSample& s = samples.at(i);
        sxx += (s.vpd_kpa - mean_x) * (s.vpd_kpa - mean_x);
        sxy += (s.vpd_kpa - mean_x) * (s.delta_t_c - mean_y);
    }
    if (!(sxx > 0.0f)) {
        return false;
    }

    const float slope = sxy / sxx;
    const float intercept = mean_y - slope * mean_x;
    // A transpiring canopy cools further as VPD rises; anything else is noise
    if (!std::isfinite(slope) || !std::isfinite(intercept) || slope >= 0.0f) {
        return false;
    }
    // The lines are straight, so staying below the upper baseline at both
    // ends of the accepted VPD range keeps them apart across all of it
    const CwsiBaseline& b = current.baseline;
    const float ends[] = { 0.0f, Config::Ingest::max_vpd_kpa };
    for (const float vpd : ends) {
        const float spread = (b.upper_intercept_c + b.upper_slope_c_per_kpa * vpd) - (intercept + slope * vpd);
        if (!(spread > Config::Cwsi::min_baseline_spread_c)) {
            LOG_DEBUG(TAG, "Refit dT = %.2f %+.2f * VPD rejected, meets the upper baseline at %.1f kPa",
                      intercept, slope, vpd);
            return false;
        }
    }

    current.baseline.lower_intercept_c = intercept;
    current.baseline.lower_slope_c_per_kpa = slope;
    current.fitted = true;
    LOG_DEBUG(TAG, "Lower baseline refitted from %u samples: dT = %.2f %+.2f * VPD",
              static_cast<unsigned>(n), intercept, slope);
    return true;
}

const CwsiState& CwsiCalculator::state() const {
    return current;
}

std::size_t CwsiCalculator::fitSampleCount() const {
    return samples.size();
}

void CwsiCalculator::reset() {
    current = CwsiState{};
    current.baseline = configured_baseline;
    samples.clear();
}
