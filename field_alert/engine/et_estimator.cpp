#include <field_alert/engine/et_estimator.hpp>
#include <cmath>

CropCoefficientEtEstimator::CropCoefficientEtEstimator(float reference_et_mm_per_day_in,
                                                       float crop_coefficient_in)
    : reference_et_mm_per_day(reference_et_mm_per_day_in),
      crop_coefficient(crop_coefficient_in) {}

bool CropCoefficientEtEstimator::estimateEtRate(const char* zone_id, uint32_t from_ts_s, uint32_t to_ts_s,
                                                float& out_mm_per_h) {
    (void)zone_id;
    if (to_ts_s <= from_ts_s) {
        return false;
    }
    float rate = reference_et_mm_per_day * crop_coefficient / 24.0f;
    if (!std::isfinite(rate) || rate < 0.0f) {
        return false;
    }
    out_mm_per_h = rate;
    return true;
}
