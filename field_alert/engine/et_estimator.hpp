#ifndef FIELD_ALERT_ET_ESTIMATOR_HPP
#define FIELD_ALERT_ET_ESTIMATOR_HPP

#include <cstdint>

// Source of crop evapotranspiration rates. The water balance only consumes
// a rate; how it is derived (weather API, Penman-Monteith, lookup) is up to
// the implementation.
class EtEstimator {
public:
    virtual ~EtEstimator() = default;

    // Average crop ET rate in mm/h over [from_ts_s, to_ts_s].
    // Returns false when no estimate is available for the range.
    virtual bool estimateEtRate(const char* zone_id, uint32_t from_ts_s, uint32_t to_ts_s,
                                float& out_mm_per_h) = 0;
};

// ETc = ET0 * Kc with a fixed daily reference ET, spread evenly over the day
class CropCoefficientEtEstimator : public EtEstimator {
public:
    CropCoefficientEtEstimator(float reference_et_mm_per_day, float crop_coefficient);

    bool estimateEtRate(const char* zone_id, uint32_t from_ts_s, uint32_t to_ts_s,
                        float& out_mm_per_h) override;

private:
    float reference_et_mm_per_day;
    float crop_coefficient;
};

#endif // FIELD_ALERT_ET_ESTIMATOR_HPP
