#ifndef FIELD_ALERT_CWSI_STATE_HPP
#define FIELD_ALERT_CWSI_STATE_HPP

// Canopy-minus-air temperature baselines as linear functions of VPD:
//   dT_lower = lower_intercept_c + lower_slope * VPD   (non-water-stressed)
//   dT_upper = upper_intercept_c + upper_slope * VPD   (non-transpiring)
struct CwsiBaseline {
    float lower_intercept_c;
    float lower_slope_c_per_kpa;
    float upper_intercept_c;
    float upper_slope_c_per_kpa;
};

struct CwsiState {
    CwsiBaseline baseline;
    bool  fitted;     // lower baseline comes from the rolling fit
    bool  valid;      // false until an observation with VPD has been seen
    float index;      // 0 = no stress, 1 = maximum stress
    float delta_t_c;  // canopy minus air temperature behind 'index'
    float vpd_kpa;
};

#endif // FIELD_ALERT_CWSI_STATE_HPP
