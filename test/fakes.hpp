#ifndef FIELD_ALERT_TEST_FAKES_HPP
#define FIELD_ALERT_TEST_FAKES_HPP

#include <cstring>
#include <vector>
#include <field_alert/engine/alert_dispatcher.hpp>
#include <field_alert/engine/et_estimator.hpp>
#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/models/observation.hpp>

// Constant ET rate, can be told to fail
class FakeEtEstimator : public EtEstimator {
public:
    explicit FakeEtEstimator(float rate_mm_per_h = 1.0f) : rate(rate_mm_per_h), fail(false), calls(0) {}

    bool estimateEtRate(const char* zone_id, uint32_t from_ts_s, uint32_t to_ts_s,
                        float& out_mm_per_h) override {
        (void)zone_id;
        (void)from_ts_s;
        (void)to_ts_s;
        ++calls;
        if (fail) {
            return false;
        }
        out_mm_per_h = rate;
        return true;
    }

    float rate;
    bool fail;
    int calls;
};

class RecordingDispatcher : public AlertDispatcher {
public:
    bool dispatch(const DecisionRecord& record) override {
        records.push_back(record);
        return accept;
    }

    std::vector<DecisionRecord> records;
    bool accept = true;
};

namespace TestData {
    // Uniform FC 0.375 / PWP 0.125 over a 1000 mm root zone: WHC 250 mm
    inline SoilProfile::Config uniformConfig(CropType crop = CropType::CORN) {
        SoilProfile::Config cfg{};
        cfg.texture = SoilTexture::LOAM;
        cfg.crop = crop;
        for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
            cfg.depths[i].field_capacity = 0.375f;
            cfg.depths[i].wilting_point = 0.125f;
        }
        cfg.weights[0] = 0.5f;
        cfg.weights[1] = 0.25f;
        cfg.weights[2] = 0.25f;
        cfg.root_zone_depth_mm = 1000.0f;
        return cfg;
    }

    inline SoilProfile uniformProfile(CropType crop = CropType::CORN) {
        SoilProfile profile;
        (void)SoilProfile::create(uniformConfig(crop), profile);
        return profile;
    }

    inline RawObservation raw(const char* zone_id, uint32_t ts_s) {
        RawObservation r{};
        std::strncpy(r.zone_id, zone_id, ZONE_ID_LEN - 1);
        r.ts_s = ts_s;
        r.canopy_temp_c = 28.0f;
        r.air_temp_c = 30.0f;
        return r;
    }

    inline RawObservation withVwc(RawObservation r, float v6, float v12, float v18) {
        r.vwc[0] = v6;
        r.vwc[1] = v12;
        r.vwc[2] = v18;
        r.has_vwc[0] = r.has_vwc[1] = r.has_vwc[2] = true;
        return r;
    }

    inline Observation obs(const char* zone_id, uint32_t ts_s, float rain_mm = 0.0f) {
        Observation o{};
        std::strncpy(o.zone_id, zone_id, ZONE_ID_LEN - 1);
        o.ts_s = ts_s;
        o.canopy_temp_c = 28.0f;
        o.air_temp_c = 30.0f;
        o.rain_mm = rain_mm;
        return o;
    }

    static constexpr uint32_t HOUR = 3600U;
    static constexpr uint32_t T0 = 1780272000U;
}

#endif // FIELD_ALERT_TEST_FAKES_HPP
