#include <field_alert/tasks/demo_feed_task.hpp>
#include <freertos/task.h>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/models/ingest_message.hpp>
#include <field_alert/utils/logger.hpp>
#include <mjson.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace {
    static const char* TAG = "DEMO_FEED";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static QueueHandle_t s_ingest_queue = nullptr;

    static constexpr std::size_t ZONE_COUNT = sizeof(Config::Zones::zones) / sizeof(Config::Zones::zones[0]);
    static constexpr float PI = 3.14159265f;

    // Peak hourly ET as a volumetric loss at 6", shallower depths dry faster
    static constexpr float peak_et_vwc_per_hour = 0.002f;
    static constexpr float depth_depletion[SOIL_DEPTH_COUNT] = { 1.0f, 0.6f, 0.3f };
    // Volumetric gain per inch of rain, deeper depths respond less
    static constexpr float rain_response[SOIL_DEPTH_COUNT] = { 0.08f, 0.04f, 0.02f };
    static constexpr float rain_chance_per_hour = 1.0f / 96.0f;
    // Operator refills once the top two depths lose this share of available water
    static constexpr float refill_depletion = 0.60f;

    struct ZoneSim {
        const char* zone_id;
        float field_capacity;
        float wilting_point;
        float vwc[SOIL_DEPTH_COUNT];
    };

    static ZoneSim s_zones[ZONE_COUNT];
    static std::mt19937 s_rng(Config::Tasks::DemoFeed::seed);

    static float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(s_rng);
    }

    static float noise(float stddev) {
        std::normal_distribution<float> dist(0.0f, stddev);
        return dist(s_rng);
    }

    static bool post(const char* payload, int len) {
        if (len <= 0 || len >= static_cast<int>(sizeof(IngestMessage::payload))) {
            LOG_ERROR(TAG, "%s", "Generated record does not fit the ingest message");
            return false;
        }
        IngestMessage msg{};
        msg.length = static_cast<uint16_t>(len);
        std::copy(payload, payload + len, msg.payload);
        if (xQueueSend(s_ingest_queue, &msg, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "Ingest queue full, dropped generated record");
            return false;
        }
        return true;
    }

    static void initZones() {
        for (std::size_t i = 0; i < ZONE_COUNT; ++i) {
            const Config::Zones::ZoneDefinition& def = Config::Zones::zones[i];
            SoilProfile profile;
            if (SoilProfile::fromTexture(def.texture, def.crop, profile) != EngineError::NONE) {
                LOG_ERROR(TAG, "No soil profile for zone %s", def.id);
                s_zones[i].zone_id = nullptr;
                continue;
            }
            const SoilProfile::DepthCapacity& cap = profile.config().depths[0];
            s_zones[i].zone_id = def.id;
            s_zones[i].field_capacity = cap.field_capacity;
            s_zones[i].wilting_point = cap.wilting_point;
            // Start at 70% of available water
            const float start = cap.wilting_point + 0.70f * (cap.field_capacity - cap.wilting_point);
            for (std::size_t d = 0; d < SOIL_DEPTH_COUNT; ++d) {
                s_zones[i].vwc[d] = start;
            }
        }
    }

    static void stepZone(ZoneSim& zone, uint32_t ts_s) {
        const float taw = zone.field_capacity - zone.wilting_point;
        const int hour = static_cast<int>((ts_s % 86400U) / 3600U);

        // ET peaks at 14:00 and stops overnight
        float diurnal = 0.0f;
        if (hour >= 6 && hour <= 20) {
            diurnal = std::sin(PI * static_cast<float>(hour - 6) / 14.0f);
        }
        for (std::size_t d = 0; d < SOIL_DEPTH_COUNT; ++d) {
            zone.vwc[d] -= peak_et_vwc_per_hour * diurnal * depth_depletion[d];
        }

        float rain_mm = 0.0f;
        if (uniform(0.0f, 1.0f) < rain_chance_per_hour) {
            const float rain_in = uniform(0.2f, 1.0f);
            rain_mm = rain_in * 25.4f;
            for (std::size_t d = 0; d < SOIL_DEPTH_COUNT; ++d) {
                zone.vwc[d] += rain_in * rain_response[d];
            }
        }

        for (std::size_t d = 0; d < SOIL_DEPTH_COUNT; ++d) {
            zone.vwc[d] = std::min(std::max(zone.vwc[d], zone.wilting_point * 0.8f), zone.field_capacity * 1.05f);
        }

        // Air around 30 C with an 8 C swing, canopy cooler than air when wet
        float air_c = (hour >= 6 && hour <= 18)
                          ? 30.0f + 8.0f * std::sin(PI * static_cast<float>(hour - 6) / 12.0f)
                          : 26.0f;
        air_c += noise(0.3f);
        const float shallow = (zone.vwc[0] + zone.vwc[1]) * 0.5f;
        float stress = 1.0f - (shallow - zone.wilting_point) / taw;
        stress = std::min(std::max(stress, 0.0f), 1.0f);
        const float canopy_c = air_c - 2.0f + 7.0f * stress + noise(0.15f);
        const float rh_pct = std::min(std::max(60.0f - 25.0f * diurnal + noise(2.0f), 10.0f), 95.0f);

        char buf[sizeof(IngestMessage::payload)];
        int n = mjson_snprintf(buf, sizeof(buf),
                               "{%Q:%Q,%Q:%Q,%Q:%lu,%Q:%g,%Q:%g,%Q:%g,%Q:%g,%Q:%g,%Q:%g,%Q:%g}",
                               "type", "observation",
                               "zone", zone.zone_id,
                               "ts", static_cast<unsigned long>(ts_s),
                               "canopy_temp_c", static_cast<double>(canopy_c),
                               "air_temp_c", static_cast<double>(air_c),
                               "vwc_6in", static_cast<double>(zone.vwc[0] + noise(0.002f)),
                               "vwc_12in", static_cast<double>(zone.vwc[1] + noise(0.002f)),
                               "vwc_18in", static_cast<double>(zone.vwc[2] + noise(0.002f)),
                               "rh_pct", static_cast<double>(rh_pct),
                               "rain_mm", static_cast<double>(rain_mm));
        (void)post(buf, n);

        // Refill is reported after the reading that showed the deficit
        if ((zone.field_capacity - shallow) / taw >= refill_depletion) {
            n = mjson_snprintf(buf, sizeof(buf), "{%Q:%Q,%Q:%Q,%Q:%lu}",
                               "type", "irrigation", "zone", zone.zone_id,
                               "ts", static_cast<unsigned long>(ts_s));
            (void)post(buf, n);
            for (std::size_t d = 0; d < SOIL_DEPTH_COUNT; ++d) {
                zone.vwc[d] = zone.field_capacity;
            }
            LOG_INFO(TAG, "Zone %s refilled", zone.zone_id);
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Demo Feed Task started");
        initZones();

        uint32_t ts_s = Config::Tasks::DemoFeed::start_ts_s;
        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::DemoFeed::period_ms);

        for (;;) {
            for (std::size_t i = 0; i < ZONE_COUNT; ++i) {
                if (s_zones[i].zone_id != nullptr) {
                    stepZone(s_zones[i], ts_s);
                }
            }
            ts_s += Config::Tasks::DemoFeed::step_s;
            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace DemoFeedTask {
    void create(QueueHandle_t ingest_queue) {
        s_ingest_queue = ingest_queue;
        xTaskCreateStatic(taskFunction, "demo_feed",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
