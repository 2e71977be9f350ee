#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/alert_dispatcher.hpp>
#include <field_alert/engine/et_estimator.hpp>
#include <field_alert/engine/irrigation_engine.hpp>
#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/models/decision_record.hpp>
#include <field_alert/models/ingest_message.hpp>
#include <field_alert/state/runtime_thresholds.hpp>
#include <field_alert/tasks/alert_task.hpp>
#include <field_alert/tasks/decision_task.hpp>
#include <field_alert/tasks/demo_feed_task.hpp>
#include <field_alert/tasks/ingest_task.hpp>
#include <field_alert/utils/logger.hpp>
#include <nvs_flash.h>

static const char* TAG = "MAIN";

namespace {
    static void configureLogging() {
        LogLevel level = LogLevel::INFO;
        if (!Logger::parseLevel(Config::Logging::level, level)) {
            LOG_WARN(TAG, "Unknown log level '%s', using info", Config::Logging::level);
        }
        Logger::setLevel(level);
        Logger::syncEspLogLevel("*");
        LOG_INFO(TAG, "Log level %s", Logger::levelName(Logger::getLevel()));
    }

    static void configureZones(IrrigationEngine& engine) {
        const DecisionThresholds thresholds = RuntimeThresholds::get();
        for (const Config::Zones::ZoneDefinition& def : Config::Zones::zones) {
            SoilProfile profile;
            EngineError err = SoilProfile::fromTexture(def.texture, def.crop, profile);
            if (err == EngineError::NONE) {
                err = engine.configureZone(def.id, profile, thresholds);
            }
            if (err != EngineError::NONE) {
                LOG_ERROR(TAG, "Zone %s not configured: %s", def.id, toString(err));
                continue;
            }
            LOG_INFO(TAG, "Zone %s: %s, %s, WHC %.1f mm", def.id, toString(def.texture),
                     toString(def.crop), static_cast<double>(profile.effectiveWhcMm()));
        }
    }
}

extern "C" void app_main(void)
{
    configureLogging();
    LOG_INFO(TAG, "%s", "---Field alert irrigation engine started---");

    // Initialize NVS (required before runtime thresholds can use it)
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS init failed: %d", static_cast<int>(err));
    }

    // Thresholds are fixed for the session from here on
    RuntimeThresholds::init();

    // Create static queues
    static uint8_t ingest_queue_storage[Config::Tasks::Ingest::queue_length * sizeof(IngestMessage)];
    static StaticQueue_t ingest_queue_tcb;
    QueueHandle_t ingest_queue = xQueueCreateStatic(
        Config::Tasks::Ingest::queue_length, sizeof(IngestMessage), ingest_queue_storage, &ingest_queue_tcb);

    static uint8_t decision_queue_storage[Config::Tasks::Decision::queue_length * sizeof(DecisionRecord)];
    static StaticQueue_t decision_queue_tcb;
    QueueHandle_t decision_queue = xQueueCreateStatic(
        Config::Tasks::Decision::queue_length, sizeof(DecisionRecord), decision_queue_storage, &decision_queue_tcb);

    static CropCoefficientEtEstimator et_estimator(Config::WaterBalance::reference_et_mm_per_day,
                                                   Config::WaterBalance::crop_coefficient);
    static QueueAlertDispatcher dispatcher(decision_queue);
    static IrrigationEngine engine(et_estimator, Config::Features::enable_alert_task ? &dispatcher : nullptr);

    if (!engine.init()) {
        LOG_ERROR(TAG, "%s", "Engine init failed, halting");
        for (;;) {
            vTaskDelay(portMAX_DELAY);
        }
    }
    configureZones(engine);

    // Consumers first, then producers
    if (Config::Features::enable_alert_task) {
        AlertTask::create(decision_queue);
    }
    DecisionTask::create(engine);
    IngestTask::create(ingest_queue, engine);
    if (Config::Features::enable_demo_feed) {
        DemoFeedTask::create(ingest_queue);
    }

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
