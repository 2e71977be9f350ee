#ifndef FIELD_ALERT_SOIL_TYPES_HPP
#define FIELD_ALERT_SOIL_TYPES_HPP

#include <cstddef>
#include <cstdint>

// Soil texture classes (USDA), coarse to fine
enum class SoilTexture : uint8_t {
    SAND = 0,
    LOAMY_SAND,
    SANDY_LOAM,
    LOAM,
    SILT_LOAM,
    SANDY_CLAY_LOAM,
    CLAY_LOAM,
    SILTY_CLAY_LOAM,
    CLAY
};

// Crop types with known CWSI baselines
enum class CropType : uint8_t {
    CORN = 0,
    COTTON,
    SOYBEAN,
    SORGHUM
};

// Monitored sensor depths: index 0 = 6", 1 = 12", 2 = 18"
static constexpr std::size_t SOIL_DEPTH_COUNT = 3;
static constexpr uint8_t ALL_DEPTHS_MASK = (1U << SOIL_DEPTH_COUNT) - 1U;

inline const char* toString(SoilTexture texture) {
    switch (texture) {
        case SoilTexture::SAND:            return "Sand";
        case SoilTexture::LOAMY_SAND:      return "Loamy Sand";
        case SoilTexture::SANDY_LOAM:      return "Sandy Loam";
        case SoilTexture::LOAM:            return "Loam";
        case SoilTexture::SILT_LOAM:       return "Silt Loam";
        case SoilTexture::SANDY_CLAY_LOAM: return "Sandy Clay Loam";
        case SoilTexture::CLAY_LOAM:       return "Clay Loam";
        case SoilTexture::SILTY_CLAY_LOAM: return "Silty Clay Loam";
        case SoilTexture::CLAY:            return "Clay";
    }
    return "Unknown";
}

inline const char* toString(CropType crop) {
    switch (crop) {
        case CropType::CORN:    return "Corn";
        case CropType::COTTON:  return "Cotton";
        case CropType::SOYBEAN: return "Soybean";
        case CropType::SORGHUM: return "Sorghum";
    }
    return "Unknown";
}

#endif // FIELD_ALERT_SOIL_TYPES_HPP
