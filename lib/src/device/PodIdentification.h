#pragma once

#include <cstdint>
#include <string>

namespace podsync {

constexpr uint16_t kAppleVendorId = 0x05AC;

/// iPod product family, derived from the USB product id or the
/// libimobiledevice ProductType string
enum class PodFamily : uint8_t {
    Unknown = 0xFF,
    Classic = 0,   // full-size iPod, Photo, Video, Classic
    Mini = 1,
    Nano = 2,
    Shuffle = 3,
    Touch = 4
};

/// Identification resolved for one attached device
struct PodIdentification {
    PodFamily family = PodFamily::Unknown;
    uint16_t product_id = 0;
    std::string family_name;   // "Nano", "Classic", ...
    std::string model_name;    // "iPod Nano (7th Gen)", ...
    bool valid = false;
};

/// Look up a USB product id (Apple vendor id assumed)
/// @return PodIdentification with valid=false for non-iPod products
PodIdentification IdentifyUsbProduct(uint16_t product_id);

/// Look up a ProductType string reported by ideviceinfo ("iPod7,1")
PodIdentification IdentifyProductType(const std::string& product_type);

/// Get family display name
/// @return Family name or "Unknown"
const char* GetPodFamilyName(PodFamily family);

/// Disk-mode devices expose a mass-storage volume; Touch models only speak AFC
/// and have to be mounted through ifuse
bool FamilyUsesDiskMode(PodFamily family);

} // namespace podsync
