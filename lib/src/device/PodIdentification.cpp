#include "PodIdentification.h"
#include <unordered_map>

namespace podsync {

struct ProductEntry {
    PodFamily family;
    const char* model_name;
};

// Apple USB product ids for iPods in disk or sync mode
static const std::unordered_map<uint16_t, ProductEntry> kUsbProducts = {
    {0x1201, {PodFamily::Classic, "iPod (3rd Gen)"}},
    {0x1202, {PodFamily::Classic, "iPod (2nd Gen)"}},
    {0x1203, {PodFamily::Classic, "iPod (4th Gen)"}},
    {0x1204, {PodFamily::Classic, "iPod Photo"}},
    {0x1205, {PodFamily::Mini,    "iPod Mini"}},
    {0x1209, {PodFamily::Classic, "iPod Video"}},
    {0x120a, {PodFamily::Nano,    "iPod Nano (1st Gen)"}},
    {0x1260, {PodFamily::Nano,    "iPod Nano (2nd Gen)"}},
    {0x1261, {PodFamily::Classic, "iPod Classic"}},
    {0x1262, {PodFamily::Nano,    "iPod Nano (3rd Gen)"}},
    {0x1263, {PodFamily::Nano,    "iPod Nano (4th Gen)"}},
    {0x1265, {PodFamily::Nano,    "iPod Nano (5th Gen)"}},
    {0x1266, {PodFamily::Nano,    "iPod Nano (6th Gen)"}},
    {0x1267, {PodFamily::Nano,    "iPod Nano (7th Gen)"}},
    {0x1300, {PodFamily::Shuffle, "iPod Shuffle (1st Gen)"}},
    {0x1301, {PodFamily::Shuffle, "iPod Shuffle (2nd Gen)"}},
    {0x1302, {PodFamily::Shuffle, "iPod Shuffle (3rd Gen)"}},
    {0x1303, {PodFamily::Shuffle, "iPod Shuffle (4th Gen)"}},
    {0x1291, {PodFamily::Touch,   "iPod Touch (1st Gen)"}},
    {0x1293, {PodFamily::Touch,   "iPod Touch (2nd Gen)"}},
    {0x1299, {PodFamily::Touch,   "iPod Touch (3rd Gen)"}},
    {0x129e, {PodFamily::Touch,   "iPod Touch (4th Gen)"}},
    {0x12aa, {PodFamily::Touch,   "iPod Touch (5th Gen)"}}
};

// ProductType strings as reported by ideviceinfo
static const std::unordered_map<std::string, const char*> kTouchProductTypes = {
    {"iPod1,1", "iPod Touch (1st Gen)"},
    {"iPod2,1", "iPod Touch (2nd Gen)"},
    {"iPod3,1", "iPod Touch (3rd Gen)"},
    {"iPod4,1", "iPod Touch (4th Gen)"},
    {"iPod5,1", "iPod Touch (5th Gen)"},
    {"iPod7,1", "iPod Touch (6th Gen)"},
    {"iPod9,1", "iPod Touch (7th Gen)"}
};

const char* GetPodFamilyName(PodFamily family) {
    switch (family) {
        case PodFamily::Classic: return "Classic";
        case PodFamily::Mini:    return "Mini";
        case PodFamily::Nano:    return "Nano";
        case PodFamily::Shuffle: return "Shuffle";
        case PodFamily::Touch:   return "Touch";
        default:                 return "Unknown";
    }
}

bool FamilyUsesDiskMode(PodFamily family) {
    return family != PodFamily::Touch && family != PodFamily::Unknown;
}

PodIdentification IdentifyUsbProduct(uint16_t product_id) {
    PodIdentification result;
    result.product_id = product_id;

    auto it = kUsbProducts.find(product_id);
    if (it != kUsbProducts.end()) {
        result.family = it->second.family;
        result.model_name = it->second.model_name;
    } else {
        result.model_name = "Unknown";
    }
    result.family_name = GetPodFamilyName(result.family);
    result.valid = (result.family != PodFamily::Unknown);
    return result;
}

PodIdentification IdentifyProductType(const std::string& product_type) {
    PodIdentification result;

    auto it = kTouchProductTypes.find(product_type);
    if (it != kTouchProductTypes.end()) {
        result.family = PodFamily::Touch;
        result.model_name = it->second;
    } else if (product_type.find("iPod") != std::string::npos) {
        // Unlisted generation, still an iPod
        result.family = PodFamily::Touch;
        result.model_name = product_type;
    } else {
        result.model_name = product_type.empty() ? "Unknown" : product_type;
    }
    result.family_name = GetPodFamilyName(result.family);
    result.valid = (result.family != PodFamily::Unknown);
    return result;
}

} // namespace podsync
