#pragma once
// =============================================================================
// emu - Create Device Form
// =============================================================================
// Payload of the CreateDevice mode. Holds the full catalogs fetched for the
// platform plus the user's current choices; the Android device-type list is
// narrowed by a category filter.
// =============================================================================
#include <optional>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "device.hpp"
#include "result.hpp"

namespace emu {

enum class FormField { ApiLevel, Category, DeviceType, RamSize, StorageSize, Name };

const char* formFieldStr(FormField f);

class CreateDeviceForm {
public:
    static CreateDeviceForm forAndroid(const config::AndroidConfig& defaults = {});
    static CreateDeviceForm forIos();

    // "all", "phone", "tablet", "wear", "tv", "automotive", "desktop"
    static const std::vector<std::string>& categories();

    Platform platform() const { return platform_; }

    // Field focus, wrapping. iOS skips Category / RamSize / StorageSize
    void nextField();
    void prevField();
    const std::vector<FormField>& fieldOrder() const;

    // Installs freshly loaded catalogs and re-applies the current selections
    void setCatalogs(Catalog device_types, Catalog versions);

    // Device types passing the category filter (Android); all types on iOS
    Catalog filteredDeviceTypes() const;

    // Index setters clamp into range and regenerate the placeholder name
    void selectApiLevel(size_t index);
    void selectCategory(size_t index);       // resets the device-type choice
    void selectDeviceType(size_t index);

    // Wrapping step over the list belonging to the active field
    void cycleSelection(int delta);

    // "<up to 3 device words> API N" / "<device> iOS N"
    void generatePlaceholderName();

    // Runs the field validators; ValidationFailed names the offending field
    Result<DeviceConfig> toDeviceConfig() const;

    // --- Public fields (edited directly by the input layer) ---
    FormField active_field = FormField::ApiLevel;
    std::string name;
    std::string device_type;          // display
    std::string device_type_id;
    std::string version;              // API level / runtime identifier
    std::string version_display;
    std::string ram_size = "2048";
    std::string storage_size = "8192";
    std::string device_category_filter = "all";

    Catalog available_device_types;
    Catalog available_versions;
    size_t selected_api_level_index = 0;
    size_t selected_device_type_index = 0;
    size_t selected_category_index = 0;

    std::optional<std::string> error_message;
    std::optional<std::string> creation_status;
    bool is_creating = false;
    bool is_loading_cache = false;

private:
    explicit CreateDeviceForm(Platform p) : platform_(p) {}

    void applyApiLevelSelection();
    void applyDeviceTypeSelection();

    Platform platform_;
};

} // namespace emu
