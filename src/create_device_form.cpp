#include "create_device_form.hpp"
#include "device_priority.hpp"
#include "validation.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace emu {

namespace {

const std::vector<FormField> ANDROID_FIELDS = {
    FormField::ApiLevel, FormField::Category, FormField::DeviceType,
    FormField::RamSize, FormField::StorageSize, FormField::Name,
};
const std::vector<FormField> IOS_FIELDS = {
    FormField::ApiLevel, FormField::DeviceType, FormField::Name,
};

size_t wrapIndex(size_t index, int delta, size_t len) {
    const long long l = static_cast<long long>(len);
    const long long n = (static_cast<long long>(index) + delta) % l;
    return static_cast<size_t>((n + l) % l);
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// "Pixel 7 Pro (Google)" -> "Pixel 7 Pro"
std::string deviceWords(const std::string& display) {
    std::string cleaned;
    int depth = 0;
    for (char c : display) {
        if (c == '(') { ++depth; continue; }
        if (c == ')') { if (depth > 0) --depth; continue; }
        if (depth > 0) continue;
        if (std::isalnum(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    std::istringstream in(cleaned);
    std::string word, out;
    for (int n = 0; n < 3 && in >> word; ++n) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

} // anonymous namespace

const char* formFieldStr(FormField f) {
    switch (f) {
        case FormField::ApiLevel:    return "API Level";
        case FormField::Category:    return "Category";
        case FormField::DeviceType:  return "Device Type";
        case FormField::RamSize:     return "RAM Size";
        case FormField::StorageSize: return "Storage Size";
        case FormField::Name:        return "Name";
    }
    return "?";
}

CreateDeviceForm CreateDeviceForm::forAndroid(const config::AndroidConfig& defaults) {
    CreateDeviceForm form(Platform::Android);
    form.ram_size = defaults.default_ram;
    form.storage_size = defaults.default_storage;
    form.selectCategory(0);
    return form;
}

CreateDeviceForm CreateDeviceForm::forIos() {
    CreateDeviceForm form(Platform::Ios);
    form.ram_size.clear();
    form.storage_size.clear();
    return form;
}

const std::vector<std::string>& CreateDeviceForm::categories() {
    static const std::vector<std::string> kCategories = {
        "all", "phone", "tablet", "wear", "tv", "automotive", "desktop",
    };
    return kCategories;
}

const std::vector<FormField>& CreateDeviceForm::fieldOrder() const {
    return platform_ == Platform::Android ? ANDROID_FIELDS : IOS_FIELDS;
}

void CreateDeviceForm::nextField() {
    const auto& order = fieldOrder();
    auto it = std::find(order.begin(), order.end(), active_field);
    size_t i = it == order.end() ? 0 : static_cast<size_t>(it - order.begin());
    active_field = order[wrapIndex(i, 1, order.size())];
}

void CreateDeviceForm::prevField() {
    const auto& order = fieldOrder();
    auto it = std::find(order.begin(), order.end(), active_field);
    size_t i = it == order.end() ? 0 : static_cast<size_t>(it - order.begin());
    active_field = order[wrapIndex(i, -1, order.size())];
}

void CreateDeviceForm::setCatalogs(Catalog device_types, Catalog versions) {
    available_device_types = std::move(device_types);
    available_versions = std::move(versions);
    is_loading_cache = false;

    // Keep the previous choice when it is still offered
    auto pos = std::find_if(available_versions.begin(), available_versions.end(),
                            [&](const CatalogEntry& e) { return e.first == version; });
    selected_api_level_index = pos != available_versions.end()
        ? static_cast<size_t>(pos - available_versions.begin()) : 0;

    const Catalog filtered = filteredDeviceTypes();
    auto type_pos = std::find_if(filtered.begin(), filtered.end(),
                                 [&](const CatalogEntry& e) { return e.first == device_type_id; });
    selected_device_type_index = type_pos != filtered.end()
        ? static_cast<size_t>(type_pos - filtered.begin()) : 0;

    applyApiLevelSelection();
    applyDeviceTypeSelection();
}

Catalog CreateDeviceForm::filteredDeviceTypes() const {
    if (platform_ != Platform::Android || device_category_filter == "all") {
        return available_device_types;
    }
    Catalog out;
    for (const auto& entry : available_device_types) {
        if (matchesCategoryFilter(device_category_filter, entry.first, entry.second)) {
            out.push_back(entry);
        }
    }
    return out;
}

void CreateDeviceForm::selectApiLevel(size_t index) {
    if (available_versions.empty()) return;
    selected_api_level_index = std::min(index, available_versions.size() - 1);
    applyApiLevelSelection();
}

void CreateDeviceForm::selectCategory(size_t index) {
    const auto& cats = categories();
    selected_category_index = std::min(index, cats.size() - 1);
    device_category_filter = cats[selected_category_index];
    selected_device_type_index = 0;
    applyDeviceTypeSelection();
}

void CreateDeviceForm::selectDeviceType(size_t index) {
    const size_t len = filteredDeviceTypes().size();
    if (len == 0) return;
    selected_device_type_index = std::min(index, len - 1);
    applyDeviceTypeSelection();
}

void CreateDeviceForm::cycleSelection(int delta) {
    switch (active_field) {
        case FormField::ApiLevel:
            if (!available_versions.empty()) {
                selectApiLevel(wrapIndex(selected_api_level_index, delta, available_versions.size()));
            }
            break;
        case FormField::Category:
            selectCategory(wrapIndex(selected_category_index, delta, categories().size()));
            break;
        case FormField::DeviceType: {
            const size_t len = filteredDeviceTypes().size();
            if (len > 0) selectDeviceType(wrapIndex(selected_device_type_index, delta, len));
            break;
        }
        default:
            break;  // text fields
    }
}

void CreateDeviceForm::applyApiLevelSelection() {
    if (selected_api_level_index >= available_versions.size()) return;
    const auto& entry = available_versions[selected_api_level_index];
    version = entry.first;
    version_display = entry.second;
    generatePlaceholderName();
}

void CreateDeviceForm::applyDeviceTypeSelection() {
    const Catalog filtered = filteredDeviceTypes();
    if (filtered.empty()) {
        device_type_id.clear();
        device_type.clear();
        return;
    }
    if (selected_device_type_index >= filtered.size()) selected_device_type_index = 0;
    device_type_id = filtered[selected_device_type_index].first;
    device_type = filtered[selected_device_type_index].second;
    generatePlaceholderName();
}

void CreateDeviceForm::generatePlaceholderName() {
    std::string device_part = device_type.empty() ? std::string() : deviceWords(device_type);
    if (device_part.empty()) device_part = "Device";

    std::string api_part;
    if (version_display.rfind("iOS", 0) == 0) {
        api_part = version_display.substr(0, version_display.find('.'));     // "iOS 17"
    } else if (version_display.rfind("API", 0) == 0) {
        const auto second_space = version_display.find(' ', 4);
        api_part = version_display.substr(0, second_space);                  // "API 34"
    } else if (!version.empty()) {
        api_part = "API " + version;
    } else {
        api_part = "API";
    }

    name = device_part + " " + api_part;
}

Result<DeviceConfig> CreateDeviceForm::toDeviceConfig() const {
    const std::string trimmed = trim(name);

    auto r = validateField("Name", trimmed, DeviceNameValidator(platform_));
    if (r.is_err()) return r.error();

    r = RequiredSelectionValidator(platform_ == Platform::Android ? "API level" : "iOS version")
            .validate(version);
    if (r.is_err()) return r.error();

    r = RequiredSelectionValidator("device type").validate(device_type_id);
    if (r.is_err()) return r.error();

    DeviceConfig config(trimmed, device_type_id, version);
    if (platform_ == Platform::Android) {
        r = validateField("RAM", ram_size, NumericRangeValidator::ramSize());
        if (r.is_err()) return r.error();
        r = validateField("Storage", storage_size, NumericRangeValidator::storageSize());
        if (r.is_err()) return r.error();

        if (!ram_size.empty()) config = config.withRam(ram_size);
        if (!storage_size.empty()) config = config.withStorage(storage_size);
    }
    return config;
}

} // namespace emu
