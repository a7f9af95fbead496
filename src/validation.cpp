#include "validation.hpp"
#include "emu_constants.hpp"
#include "parse_number.hpp"

#include <algorithm>
#include <cctype>

namespace emu {

namespace {

Result<void> invalid(std::string message) {
    return Err<void>(std::move(message), ErrorCode::ValidationFailed);
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

} // anonymous namespace

// -----------------------------------------------------------------------------
// DeviceNameValidator
// -----------------------------------------------------------------------------

Result<void> DeviceNameValidator::validate(const std::string& value) const {
    if (value.empty()) {
        return invalid("Device name cannot be empty");
    }
    if (value.size() > constants::MAX_DEVICE_NAME_LENGTH) {
        return invalid("Device name must be " + std::to_string(constants::MAX_DEVICE_NAME_LENGTH) +
                       " characters or less");
    }
    std::string converted = value;
    std::replace(converted.begin(), converted.end(), ' ', '_');
    if (!std::all_of(converted.begin(), converted.end(), isNameChar)) {
        return invalid("Device name may only contain letters, numbers, spaces, '_', '.' and '-'");
    }
    if (platform_ == Platform::Android && (value[0] == '.' || value[0] == '-')) {
        return invalid("Device name cannot start with '.' or '-'");
    }
    return Ok();
}

const char* DeviceNameValidator::hint() const {
    return "Letters, numbers, spaces, '_', '.' and '-' (max 50)";
}

// -----------------------------------------------------------------------------
// NumericRangeValidator
// -----------------------------------------------------------------------------

NumericRangeValidator NumericRangeValidator::ramSize() {
    return NumericRangeValidator(constants::MIN_RAM_MB, constants::MAX_RAM_MB);
}

NumericRangeValidator NumericRangeValidator::storageSize() {
    return NumericRangeValidator(constants::MIN_STORAGE_MB, constants::MAX_STORAGE_MB);
}

Result<void> NumericRangeValidator::validate(const std::string& value) const {
    if (value.empty()) return Ok();

    auto parsed = std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })
        ? parseUint64(value) : std::nullopt;
    if (!parsed) {
        return invalid("Please enter a valid number");
    }
    const uint64_t n = *parsed;
    if (n < min_) {
        return invalid("Value must be at least " + std::to_string(min_) + " " + unit_);
    }
    if (n > max_) {
        return invalid("Value must be at most " + std::to_string(max_) + " " + unit_);
    }
    return Ok();
}

const char* NumericRangeValidator::hint() const {
    return "Enter a size in MB, empty for default";
}

// -----------------------------------------------------------------------------
// RequiredSelectionValidator / CompositeValidator
// -----------------------------------------------------------------------------

Result<void> RequiredSelectionValidator::validate(const std::string& value) const {
    if (value.empty()) return invalid("Please select the " + field_name_);
    return Ok();
}

const char* RequiredSelectionValidator::hint() const {
    return "Selection required";
}

Result<void> CompositeValidator::validate(const std::string& value) const {
    for (const auto& v : validators_) {
        EMU_TRY_VOID(v->validate(value));
    }
    return Ok();
}

const char* CompositeValidator::hint() const {
    return validators_.empty() ? "Enter a value" : validators_.front()->hint();
}

Result<void> validateField(const std::string& field_name, const std::string& value,
                           const FieldValidator& validator) {
    auto r = validator.validate(value);
    if (r.is_err()) {
        return invalid(field_name + ": " + r.error().message);
    }
    return Ok();
}

} // namespace emu
