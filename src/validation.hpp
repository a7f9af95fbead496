#pragma once
// =============================================================================
// emu - Create-Form Field Validation
// =============================================================================
// Validators run locally before any command is issued. A failure carries
// ErrorCode::ValidationFailed and a message fit for the form's error line.
// =============================================================================
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "device.hpp"
#include "result.hpp"

namespace emu {

class FieldValidator {
public:
    virtual ~FieldValidator() = default;
    virtual Result<void> validate(const std::string& value) const = 0;
    virtual const char* hint() const = 0;
};

// Non-empty, at most 50 characters, [A-Za-z0-9_.-] once spaces are mapped
// to '_'. AVD names may not start with '.' or '-'.
class DeviceNameValidator : public FieldValidator {
public:
    explicit DeviceNameValidator(Platform platform) : platform_(platform) {}
    Result<void> validate(const std::string& value) const override;
    const char* hint() const override;

private:
    Platform platform_;
};

// Unsigned MB value within [min, max]; empty means "use the default"
class NumericRangeValidator : public FieldValidator {
public:
    NumericRangeValidator(uint32_t min, uint32_t max, std::string unit = "MB")
        : min_(min), max_(max), unit_(std::move(unit)) {}

    static NumericRangeValidator ramSize();
    static NumericRangeValidator storageSize();

    Result<void> validate(const std::string& value) const override;
    const char* hint() const override;

private:
    uint32_t min_;
    uint32_t max_;
    std::string unit_;
};

class RequiredSelectionValidator : public FieldValidator {
public:
    explicit RequiredSelectionValidator(std::string field_name) : field_name_(std::move(field_name)) {}
    Result<void> validate(const std::string& value) const override;
    const char* hint() const override;

private:
    std::string field_name_;
};

// First failure wins; hint() is the first validator's hint
class CompositeValidator : public FieldValidator {
public:
    CompositeValidator& add(std::unique_ptr<FieldValidator> validator) {
        validators_.push_back(std::move(validator));
        return *this;
    }
    Result<void> validate(const std::string& value) const override;
    const char* hint() const override;
    size_t size() const { return validators_.size(); }

private:
    std::vector<std::unique_ptr<FieldValidator>> validators_;
};

// Prefixes the failure message with "<field_name>: "
Result<void> validateField(const std::string& field_name, const std::string& value,
                           const FieldValidator& validator);

} // namespace emu
