#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace flow_model {

// Base of every hard validation failure. `field()` names the offending field.
class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string field, const std::string& message)
        : std::runtime_error(message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// A required top-level field is missing or has the wrong shape.
class StructuralError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

// One card failed a required-field check.
class CardFieldError : public ValidationError {
public:
    CardFieldError(std::string card_key, std::string field, const std::string& reason);

    const std::string& card_key() const { return card_key_; }

private:
    std::string card_key_;
};

// Capability id unknown to the catalog. Reported, never thrown.
struct AdvisoryWarning {
    std::string card_key;
    std::string card_type;
    std::string capability_id;
    std::string message;
};

} // namespace flow_model
