#include <flow_model/errors.hpp>

namespace flow_model {

namespace {

std::string card_message(const std::string& card_key, const std::string& field, const std::string& reason) {
    std::string where = card_key.empty() ? "Card" : "Card '" + card_key + "'";
    return where + ": field '" + field + "' " + reason;
}

} // namespace

CardFieldError::CardFieldError(std::string card_key, std::string field, const std::string& reason)
    : ValidationError(field, card_message(card_key, field, reason)), card_key_(std::move(card_key)) {}

} // namespace flow_model
