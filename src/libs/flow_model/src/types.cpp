#include <flow_model/types.hpp>

namespace flow_model {

namespace {

template <typename CardT>
auto output_list(CardT& card, std::string_view field) -> decltype(&card.output_success) {
    if (field == "outputSuccess") return &card.output_success;
    if (field == "outputTrue") return &card.output_true;
    if (field == "outputFalse") return &card.output_false;
    if (field == "outputError") return &card.output_error;
    return nullptr;
}

} // namespace

std::vector<std::string>* Card::outputs(std::string_view field) {
    return output_list(*this, field);
}

const std::vector<std::string>* Card::outputs(std::string_view field) const {
    return output_list(*this, field);
}

} // namespace flow_model
