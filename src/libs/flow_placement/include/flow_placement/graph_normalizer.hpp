#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flow_placement {

// Produces card keys of the form "{type}_{index}_{sequence}". The sequence is
// a process-wide monotonic counter, so keys never repeat within a process.
class CardKeyGenerator {
public:
    std::string next(std::string_view type, std::size_t index);

private:
    std::atomic<std::uint64_t> counter_{ 0 };
};

CardKeyGenerator& default_key_generator();

// Turns an ordered card list into a keyed graph: generated keys, left-to-right
// positions for cards without coordinates, and forward edges between
// neighbours. Map input is returned unchanged. Never throws on malformed
// entries; they are carried through for the validator to reject.
nlohmann::json normalize_cards(const nlohmann::json& cards);
nlohmann::json normalize_cards(const nlohmann::json& cards, CardKeyGenerator& keys);

// True when an output list of the card names at least one target.
bool declares_outputs(const nlohmann::json& card);

} // namespace flow_placement
