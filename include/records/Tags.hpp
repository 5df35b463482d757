#pragma once

#include <optional>
#include <string>
#include <vector>

namespace records {

enum class Rank {
    Cadet,
    Officer,
    Lieutenant,
    Captain,
    Commander
};

enum class ContactType {
    Radio,
    Visual,
    Physical,
    Telepathic
};

const char* to_tag(Rank r);
const char* to_tag(ContactType t);

std::optional<Rank> parse_rank(const std::string& tag);
std::optional<ContactType> parse_contact_type(const std::string& tag);

// every tag, in declaration order; feeds the set-membership constraints
std::vector<std::string> rank_tags();
std::vector<std::string> contact_type_tags();

// ranks that satisfy the mission leadership rule
bool is_leadership(Rank r);
std::vector<std::string> leadership_tags();

}  // namespace records
