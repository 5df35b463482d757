#include "records/Tags.hpp"

namespace records {

static const Rank kAllRanks[] = {
    Rank::Cadet, Rank::Officer, Rank::Lieutenant, Rank::Captain, Rank::Commander
};

static const ContactType kAllContactTypes[] = {
    ContactType::Radio, ContactType::Visual, ContactType::Physical, ContactType::Telepathic
};

const char* to_tag(Rank r) {
    switch (r) {
        case Rank::Cadet: return "cadet";
        case Rank::Officer: return "officer";
        case Rank::Lieutenant: return "lieutenant";
        case Rank::Captain: return "captain";
        case Rank::Commander: return "commander";
    }
    return "";
}

const char* to_tag(ContactType t) {
    switch (t) {
        case ContactType::Radio: return "radio";
        case ContactType::Visual: return "visual";
        case ContactType::Physical: return "physical";
        case ContactType::Telepathic: return "telepathic";
    }
    return "";
}

std::optional<Rank> parse_rank(const std::string& tag) {
    for (Rank r : kAllRanks) {
        if (tag == to_tag(r)) return r;
    }
    return std::nullopt;
}

std::optional<ContactType> parse_contact_type(const std::string& tag) {
    for (ContactType t : kAllContactTypes) {
        if (tag == to_tag(t)) return t;
    }
    return std::nullopt;
}

std::vector<std::string> rank_tags() {
    std::vector<std::string> out;
    for (Rank r : kAllRanks) out.push_back(to_tag(r));
    return out;
}

std::vector<std::string> contact_type_tags() {
    std::vector<std::string> out;
    for (ContactType t : kAllContactTypes) out.push_back(to_tag(t));
    return out;
}

bool is_leadership(Rank r) {
    switch (r) {
        case Rank::Captain:
        case Rank::Commander:
            return true;
        case Rank::Cadet:
        case Rank::Officer:
        case Rank::Lieutenant:
            return false;
    }
    return false;
}

std::vector<std::string> leadership_tags() {
    std::vector<std::string> out;
    for (Rank r : kAllRanks) {
        if (is_leadership(r)) out.push_back(to_tag(r));
    }
    return out;
}

}  // namespace records
