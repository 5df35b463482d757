#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "records/Tags.hpp"
#include "spacecheck/Record.hpp"
#include "spacecheck/Timestamp.hpp"

namespace records {

// Typed, read-only copies of validated records. Each from_record throws
// std::invalid_argument when given a record of another kind.

struct SpaceStation {
    std::string station_id;
    std::string name;
    std::int64_t crew_size = 0;
    double power_level = 0.0;
    double oxygen_level = 0.0;
    spacecheck::Timestamp last_maintenance;
    bool is_operational = true;
    std::optional<std::string> notes;

    static SpaceStation from_record(const spacecheck::ValidatedRecord& rec);
};

struct ContactReport {
    std::string contact_id;
    spacecheck::Timestamp timestamp;
    std::string location;
    ContactType contact_type = ContactType::Radio;
    double signal_strength = 0.0;
    std::int64_t duration_minutes = 0;
    std::int64_t witness_count = 0;
    std::optional<std::string> message_received;
    bool is_verified = false;

    static ContactReport from_record(const spacecheck::ValidatedRecord& rec);
};

struct CrewMember {
    std::string member_id;
    std::string name;
    Rank rank = Rank::Cadet;
    std::int64_t age = 0;
    std::string specialization;
    std::int64_t years_experience = 0;
    bool is_active = true;

    static CrewMember from_record(const spacecheck::ValidatedRecord& rec);
};

struct SpaceMission {
    std::string mission_id;
    std::string mission_name;
    std::string destination;
    spacecheck::Timestamp launch_date;
    std::int64_t duration_days = 0;
    std::vector<CrewMember> crew;
    std::string mission_status;
    double budget_millions = 0.0;

    static SpaceMission from_record(const spacecheck::ValidatedRecord& rec);
};

}  // namespace records
