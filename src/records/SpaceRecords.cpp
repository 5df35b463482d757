#include "records/SpaceRecords.hpp"

#include "records/SpaceSchemas.hpp"

#include <stdexcept>

namespace records {

static void require_kind(const spacecheck::ValidatedRecord& rec, const char* kind) {
    if (rec.kind() != kind) {
        throw std::invalid_argument("expected a " + std::string(kind) + " record, got " + rec.kind());
    }
}

static std::optional<std::string> optional_text(const spacecheck::ValidatedRecord& rec, const std::string& name) {
    if (!rec.has(name)) return std::nullopt;
    return rec.get_string(name);
}

// the set-membership constraint already guarantees a known tag
template <typename E>
static E known_tag(const std::optional<E>& parsed, const std::string& tag) {
    if (!parsed) throw std::logic_error("unknown tag in validated record: " + tag);
    return *parsed;
}

SpaceStation SpaceStation::from_record(const spacecheck::ValidatedRecord& rec) {
    require_kind(rec, kStationKind);

    SpaceStation s;
    s.station_id = rec.get_string("station_id");
    s.name = rec.get_string("name");
    s.crew_size = rec.get_int("crew_size");
    s.power_level = rec.get_float("power_level");
    s.oxygen_level = rec.get_float("oxygen_level");
    s.last_maintenance = rec.get_timestamp("last_maintenance");
    s.is_operational = rec.get_bool("is_operational");
    s.notes = optional_text(rec, "notes");
    return s;
}

ContactReport ContactReport::from_record(const spacecheck::ValidatedRecord& rec) {
    require_kind(rec, kContactReportKind);

    ContactReport c;
    c.contact_id = rec.get_string("contact_id");
    c.timestamp = rec.get_timestamp("timestamp");
    c.location = rec.get_string("location");

    const std::string& type_tag = rec.get_string("contact_type");
    c.contact_type = known_tag(parse_contact_type(type_tag), type_tag);

    c.signal_strength = rec.get_float("signal_strength");
    c.duration_minutes = rec.get_int("duration_minutes");
    c.witness_count = rec.get_int("witness_count");
    c.message_received = optional_text(rec, "message_received");
    c.is_verified = rec.get_bool("is_verified");
    return c;
}

CrewMember CrewMember::from_record(const spacecheck::ValidatedRecord& rec) {
    require_kind(rec, kCrewMemberKind);

    CrewMember m;
    m.member_id = rec.get_string("member_id");
    m.name = rec.get_string("name");

    const std::string& rank_tag = rec.get_string("rank");
    m.rank = known_tag(parse_rank(rank_tag), rank_tag);

    m.age = rec.get_int("age");
    m.specialization = rec.get_string("specialization");
    m.years_experience = rec.get_int("years_experience");
    m.is_active = rec.get_bool("is_active");
    return m;
}

SpaceMission SpaceMission::from_record(const spacecheck::ValidatedRecord& rec) {
    require_kind(rec, kMissionKind);

    SpaceMission m;
    m.mission_id = rec.get_string("mission_id");
    m.mission_name = rec.get_string("mission_name");
    m.destination = rec.get_string("destination");
    m.launch_date = rec.get_timestamp("launch_date");
    m.duration_days = rec.get_int("duration_days");

    const auto& crew = rec.get_records("crew");
    m.crew.reserve(crew.size());
    for (const auto& member : crew) {
        if (!member) throw std::logic_error("validated mission holds an empty crew entry");
        m.crew.push_back(CrewMember::from_record(*member));
    }

    m.mission_status = rec.get_string("mission_status");
    m.budget_millions = rec.get_float("budget_millions");
    return m;
}

}  // namespace records
