#include "records/SpaceSchemas.hpp"

#include "records/Tags.hpp"

namespace records {

using spacecheck::SchemaBuilder;
using spacecheck::SemanticType;
using spacecheck::collection_size;
using spacecheck::max_length;
using spacecheck::numeric_range;
using spacecheck::set_membership;
using spacecheck::string_length;

SchemaBuilder station_schema() {
    SchemaBuilder b(kStationKind);
    b.field("station_id", SemanticType::String).constrain(string_length(3, 10))
     .field("name", SemanticType::String).constrain(string_length(1, 50))
     .field("crew_size", SemanticType::Integer).constrain(numeric_range(1, 20))
     .field("power_level", SemanticType::Float).constrain(numeric_range(0.0, 100.0))
     .field("oxygen_level", SemanticType::Float).constrain(numeric_range(0.0, 100.0))
     .field("last_maintenance", SemanticType::Timestamp)
     .field("is_operational", SemanticType::Boolean).default_value(true)
     .field("notes", SemanticType::String).optional().constrain(max_length(200));
    return b;
}

SchemaBuilder contact_report_schema() {
    SchemaBuilder b(kContactReportKind);
    b.field("contact_id", SemanticType::String).constrain(string_length(5, 15))
     .field("timestamp", SemanticType::Timestamp)
     .field("location", SemanticType::String).constrain(string_length(3, 100))
     .field("contact_type", SemanticType::EnumTag).constrain(set_membership(contact_type_tags()))
     .field("signal_strength", SemanticType::Float).constrain(numeric_range(0.0, 10.0))
     .field("duration_minutes", SemanticType::Integer).constrain(numeric_range(1, 1440))
     .field("witness_count", SemanticType::Integer).constrain(numeric_range(1, 100))
     .field("message_received", SemanticType::String).optional().constrain(max_length(500))
     .field("is_verified", SemanticType::Boolean).default_value(false);

    b.rule(spacecheck::require_prefix(
        "contact_id_prefix", "contact_id", "AC",
        "contact id must start with 'AC' (alien contact)"));
    b.rule(spacecheck::flag_required_for_tag(
        "physical_contact_verified", "contact_type", to_tag(ContactType::Physical), "is_verified",
        "physical contact reports must be verified"));
    b.rule(spacecheck::minimum_for_tag(
        "telepathic_contact_witnesses", "contact_type", to_tag(ContactType::Telepathic), "witness_count", 3,
        "telepathic contact requires at least 3 witnesses"));
    b.rule(spacecheck::text_required_above(
        "strong_signal_message", "signal_strength", 7.0, "message_received",
        "strong signals (> 7.0) should include a received message"));
    return b;
}

SchemaBuilder crew_member_schema() {
    SchemaBuilder b(kCrewMemberKind);
    b.field("member_id", SemanticType::String).constrain(string_length(3, 10))
     .field("name", SemanticType::String).constrain(string_length(2, 50))
     .field("rank", SemanticType::EnumTag).constrain(set_membership(rank_tags()))
     .field("age", SemanticType::Integer).constrain(numeric_range(18, 80))
     .field("specialization", SemanticType::String).constrain(string_length(3, 30))
     .field("years_experience", SemanticType::Integer).constrain(numeric_range(0, 50))
     .field("is_active", SemanticType::Boolean).default_value(true);
    return b;
}

SchemaBuilder mission_schema() {
    SchemaBuilder b(kMissionKind);
    b.field("mission_id", SemanticType::String).constrain(string_length(5, 15))
     .field("mission_name", SemanticType::String).constrain(string_length(3, 100))
     .field("destination", SemanticType::String).constrain(string_length(3, 50))
     .field("launch_date", SemanticType::Timestamp)
     .field("duration_days", SemanticType::Integer).constrain(numeric_range(1, 3650))
     .collection("crew", kCrewMemberKind).constrain(collection_size(1, 12))
     .field("mission_status", SemanticType::String).default_value("planned")
     .field("budget_millions", SemanticType::Float).constrain(numeric_range(1.0, 10000.0));

    b.rule(spacecheck::require_prefix(
        "mission_id_prefix", "mission_id", "M",
        "mission id must start with 'M'"));
    b.rule(spacecheck::any_element_in_tags(
        "crew_leadership", "crew", "rank", leadership_tags(),
        "mission must have at least one captain or commander"));
    b.rule(spacecheck::experienced_share_above(
        "long_mission_experience", "duration_days", 365, "crew", "years_experience", 5,
        "long missions require at least 50% experienced crew (5+ years)"));
    b.rule(spacecheck::all_elements_flag(
        "crew_active", "crew", "is_active",
        "all crew members must be active"));
    return b;
}

void register_space_schemas(spacecheck::SchemaRegistry& registry) {
    registry.define(station_schema());
    registry.define(contact_report_schema());
    registry.define(crew_member_schema());
    registry.define(mission_schema());
}

const spacecheck::SchemaRegistry& space_registry() {
    static const spacecheck::SchemaRegistry registry = [] {
        spacecheck::SchemaRegistry r;
        register_space_schemas(r);
        return r;
    }();
    return registry;
}

}  // namespace records
