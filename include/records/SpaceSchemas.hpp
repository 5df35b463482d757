#pragma once

#include "spacecheck/Schema.hpp"
#include "spacecheck/SchemaRegistry.hpp"

namespace records {

const char* const kStationKind = "station";
const char* const kContactReportKind = "contact_report";
const char* const kCrewMemberKind = "crew_member";
const char* const kMissionKind = "mission";

spacecheck::SchemaBuilder station_schema();
spacecheck::SchemaBuilder contact_report_schema();
spacecheck::SchemaBuilder crew_member_schema();
spacecheck::SchemaBuilder mission_schema();

// defines all four kinds (crew_member before mission)
void register_space_schemas(spacecheck::SchemaRegistry& registry);

// process-wide registry holding the space schemas, built on first use
const spacecheck::SchemaRegistry& space_registry();

}  // namespace records
