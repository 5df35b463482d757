#pragma once

#include <string>

#include <nlohmann/json.hpp>

// Raw inputs that pass every field constraint and business rule.
namespace fixtures {

inline nlohmann::json valid_station() {
    return {
        {"station_id", "ISS001"},
        {"name", "International Space Station"},
        {"crew_size", 6},
        {"power_level", 85.5},
        {"oxygen_level", 92.3},
        {"last_maintenance", "2024-02-01T10:30:00"},
        {"is_operational", true},
        {"notes", "All systems nominal."}
    };
}

inline nlohmann::json valid_contact() {
    return {
        {"contact_id", "AC_2024_001"},
        {"timestamp", "2024-06-01T14:30:00"},
        {"location", "Area 51, Nevada"},
        {"contact_type", "radio"},
        {"signal_strength", 8.5},
        {"duration_minutes", 45},
        {"witness_count", 5},
        {"message_received", "Greetings from Zeta Reticuli"},
        {"is_verified", false}
    };
}

inline nlohmann::json crew_member(const std::string& id, const std::string& rank, int years, bool active = true) {
    return {
        {"member_id", id},
        {"name", "Crew " + id},
        {"rank", rank},
        {"age", 35},
        {"specialization", "engineering"},
        {"years_experience", years},
        {"is_active", active}
    };
}

inline nlohmann::json valid_mission() {
    return {
        {"mission_id", "M2026_OK"},
        {"mission_name", "Mars Exploration Mission"},
        {"destination", "Mars"},
        {"launch_date", "2026-03-15T09:00:00Z"},
        {"duration_days", 900},
        {"crew", nlohmann::json::array({
            crew_member("C03", "commander", 20),
            crew_member("C04", "officer", 29)
        })},
        {"budget_millions", 2500.0}
    };
}

}  // namespace fixtures
