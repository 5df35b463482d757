#pragma once

#include <optional>
#include <string>

namespace spacecheck {

struct Timestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    // minutes east of UTC; empty for naive timestamps
    std::optional<int> utc_offset_minutes;

    // canonical form: YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+HH:MM]
    std::string to_iso() const;
};

bool operator==(const Timestamp& a, const Timestamp& b);
bool operator!=(const Timestamp& a, const Timestamp& b);

// Accepts YYYY-MM-DD, optionally followed by 'T' or ' ' and HH:MM[:SS[.f{1,6}]],
// optionally followed by 'Z' or +HH:MM / -HH:MM. Empty on anything else,
// including dates that do not exist on the calendar.
std::optional<Timestamp> parse_iso8601(const std::string& text);

}  // namespace spacecheck
