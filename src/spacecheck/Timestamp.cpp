#include "spacecheck/Timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace spacecheck {

static bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return days[m - 1];
}

// reads exactly n digits at pos, advancing pos
static bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    Timestamp ts;
    size_t pos = 0;

    if (!read_digits(text, pos, 4, ts.year)) return std::nullopt;
    if (!expect(text, pos, '-')) return std::nullopt;
    if (!read_digits(text, pos, 2, ts.month)) return std::nullopt;
    if (!expect(text, pos, '-')) return std::nullopt;
    if (!read_digits(text, pos, 2, ts.day)) return std::nullopt;

    if (ts.month < 1 || ts.month > 12) return std::nullopt;
    if (ts.day < 1 || ts.day > days_in_month(ts.year, ts.month)) return std::nullopt;

    if (pos == text.size()) return ts;

    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') return std::nullopt;
    ++pos;

    if (!read_digits(text, pos, 2, ts.hour)) return std::nullopt;
    if (!expect(text, pos, ':')) return std::nullopt;
    if (!read_digits(text, pos, 2, ts.minute)) return std::nullopt;

    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        if (!read_digits(text, pos, 2, ts.second)) return std::nullopt;

        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            ++pos;
            size_t n = 0;
            int frac = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (n == 6) return std::nullopt;
                frac = frac * 10 + (text[pos] - '0');
                ++pos;
                ++n;
            }
            if (n == 0) return std::nullopt;
            for (; n < 6; ++n) frac *= 10;
            ts.microsecond = frac;
        }
    }

    if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) return std::nullopt;

    if (pos == text.size()) return ts;

    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
        ts.utc_offset_minutes = 0;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const int sign = (text[pos] == '-') ? -1 : 1;
        ++pos;
        int oh = 0;
        int om = 0;
        if (!read_digits(text, pos, 2, oh)) return std::nullopt;
        if (!expect(text, pos, ':')) return std::nullopt;
        if (!read_digits(text, pos, 2, om)) return std::nullopt;
        if (oh > 23 || om > 59) return std::nullopt;
        ts.utc_offset_minutes = sign * (oh * 60 + om);
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) return std::nullopt;
    return ts;
}

std::string Timestamp::to_iso() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  year, month, day, hour, minute, second);
    std::string out = buf;

    if (microsecond != 0) {
        std::snprintf(buf, sizeof(buf), ".%06d", microsecond);
        out += buf;
    }

    if (utc_offset_minutes) {
        const int off = *utc_offset_minutes;
        if (off == 0) {
            out += "Z";
        } else {
            const int a = std::abs(off);
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d", off < 0 ? '-' : '+', a / 60, a % 60);
            out += buf;
        }
    }
    return out;
}

bool operator==(const Timestamp& a, const Timestamp& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day &&
           a.hour == b.hour && a.minute == b.minute && a.second == b.second &&
           a.microsecond == b.microsecond && a.utc_offset_minutes == b.utc_offset_minutes;
}

bool operator!=(const Timestamp& a, const Timestamp& b) {
    return !(a == b);
}

}  // namespace spacecheck
