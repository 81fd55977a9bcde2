/**
 * Timestamp parsing and formatting
 */

#include "timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace lyricvid {
namespace subtitles {

namespace {

struct TimestampFields {
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
    int64_t millis = 0;
};

// Longest run of digits we accept before ignoring the rest of a component
constexpr size_t kMaxComponentDigits = 12;

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == ':' || c == ',' || c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

// Leading decimal digits of a component; anything unparsable is 0
int64_t component_value(const std::string& part) {
    size_t i = 0;
    while (i < part.size() && std::isspace(static_cast<unsigned char>(part[i]))) i++;

    int64_t value = 0;
    size_t digits = 0;
    while (i < part.size() && std::isdigit(static_cast<unsigned char>(part[i]))) {
        if (digits < kMaxComponentDigits) {
            value = value * 10 + (part[i] - '0');
        }
        digits++;
        i++;
    }
    return value;
}

bool resolve_fields(const std::string& raw, TimestampFields& out) {
    std::vector<std::string> parts = split_components(trim(raw));

    out = TimestampFields();
    if (parts.size() == 4) {
        out.hours = component_value(parts[0]);
        out.minutes = component_value(parts[1]);
        out.seconds = component_value(parts[2]);
        out.millis = component_value(parts[3]);
    } else if (parts.size() == 3) {
        int64_t p1 = component_value(parts[0]);
        int64_t p2 = component_value(parts[1]);
        int64_t p3 = component_value(parts[2]);

        if (p3 > 59 || parts[2].size() == 3) {
            out.minutes = p1;
            out.seconds = p2;
            out.millis = p3;
        } else {
            out.hours = p1;
            out.minutes = p2;
            out.seconds = p3;
        }
    } else if (parts.size() == 2) {
        out.minutes = component_value(parts[0]);
        out.seconds = component_value(parts[1]);
    } else {
        return false;
    }
    return true;
}

} // namespace

bool parse_timestamp_ms(const std::string& raw, int64_t& out_ms) {
    TimestampFields fields;
    if (!resolve_fields(raw, fields)) {
        return false;
    }
    out_ms = fields.hours * 3600000 + fields.minutes * 60000 + fields.seconds * 1000 + fields.millis;
    return true;
}

bool parse_timestamp(const std::string& raw, double& out_seconds) {
    int64_t ms = 0;
    if (!parse_timestamp_ms(raw, ms)) {
        return false;
    }
    out_seconds = static_cast<double>(ms) / 1000.0;
    return true;
}

std::string canonicalize_timestamp(const std::string& raw) {
    int64_t ms = 0;
    if (!parse_timestamp_ms(raw, ms)) {
        fprintf(stderr, "[Subtitles] Could not parse time: %s\n", raw.c_str());
        return trim(raw);
    }
    return format_timestamp(ms);
}

std::string format_timestamp(int64_t ms) {
    if (ms < 0) ms = 0;
    char buffer[48];
    snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld,%03lld",
             static_cast<long long>(ms / 3600000),
             static_cast<long long>((ms / 60000) % 60),
             static_cast<long long>((ms / 1000) % 60),
             static_cast<long long>(ms % 1000));
    return buffer;
}

std::string to_encoder_clock(const std::string& hhmmss, const std::string& millis) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : hhmmss) {
        if (c == ':') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    while (parts.size() < 3) {
        parts.insert(parts.begin(), "00");
    }

    // Centiseconds are the first two millisecond digits
    std::string centis = millis.substr(0, 2);
    while (centis.size() < 2) centis += '0';

    return std::to_string(component_value(parts[0])) + ":" + parts[1] + ":" + parts[2] + "." + centis;
}

std::string format_encoder_clock(int64_t ms) {
    std::string canonical = format_timestamp(ms);
    size_t comma = canonical.find(',');
    return to_encoder_clock(canonical.substr(0, comma), canonical.substr(comma + 1));
}

} // namespace subtitles
} // namespace lyricvid
