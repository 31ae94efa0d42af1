//
// Text codecs: numbers, base64, ISO-8601
//

#include <entiform/text_codec.hh>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace entiform {

namespace {
    constexpr char BASE64_ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    int base64_index(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

    // Howard Hinnant's days_from_civil / civil_from_days
    std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const auto yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const auto doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        y = static_cast<std::int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y += m <= 2 ? 1 : 0;
    }

    int days_in_month(int year, int month) {
        static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)) {
            return 29;
        }
        return DAYS[month - 1];
    }

    bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
        if (pos + count > text.size()) {
            return false;
        }
        int result = 0;
        for (std::size_t i = 0; i < count; ++i) {
            char c = text[pos + i];
            if (c < '0' || c > '9') {
                return false;
            }
            result = result * 10 + (c - '0');
        }
        out = result;
        pos += count;
        return true;
    }

    bool expect(std::string_view text, std::size_t& pos, char c) {
        if (pos < text.size() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }
}

// ============================================================================
// Numbers
// ============================================================================

std::string format_number(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";

    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), d);
    if (ec != std::errc()) {
        return std::to_string(d);
    }
    return std::string(buffer.data(), ptr);
}

std::optional<value> parse_number(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last) return std::nullopt;
    }

    std::int64_t integer = 0;
    auto [iptr, iec] = std::from_chars(first, last, integer);
    if (iec == std::errc() && iptr == last) {
        return value(integer);
    }

    double number = 0;
    auto [dptr, dec] = std::from_chars(first, last, number);
    if (dec == std::errc() && dptr == last && std::isfinite(number)) {
        return value(number);
    }

    return std::nullopt;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const binary& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += BASE64_ALPHABET[(n >> 6) & 63];
        out += BASE64_ALPHABET[n & 63];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        std::uint32_t n = bytes[i] << 16;
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += BASE64_ALPHABET[(n >> 18) & 63];
        out += BASE64_ALPHABET[(n >> 12) & 63];
        out += BASE64_ALPHABET[(n >> 6) & 63];
        out += '=';
    }

    return out;
}

std::optional<binary> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    binary out;
    out.reserve(text.size() / 4 * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        int idx[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the final group, and only in the last two places
                if (i + 4 != text.size() || k < 2) {
                    return std::nullopt;
                }
                ++padding;
                idx[k] = 0;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            idx[k] = base64_index(c);
            if (idx[k] < 0) {
                return std::nullopt;
            }
        }

        std::uint32_t n = (idx[0] << 18) | (idx[1] << 12) | (idx[2] << 6) | idx[3];
        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }

    return out;
}

// ============================================================================
// ISO-8601
// ============================================================================

std::string format_iso8601(date_time when) {
    constexpr std::int64_t MS_PER_DAY = 86'400'000;

    std::int64_t days = when.millis / MS_PER_DAY;
    std::int64_t rem = when.millis % MS_PER_DAY;
    if (rem < 0) {
        rem += MS_PER_DAY;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const auto hours = static_cast<int>(rem / 3'600'000);
    const auto minutes = static_cast<int>(rem / 60'000 % 60);
    const auto seconds = static_cast<int>(rem / 1000 % 60);
    const auto millis = static_cast<int>(rem % 1000);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hours, minutes, seconds, millis);
    return buffer;
}

std::optional<date_time> parse_iso8601(std::string_view text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0, millis = 0;
    std::int64_t offset_minutes = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') {
            return std::nullopt;
        }
        ++pos;

        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(text, pos, ':')) {
            if (!read_digits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (expect(text, pos, '.')) {
                // Fractional seconds: keep milliseconds, ignore finer digits
                int digits = 0;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                    if (digits < 3) {
                        millis = millis * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (int k = digits; k < 3; ++k) {
                    millis *= 10;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        if (expect(text, pos, 'Z')) {
            // UTC
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos, 2, off_h)) {
                return std::nullopt;
            }
            expect(text, pos, ':');
            if (!read_digits(text, pos, 2, off_m)) {
                return std::nullopt;
            }
            offset_minutes = sign * (off_h * 60 + off_m);
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    std::int64_t ms = days * 86'400'000
        + static_cast<std::int64_t>(hour) * 3'600'000
        + static_cast<std::int64_t>(minute) * 60'000
        + static_cast<std::int64_t>(second) * 1000
        + millis;
    ms -= offset_minutes * 60'000;

    return date_time{ms};
}

} // namespace entiform
