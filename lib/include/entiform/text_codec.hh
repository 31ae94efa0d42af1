//
// Text codecs shared by serializers and validators:
// numbers, base64 and ISO-8601 timestamps.
//

#pragma once

#include <entiform/value.hh>
#include <optional>
#include <string>
#include <string_view>

namespace entiform {

/// Shortest round-trippable text for a double ("1.5", "499", "1e+300")
std::string format_number(double d);

/// Parse a complete numeric literal. Integral text yields an integer value,
/// anything else that parses fully yields a number. Surrounding whitespace
/// is not accepted.
std::optional<value> parse_number(std::string_view text);

std::string base64_encode(const binary& bytes);

/// Standard alphabet with padding; nullopt on malformed input
std::optional<binary> base64_decode(std::string_view text);

/// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601(date_time when);

/// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" with an optional
/// "Z" or "+HH:MM"/"-HH:MM" offset. A space may replace the 'T'.
std::optional<date_time> parse_iso8601(std::string_view text);

} // namespace entiform
