#ifndef UUID_UTILITY_H
#define UUID_UTILITY_H

#include <uuid.h>

#include <optional>
#include <string>

/// Generate a random (version 4) UUID
uuids::uuid generateRandomUuid();

/// Parse a UUID from its canonical string form. Returns nullopt on malformed input.
std::optional<uuids::uuid> parseUuid( const std::string& uuidString );

#include <spdlog/fmt/ostr.h>
#if FMT_VERSION >= 90000
template<>
struct fmt::formatter<uuids::uuid> : ostream_formatter
{
};
#endif

#endif // UUID_UTILITY_H
