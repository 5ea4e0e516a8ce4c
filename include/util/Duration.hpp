#pragma once
#include <chrono>
#include <string>

namespace devtel::util {

// Parse a duration such as "2s", "500ms", "1m30s" or "1.5h".
// Units: ns, us (or µs), ms, s, m, h. A bare "0" is accepted.
// Returns false on malformed input or a negative result.
bool parse_duration(const std::string& text, std::chrono::nanoseconds& out);

} // namespace devtel::util
