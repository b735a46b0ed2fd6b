#ifndef STOMP_WS_PAYLOAD_H
#define STOMP_WS_PAYLOAD_H

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace StompWs {

/*! \brief Build a JSON object from whitespace-separated `key=value` pairs.
 *
 *  A value with a `.` becomes a double, other values become integers, when
 *  they parse as such in full. Everything else stays a string. Tokens without
 *  a `=` are skipped. A later key overrides an earlier one.
 */
nlohmann::json MakeJsonPayload(
    const std::string& pairs
);

/*! \brief Format a received message for display.
 *
 *  A message that parses as JSON is pretty-printed with a 2-space indent. Any
 *  other message is returned as is. An absent body is returned as an empty
 *  string.
 */
std::string FormatPayload(
    const std::optional<std::string>& message
);

} // namespace StompWs

#endif // STOMP_WS_PAYLOAD_H
