#ifndef STOMP_WS_ENV_H
#define STOMP_WS_ENV_H

#include <optional>
#include <string>

namespace StompWs {

/*! \brief Get an environment variable, or return a default value.
 *
 *  \throws std::runtime_error if the environment variable cannot be found and
 *          there is no default value.
 */
std::string GetEnvVar(
    const std::string& envVar,
    const std::optional<std::string>& defaultValue = std::nullopt
);

/*! \brief Get an optional environment variable. Empty values count as unset.
 */
std::optional<std::string> GetOptionalEnvVar(
    const std::string& envVar
);

/*! \brief Read a boolean flag from the environment.
 *
 *  `1`, `true`, `yes` and `on` (any case) are true; anything else is false.
 *  An unset variable takes the default value.
 */
bool GetEnvFlag(
    const std::string& envVar,
    bool defaultValue = false
);

} // namespace StompWs

#endif // STOMP_WS_ENV_H
