#include <stomp-ws/env.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

std::string StompWs::GetEnvVar(
    const std::string& envVar,
    const std::optional<std::string>& defaultValue
)
{
    const char* value {std::getenv(envVar.c_str())};
    if (value == nullptr && defaultValue == std::nullopt) {
        throw std::runtime_error("Could not find environment variable: " +
                                 envVar);
    }
    return value != nullptr ? value : *defaultValue;
}

std::optional<std::string> StompWs::GetOptionalEnvVar(
    const std::string& envVar
)
{
    const char* value {std::getenv(envVar.c_str())};
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

bool StompWs::GetEnvFlag(
    const std::string& envVar,
    bool defaultValue
)
{
    auto value {GetOptionalEnvVar(envVar)};
    if (!value) {
        return defaultValue;
    }
    std::transform(value->begin(), value->end(), value->begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return *value == "1" || *value == "true" || *value == "yes" ||
           *value == "on";
}
