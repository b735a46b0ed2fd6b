#include <stomp-ws/Payload.h>

#include <nlohmann/json.hpp>

#include <charconv>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>

// Convert a string to a number, only if the whole string is consumed.
template <typename T>
static std::optional<T> ToNumber(const std::string& value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    if constexpr (std::is_floating_point_v<T>) {
        // std::from_chars for floating point types is not available on all
        // standard libraries.
        std::istringstream stream {value};
        T number {};
        stream >> number;
        if (stream.fail() || !stream.eof()) {
            return std::nullopt;
        }
        return number;
    } else {
        T number {};
        const auto* end {value.data() + value.size()};
        auto result {std::from_chars(value.data(), end, number)};
        if (result.ec != std::errc {} || result.ptr != end) {
            return std::nullopt;
        }
        return number;
    }
}

nlohmann::json StompWs::MakeJsonPayload(
    const std::string& pairs
)
{
    auto payload {nlohmann::json::object()};
    std::istringstream stream {pairs};
    std::string pair {};
    while (stream >> pair) {
        auto separator {pair.find('=')};
        if (separator == std::string::npos) {
            continue;
        }
        auto key {pair.substr(0, separator)};
        auto value {pair.substr(separator + 1)};
        if (value.find('.') != std::string::npos) {
            auto number {ToNumber<double>(value)};
            if (number) {
                payload[key] = *number;
                continue;
            }
        } else {
            auto number {ToNumber<long long>(value)};
            if (number) {
                payload[key] = *number;
                continue;
            }
        }
        payload[key] = value;
    }
    return payload;
}

std::string StompWs::FormatPayload(
    const std::optional<std::string>& message
)
{
    if (!message) {
        return "";
    }
    auto parsed {nlohmann::json::parse(*message, nullptr, false)};
    if (parsed.is_discarded()) {
        return *message;
    }
    return parsed.dump(2);
}
