#include <stomp-ws/StompFrame.h>

#include <boost/bimap.hpp>

#include <charconv>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

using StompWs::StompCommand;
using StompWs::StompError;
using StompWs::StompFrame;
using StompWs::StompHeader;
using StompWs::StompHeaders;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// Utility function to convert a std::string_view to a number.
// Returns false if the conversion failed or did not consume the whole string.
static bool StoI(const std::string_view string, size_t& result)
{
    auto conversionResult {std::from_chars(
        string.data(),
        string.data() + string.size(),
        result
    )};
    return conversionResult.ec == std::errc {} &&
           conversionResult.ptr == string.data() + string.size();
}

static std::string_view Trim(std::string_view string)
{
    static const std::string_view whitespace {" \t\r\n\f\v"};
    auto start {string.find_first_not_of(whitespace)};
    if (start == std::string_view::npos) {
        return {};
    }
    auto end {string.find_last_not_of(whitespace)};
    return string.substr(start, end - start + 1);
}

// StompCommand

static const auto gStompCommandStrings {
    MakeBimap<StompCommand, std::string_view>({
        {StompCommand::kAck        , "ACK"        },
        {StompCommand::kConnect    , "CONNECT"    },
        {StompCommand::kConnected  , "CONNECTED"  },
        {StompCommand::kDisconnect , "DISCONNECT" },
        {StompCommand::kError      , "ERROR"      },
        {StompCommand::kMessage    , "MESSAGE"    },
        {StompCommand::kSend       , "SEND"       },
        {StompCommand::kStomp      , "STOMP"      },
        {StompCommand::kSubscribe  , "SUBSCRIBE"  },
        {StompCommand::kUnsubscribe, "UNSUBSCRIBE"},
    })
};

std::ostream& StompWs::operator<<(
    std::ostream& os,
    const StompCommand& command
)
{
    auto commandIt {gStompCommandStrings.left.find(command)};
    if (commandIt == gStompCommandStrings.left.end()) {
        os << "StompCommand::kInvalid";
    } else {
        os << commandIt->second;
    }
    return os;
}

std::string StompWs::ToString(const StompCommand& command)
{
    auto commandIt {gStompCommandStrings.left.find(command)};
    if (commandIt == gStompCommandStrings.left.end()) {
        return "StompCommand::kInvalid";
    }
    return std::string(commandIt->second);
}

StompCommand StompWs::ToStompCommand(std::string_view command)
{
    auto commandIt {gStompCommandStrings.right.find(command)};
    if (commandIt == gStompCommandStrings.right.end()) {
        return StompCommand::kInvalid;
    }
    return commandIt->second;
}

// StompHeader

static const auto gStompHeaderStrings {
    MakeBimap<StompHeader, std::string_view>({
        {StompHeader::kAcceptVersion, "accept-version"},
        {StompHeader::kAck          , "ack"           },
        {StompHeader::kContentLength, "content-length"},
        {StompHeader::kDestination  , "destination"   },
        {StompHeader::kHeartBeat    , "heart-beat"    },
        {StompHeader::kHost         , "host"          },
        {StompHeader::kId           , "id"            },
        {StompHeader::kLogin        , "login"         },
        {StompHeader::kMessage      , "message"       },
        {StompHeader::kMessageId    , "message-id"    },
        {StompHeader::kPasscode     , "passcode"      },
        {StompHeader::kSubscription , "subscription"  },
        {StompHeader::kVersion      , "version"       },
    })
};

std::ostream& StompWs::operator<<(
    std::ostream& os,
    const StompHeader& header
)
{
    auto headerIt {gStompHeaderStrings.left.find(header)};
    if (headerIt == gStompHeaderStrings.left.end()) {
        os << "StompHeader::kInvalid";
    } else {
        os << headerIt->second;
    }
    return os;
}

std::string StompWs::ToString(const StompHeader& header)
{
    auto headerIt {gStompHeaderStrings.left.find(header)};
    if (headerIt == gStompHeaderStrings.left.end()) {
        return "StompHeader::kInvalid";
    }
    return std::string(headerIt->second);
}

// StompError

static const auto gStompErrorStrings {
    MakeBimap<StompError, std::string_view>({
        {StompError::kOk                  , "Ok"                  },
        {StompError::kUndefinedError      , "UndefinedError"      },
        {StompError::kParsingEmptyCommand , "ParsingEmptyCommand" },
        {StompError::kParsingEmptyFrame   , "ParsingEmptyFrame"   },
    })
};

std::ostream& StompWs::operator<<(
    std::ostream& os,
    const StompError& error
)
{
    static const auto undefinedError {
        gStompErrorStrings.left.at(StompError::kUndefinedError)
    };
    auto errorIt {gStompErrorStrings.left.find(error)};
    if (errorIt == gStompErrorStrings.left.end()) {
        os << undefinedError;
    } else {
        os << errorIt->second;
    }
    return os;
}

std::string StompWs::ToString(const StompError& error)
{
    static const auto undefinedError {std::string(
        gStompErrorStrings.left.at(StompError::kUndefinedError)
    )};
    auto errorIt {gStompErrorStrings.left.find(error)};
    if (errorIt == gStompErrorStrings.left.end()) {
        return undefinedError;
    }
    return std::string(errorIt->second);
}

// Free functions

std::string StompWs::EncodeFrame(
    const std::string& command,
    const StompHeaders& headers,
    const std::optional<std::string>& body
)
{
    std::string plain {command};
    plain += '\n';
    for (const auto& [header, value]: headers) {
        plain += header;
        plain += ':';
        plain += value;
        plain += '\n';
    }
    plain += '\n';
    if (body) {
        plain += *body;
    }
    plain += '\0';
    return plain;
}

StompFrame StompWs::DecodeFrame(
    StompError& ec,
    std::string_view plain
)
{
    return StompFrame {ec, plain};
}

bool StompWs::IsHeartbeat(std::string_view plain)
{
    return !plain.empty() &&
           plain.find_first_not_of("\r\n") == std::string_view::npos;
}

// StompFrame: Public methods

StompFrame::StompFrame() = default;

StompFrame::StompFrame(
    StompError& ec,
    std::string_view plain
)
{
    ec = ParseFrame(plain);
}

StompFrame::StompFrame(
    const std::string& command,
    StompHeaders headers,
    std::optional<std::string> body
) : command_ {command},
    headers_ {std::move(headers)},
    body_ {std::move(body)}
{
}

StompFrame::StompFrame(
    const StompCommand& command,
    std::initializer_list<std::pair<StompHeader, std::string>> headers,
    std::optional<std::string> body
) : command_ {StompWs::ToString(command)},
    body_ {std::move(body)}
{
    headers_.reserve(headers.size());
    for (const auto& [header, value]: headers) {
        headers_.emplace_back(StompWs::ToString(header), value);
    }
}

StompFrame StompFrame::MakeHeartbeat()
{
    StompFrame frame {};
    frame.heartbeat_ = true;
    return frame;
}

bool StompFrame::IsHeartbeat() const
{
    return heartbeat_;
}

StompCommand StompFrame::GetCommand() const
{
    if (heartbeat_) {
        return StompCommand::kInvalid;
    }
    return ToStompCommand(command_);
}

const std::string& StompFrame::GetCommandString() const
{
    return command_;
}

bool StompFrame::HasHeader(std::string_view header) const
{
    for (const auto& entry: headers_) {
        if (entry.first == header) {
            return true;
        }
    }
    return false;
}

bool StompFrame::HasHeader(const StompHeader& header) const
{
    return HasHeader(StompWs::ToString(header));
}

const std::string& StompFrame::GetHeaderValue(std::string_view header) const
{
    static const std::string emptyHeaderValue {""};
    for (const auto& entry: headers_) {
        if (entry.first == header) {
            return entry.second;
        }
    }
    return emptyHeaderValue;
}

const std::string& StompFrame::GetHeaderValue(const StompHeader& header) const
{
    return GetHeaderValue(StompWs::ToString(header));
}

const StompHeaders& StompFrame::GetHeaders() const
{
    return headers_;
}

const std::optional<std::string>& StompFrame::GetBody() const
{
    return body_;
}

std::string StompFrame::ToString() const
{
    if (heartbeat_) {
        return "\n";
    }
    return EncodeFrame(command_, headers_, body_);
}

// StompFrame: Private methods

StompError StompFrame::ParseFrame(std::string_view plain)
{
    // Frame delimiters
    static const char null {'\0'};
    static const char colon {':'};
    static const char newLine {'\n'};
    static const char carriageReturn {'\r'};

    if (plain.empty()) {
        return StompError::kParsingEmptyFrame;
    }

    if (StompWs::IsHeartbeat(plain)) {
        heartbeat_ = true;
        return StompError::kOk;
    }

    // End-of-line octets before a command are heartbeats too.
    size_t commandStart {plain.find_first_not_of("\r\n")};

    // Command
    size_t commandEnd {plain.find(newLine, commandStart)};
    if (commandEnd == std::string_view::npos) {
        commandEnd = plain.size();
    }
    auto commandLine {plain.substr(commandStart, commandEnd - commandStart)};
    commandLine = commandLine.substr(0, commandLine.find(null));
    auto command {Trim(commandLine)};
    if (command.empty()) {
        return StompError::kParsingEmptyCommand;
    }

    // Headers
    // Lines without a colon are dropped. A NULL octet before the blank line
    // ends the frame without a body.
    StompHeaders headers {};
    size_t lineStart {commandEnd + 1};
    bool hasBlankLine {false};
    while (lineStart < plain.size()) {
        size_t lineEnd {plain.find(newLine, lineStart)};
        if (lineEnd == std::string_view::npos) {
            lineEnd = plain.size();
        }
        auto line {plain.substr(lineStart, lineEnd - lineStart)};
        lineStart = lineEnd + 1;
        if (!line.empty() && line.back() == carriageReturn) {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            hasBlankLine = true;
            break;
        }
        if (line.find(null) != std::string_view::npos) {
            break;
        }
        size_t headerEnd {line.find(colon)};
        if (headerEnd == std::string_view::npos) {
            continue;
        }
        headers.emplace_back(
            std::string(line.substr(0, headerEnd)),
            std::string(line.substr(headerEnd + 1))
        );
    }

    // Body
    std::optional<std::string> body {};
    if (hasBlankLine) {
        auto rest {lineStart < plain.size() ? plain.substr(lineStart) :
                                              std::string_view {}};
        const std::string contentLengthKey {
            StompWs::ToString(StompHeader::kContentLength)
        };
        bool hasContentLength {false};
        size_t contentLength {0};
        for (const auto& [header, value]: headers) {
            if (header == contentLengthKey) {
                hasContentLength = true;
                if (!StoI(value, contentLength)) {
                    contentLength = rest.size() + 1;
                }
                break;
            }
        }
        if (hasContentLength && contentLength <= rest.size()) {
            // The body may contain NULL octets.
            body = std::string(rest.substr(0, contentLength));
        } else {
            auto text {rest.substr(0, rest.find(null))};
            if (!text.empty() || hasContentLength) {
                body = std::string(text);
            }
        }
    }

    command_ = std::string(command);
    headers_ = std::move(headers);
    body_ = std::move(body);
    return StompError::kOk;
}
