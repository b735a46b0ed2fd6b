#ifndef STOMP_WS_STOMP_FRAME_H
#define STOMP_WS_STOMP_FRAME_H

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace StompWs {

/*! \brief STOMP commands known to the client.
 *
 *  Frames may carry any command string; commands not listed here decode to
 *  `kInvalid` and are ignored by the session.
 */
enum class StompCommand {
    kInvalid,
    kAck,
    kConnect,
    kConnected,
    kDisconnect,
    kError,
    kMessage,
    kSend,
    kStomp,
    kSubscribe,
    kUnsubscribe,
};

/*! \brief Print operator for the `StompCommand` class.
 */
std::ostream& operator<<(std::ostream& os, const StompCommand& command);

/*! \brief Convert `StompCommand` to string.
 */
std::string ToString(const StompCommand& command);

/*! \brief Convert a command line to `StompCommand`.
 *
 *  \returns `StompCommand::kInvalid` for commands we do not know.
 */
StompCommand ToStompCommand(std::string_view command);

/*! \brief STOMP headers used by the client.
 */
enum class StompHeader {
    kInvalid,
    kAcceptVersion,
    kAck,
    kContentLength,
    kDestination,
    kHeartBeat,
    kHost,
    kId,
    kLogin,
    kMessage,
    kMessageId,
    kPasscode,
    kSubscription,
    kVersion,
};

/*! \brief Print operator for the `StompHeader` class.
 */
std::ostream& operator<<(std::ostream& os, const StompHeader& header);

/*! \brief Convert `StompHeader` to string.
 */
std::string ToString(const StompHeader& header);

/*! \brief Error codes for the STOMP frame codec.
 *
 *  Decoding is tolerant: header lines without a colon are dropped and a
 *  missing NULL octet is not an error. Only a frame without a command line
 *  is rejected.
 */
enum class StompError {
    kOk = 0,
    kUndefinedError,
    kParsingEmptyCommand,
    kParsingEmptyFrame,
};

/*! \brief Print operator for the `StompError` class.
 */
std::ostream& operator<<(std::ostream& os, const StompError& error);

/*! \brief Convert `StompError` to string.
 */
std::string ToString(const StompError& error);

/*! \brief Ordered list of STOMP headers.
 *
 *  Headers are written on the wire in insertion order. Repeated keys are
 *  allowed; lookups return the first occurrence.
 */
using StompHeaders = std::vector<std::pair<std::string, std::string>>;

/*! \brief STOMP frame representation.
 *
 *  A frame is either a command frame (command, headers, optional body) or the
 *  heartbeat, which has no command and is a single line feed on the wire.
 */
class StompFrame {
public:
    /*! \brief Default constructor. Corresponds to an empty, invalid STOMP
     *         frame.
     */
    StompFrame();

    /*! \brief Decode a STOMP frame from the text of one transport message.
     *
     *  The result of the operation is stored in the error code.
     */
    StompFrame(
        StompError& ec,
        std::string_view plain
    );

    /*! \brief Construct a STOMP frame from its individual components.
     */
    StompFrame(
        const std::string& command,
        StompHeaders headers = {},
        std::optional<std::string> body = std::nullopt
    );

    /*! \brief Construct a STOMP frame from a known command and headers.
     */
    StompFrame(
        const StompCommand& command,
        std::initializer_list<std::pair<StompHeader, std::string>> headers,
        std::optional<std::string> body = std::nullopt
    );

    /*! \brief Make the heartbeat frame.
     */
    static StompFrame MakeHeartbeat();

    /*! \brief Check if this frame is the heartbeat.
     */
    bool IsHeartbeat() const;

    /*! \brief Get the STOMP command.
     *
     *  \returns `StompCommand::kInvalid` for the heartbeat and for commands
     *           the client does not know.
     */
    StompCommand GetCommand() const;

    /*! \brief Get the command line as received or constructed.
     */
    const std::string& GetCommandString() const;

    /*! \brief Check if the frame has a specified header.
     */
    bool HasHeader(std::string_view header) const;
    bool HasHeader(const StompHeader& header) const;

    /*! \brief Get the value for the specified header.
     *
     *  \returns An empty string if the header is not in the frame.
     */
    const std::string& GetHeaderValue(std::string_view header) const;
    const std::string& GetHeaderValue(const StompHeader& header) const;

    /*! \brief Get all headers, in wire order.
     */
    const StompHeaders& GetHeaders() const;

    /*! \brief Get the frame body.
     *
     *  An absent body is different from an empty one.
     */
    const std::optional<std::string>& GetBody() const;

    /*! \brief Dump the frame to its wire format.
     */
    std::string ToString() const;

private:
    bool heartbeat_ {false};
    std::string command_ {};
    StompHeaders headers_ {};
    std::optional<std::string> body_ {};

    StompError ParseFrame(std::string_view plain);
};

/*! \brief Encode a STOMP frame.
 *
 *  Writes the command line, one `key:value` line per header, a blank line, the
 *  body if any and the terminating NULL octet. The content is not validated.
 */
std::string EncodeFrame(
    const std::string& command,
    const StompHeaders& headers,
    const std::optional<std::string>& body = std::nullopt
);

/*! \brief Decode one STOMP frame or heartbeat from a transport message.
 */
StompFrame DecodeFrame(
    StompError& ec,
    std::string_view plain
);

/*! \brief Check if a transport message is a heartbeat, i.e. it only contains
 *         end-of-line characters.
 */
bool IsHeartbeat(std::string_view plain);

} // namespace StompWs

#endif // STOMP_WS_STOMP_FRAME_H
