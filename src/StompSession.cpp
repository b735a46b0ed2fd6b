#include <stomp-ws/StompSession.h>

#include <boost/bimap.hpp>

#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>

using StompWs::SessionState;
using StompWs::StompClientError;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// SessionState

static const auto gSessionStateStrings {
    MakeBimap<SessionState, std::string_view>({
        {SessionState::kDisconnected, "Disconnected"},
        {SessionState::kConnecting  , "Connecting"  },
        {SessionState::kActive      , "Active"      },
        {SessionState::kClosed      , "Closed"      },
        {SessionState::kFailed      , "Failed"      },
    })
};

std::ostream& StompWs::operator<<(
    std::ostream& os,
    const SessionState& state
)
{
    auto stateIt {gSessionStateStrings.left.find(state)};
    if (stateIt == gSessionStateStrings.left.end()) {
        os << "SessionState::kInvalid";
    } else {
        os << stateIt->second;
    }
    return os;
}

std::string StompWs::ToString(const SessionState& state)
{
    auto stateIt {gSessionStateStrings.left.find(state)};
    if (stateIt == gSessionStateStrings.left.end()) {
        return "SessionState::kInvalid";
    }
    return std::string(stateIt->second);
}

// StompClientError

static const auto gStompClientErrorStrings {
    MakeBimap<StompClientError, std::string_view>({
        {StompClientError::kOk                              , "Ok"                              },
        {StompClientError::kUndefinedError                  , "UndefinedError"                  },
        {StompClientError::kBrokerError                     , "BrokerError"                     },
        {StompClientError::kConnectionLost                  , "ConnectionLost"                  },
        {StompClientError::kConnectTimeout                  , "ConnectTimeout"                  },
        {StompClientError::kCouldNotCloseWebsocketConnection, "CouldNotCloseWebsocketConnection"},
        {StompClientError::kCouldNotConnectToWebsocketServer, "CouldNotConnectToWebsocketServer"},
        {StompClientError::kCouldNotParseMessageAsStompFrame, "CouldNotParseMessageAsStompFrame"},
        {StompClientError::kNotConnected                    , "NotConnected"                    },
        {StompClientError::kSessionAlreadyOpened            , "SessionAlreadyOpened"            },
        {StompClientError::kUnknownSubscription             , "UnknownSubscription"             },
        {StompClientError::kUnroutedMessage                 , "UnroutedMessage"                 },
    })
};

std::ostream& StompWs::operator<<(
    std::ostream& os,
    const StompClientError& error
)
{
    auto errorIt {gStompClientErrorStrings.left.find(error)};
    if (errorIt == gStompClientErrorStrings.left.end()) {
        os << gStompClientErrorStrings.left.at(
            StompClientError::kUndefinedError
        );
    } else {
        os << errorIt->second;
    }
    return os;
}

std::string StompWs::ToString(const StompClientError& error)
{
    static const auto undefinedError {std::string(
        gStompClientErrorStrings.left.at(StompClientError::kUndefinedError)
    )};
    auto errorIt {gStompClientErrorStrings.left.find(error)};
    if (errorIt == gStompClientErrorStrings.left.end()) {
        return undefinedError;
    }
    return std::string(errorIt->second);
}
