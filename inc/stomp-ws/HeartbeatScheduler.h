#ifndef STOMP_WS_HEARTBEAT_SCHEDULER_H
#define STOMP_WS_HEARTBEAT_SCHEDULER_H

#include <stomp-ws/StompSession.h>

#include <boost/asio.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>

namespace StompWs {

/*! \brief Send a heartbeat on a STOMP session at a fixed interval.
 *
 *  The scheduler ticks whether or not the session is Active; a tick on a
 *  session that is not Active does nothing. A failed heartbeat is logged and
 *  does not stop the schedule.
 *
 *  \tparam Session Session class. This type must have the same interface of
 *                  StompSession.
 */
template <typename Session>
class HeartbeatScheduler {
public:
    /*! \brief Construct a heartbeat scheduler.
     *
     *  \note This constructor does not start the timer.
     *
     *  \param session  The session to send heartbeats on. It must outlive the
     *                  scheduler.
     *  \param ioc      The io_context object. The user takes care of calling
     *                  ioc.run().
     *  \param interval Time between two heartbeats.
     */
    HeartbeatScheduler(
        Session& session,
        boost::asio::io_context& ioc,
        std::chrono::milliseconds interval = std::chrono::seconds(10)
    ) : session_ {session},
        interval_ {interval},
        timer_ {boost::asio::make_strand(ioc)}
    {
    }

    /*! \brief The copy constructor is deleted.
     */
    HeartbeatScheduler(const HeartbeatScheduler& other) = delete;

    /*! \brief The copy assignment operator is deleted.
     */
    HeartbeatScheduler& operator=(const HeartbeatScheduler& other) = delete;

    /*! \brief Start ticking. Calling Start twice has no effect.
     */
    void Start()
    {
        boost::asio::post(
            timer_.get_executor(),
            [this]() {
                if (running_) {
                    return;
                }
                spdlog::info("HeartbeatScheduler: Starting (interval: {} ms)",
                             interval_.count());
                running_ = true;
                ScheduleNextTick();
            }
        );
    }

    /*! \brief Stop ticking.
     */
    void Stop()
    {
        boost::asio::post(
            timer_.get_executor(),
            [this]() {
                if (!running_) {
                    return;
                }
                spdlog::info("HeartbeatScheduler: Stopping");
                running_ = false;
                timer_.cancel();
            }
        );
    }

    /*! \brief Number of heartbeats written to the session.
     */
    size_t GetSentCount() const
    {
        return sent_;
    }

    /*! \brief Number of heartbeats that failed to send.
     */
    size_t GetFailedCount() const
    {
        return failed_;
    }

private:
    Session& session_;
    std::chrono::milliseconds interval_ {};
    boost::asio::steady_timer timer_;

    // Only accessed from the timer strand.
    bool running_ {false};

    std::atomic<size_t> sent_ {0};
    std::atomic<size_t> failed_ {0};

    void ScheduleNextTick()
    {
        timer_.expires_after(interval_);
        timer_.async_wait(
            [this](auto ec) {
                OnTick(ec);
            }
        );
    }

    void OnTick(
        const boost::system::error_code& ec
    )
    {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        if (session_.GetState() == SessionState::kActive) {
            auto error {session_.SendHeartbeat(
                [this](auto error) {
                    if (error != StompClientError::kOk) {
                        ++failed_;
                        spdlog::warn("HeartbeatScheduler: Could not send "
                                     "heartbeat: {}", ToString(error));
                        return;
                    }
                    ++sent_;
                }
            )};
            if (error != StompClientError::kOk) {
                spdlog::debug("HeartbeatScheduler: Skipped heartbeat: {}",
                              ToString(error));
            }
        }
        ScheduleNextTick();
    }
};

} // namespace StompWs

#endif // STOMP_WS_HEARTBEAT_SCHEDULER_H
