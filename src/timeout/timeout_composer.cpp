#include "fetchpp/timeout/timeout_composer.hpp"
#include "fetchpp/log/logger.hpp"

namespace fetchpp {

TimeoutComposer::TimeoutComposer(
    TimeoutOptions options,
    ITimerFactory& timers,
    bool secure,
    std::function<void()> on_timeout
)
    : options_(std::move(options))
    , secure_(secure)
    , on_timeout_(std::move(on_timeout))
{
    for (const auto phase : kAllTimeoutPhases) {
        if (options_.has(phase)) {
            timers_[static_cast<std::size_t>(phase)] = timers.make_timer();
        }
    }
}

TimeoutComposer::~TimeoutComposer() {
    disarm_all();
}

void TimeoutComposer::start() {
    arm(TimeoutPhase::Request);
}

void TimeoutComposer::on_event(const TransportEvent& event) {
    if (finished_) {
        return;
    }

    FETCHPP_LOG_TRACE(Timeout, "Transport event '{}'", to_string(event.kind));

    switch (event.kind) {
        case TransportEventKind::Socket:
            if (event.reused_connection) {
                arm(TimeoutPhase::Send);
            } else {
                arm(TimeoutPhase::Lookup);
            }
            break;

        case TransportEventKind::Lookup:
            disarm(TimeoutPhase::Lookup);
            arm(TimeoutPhase::Connect);
            break;

        case TransportEventKind::Connect:
            disarm(TimeoutPhase::Connect);
            if (secure_) {
                arm(TimeoutPhase::SecureConnect);
            } else {
                arm(TimeoutPhase::Send);
            }
            break;

        case TransportEventKind::SecureConnect:
            disarm(TimeoutPhase::SecureConnect);
            arm(TimeoutPhase::Send);
            break;

        case TransportEventKind::Upload:
            disarm(TimeoutPhase::Send);
            arm(TimeoutPhase::Response);
            break;

        case TransportEventKind::Response:
            disarm(TimeoutPhase::Response);
            arm(TimeoutPhase::Read);
            break;

        case TransportEventKind::Data:
            break;

        case TransportEventKind::End:
            complete();
            return;
    }

    arm(TimeoutPhase::Socket);
}

void TimeoutComposer::complete() noexcept {
    finished_ = true;
    disarm_all();
}

bool TimeoutComposer::is_armed(TimeoutPhase phase) const noexcept {
    const auto& timer = timers_[static_cast<std::size_t>(phase)];
    return timer && timer->armed();
}

void TimeoutComposer::arm(TimeoutPhase phase) {
    auto& timer = timers_[static_cast<std::size_t>(phase)];
    if (!timer || finished_) {
        return;
    }
    const auto duration = *options_.get(phase);
    timer->arm(duration, [this, phase]() { fire(phase); });
}

void TimeoutComposer::disarm(TimeoutPhase phase) noexcept {
    auto& timer = timers_[static_cast<std::size_t>(phase)];
    if (timer) {
        timer->disarm();
    }
}

void TimeoutComposer::disarm_all() noexcept {
    for (auto& timer : timers_) {
        if (timer) {
            timer->disarm();
        }
    }
}

void TimeoutComposer::fire(TimeoutPhase phase) {
    if (finished_) {
        return;
    }
    finished_ = true;
    disarm_all();

    const auto duration = *options_.get(phase);
    failure_ = RequestError::timed_out(phase, duration);
    FETCHPP_LOG_WARN(Timeout, "{}", failure_->message);

    if (on_timeout_) {
        on_timeout_();
    }
}

}  // namespace fetchpp
