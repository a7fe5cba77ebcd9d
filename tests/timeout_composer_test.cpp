// ─────────────────────────────────────────────────────────────────────────────
// TimeoutComposer Tests
// ─────────────────────────────────────────────────────────────────────────────
// Phase deadlines driven by transport events and a manual clock.

#include <catch2/catch_test_macros.hpp>

#include "fetchpp/timeout/timeout_composer.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/manual_timer.hpp"

using namespace fetchpp;
using namespace fetchpp::testing;
using namespace std::chrono_literals;

namespace {

TransportEvent event(TransportEventKind kind, bool reused = false) {
    return TransportEvent{kind, reused, 0};
}

}  // namespace

TEST_CASE("TimeoutComposer creates timers only for configured phases", "[timeout]") {
    ManualTimerFactory timers;
    TimeoutOptions options;
    options.with(TimeoutPhase::Connect, 100ms).with(TimeoutPhase::Request, 1s);

    TimeoutComposer composer(options, timers, false, [] {});
    REQUIRE(timers.created() == 2);

    composer.start();
    REQUIRE(composer.is_armed(TimeoutPhase::Request));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Socket));
}

TEST_CASE("TimeoutComposer follows the phase timeline", "[timeout]") {
    ManualTimerFactory timers;
    TimeoutOptions options;
    for (const auto phase : kAllTimeoutPhases) {
        options.with(phase, 1000ms);
    }

    TimeoutComposer composer(options, timers, false, [] {});
    composer.start();

    composer.on_event(event(TransportEventKind::Socket));
    REQUIRE(composer.is_armed(TimeoutPhase::Lookup));
    REQUIRE(composer.is_armed(TimeoutPhase::Socket));

    composer.on_event(event(TransportEventKind::Lookup));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Lookup));
    REQUIRE(composer.is_armed(TimeoutPhase::Connect));

    composer.on_event(event(TransportEventKind::Connect));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Connect));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::SecureConnect));
    REQUIRE(composer.is_armed(TimeoutPhase::Send));

    composer.on_event(event(TransportEventKind::Upload));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Send));
    REQUIRE(composer.is_armed(TimeoutPhase::Response));

    composer.on_event(event(TransportEventKind::Response));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Response));
    REQUIRE(composer.is_armed(TimeoutPhase::Read));

    composer.on_event(event(TransportEventKind::End));
    for (const auto phase : kAllTimeoutPhases) {
        REQUIRE_FALSE(composer.is_armed(phase));
    }

    timers.clock().advance(10s);
    REQUIRE_FALSE(composer.fired());
}

TEST_CASE("TimeoutComposer secure connections arm secureConnect", "[timeout]") {
    ManualTimerFactory timers;
    TimeoutOptions options;
    options.with(TimeoutPhase::SecureConnect, 100ms).with(TimeoutPhase::Send, 100ms);

    TimeoutComposer composer(options, timers, true, [] {});
    composer.start();
    composer.on_event(event(TransportEventKind::Socket));
    composer.on_event(event(TransportEventKind::Lookup));
    composer.on_event(event(TransportEventKind::Connect));
    REQUIRE(composer.is_armed(TimeoutPhase::SecureConnect));
    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Send));

    composer.on_event(event(TransportEventKind::SecureConnect));
    REQUIRE(composer.is_armed(TimeoutPhase::Send));
}

TEST_CASE("TimeoutComposer reused sockets skip lookup and connect", "[timeout]") {
    ManualTimerFactory timers;
    TimeoutOptions options;
    options.with(TimeoutPhase::Lookup, 10ms).with(TimeoutPhase::Send, 100ms);

    TimeoutComposer composer(options, timers, false, [] {});
    composer.start();
    composer.on_event(event(TransportEventKind::Socket, true));

    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Lookup));
    REQUIRE(composer.is_armed(TimeoutPhase::Send));
}

TEST_CASE("TimeoutComposer reports the first phase to elapse", "[timeout]") {
    ScopedCapture capture(LogLevel::Warn);

    ManualTimerFactory timers;
    TimeoutOptions options;
    options.with(TimeoutPhase::Connect, 50ms).with(TimeoutPhase::Request, 200ms);

    int aborted = 0;
    TimeoutComposer composer(options, timers, false, [&aborted] { ++aborted; });
    composer.start();
    composer.on_event(event(TransportEventKind::Socket));
    composer.on_event(event(TransportEventKind::Lookup));

    timers.clock().advance(49ms);
    REQUIRE_FALSE(composer.fired());

    timers.clock().advance(1ms);
    REQUIRE(composer.fired());
    REQUIRE(aborted == 1);
    REQUIRE(composer.failure()->kind == ErrorKind::Timeout);
    REQUIRE(composer.failure()->code == "ETIMEDOUT");
    REQUIRE(composer.failure()->phase == TimeoutPhase::Connect);
    REQUIRE(composer.failure()->timeout == 50ms);
    REQUIRE(composer.failure()->message == "Timeout awaiting 'connect' for 50ms");
    REQUIRE(capture.logger().contains(LogLevel::Warn, "connect"));

    // The request deadline was disarmed with everything else
    timers.clock().advance(1s);
    REQUIRE(aborted == 1);
    REQUIRE(composer.failure()->phase == TimeoutPhase::Connect);
}

TEST_CASE("TimeoutComposer socket deadline measures inactivity", "[timeout]") {
    ManualTimerFactory timers;
    auto options = TimeoutOptions::inactivity(100ms);

    int aborted = 0;
    TimeoutComposer composer(options, timers, false, [&aborted] { ++aborted; });
    composer.start();
    composer.on_event(event(TransportEventKind::Socket, true));
    composer.on_event(event(TransportEventKind::Upload));
    composer.on_event(event(TransportEventKind::Response));

    // Steady trickle of data keeps it alive
    for (int i = 0; i < 10; ++i) {
        timers.clock().advance(80ms);
        composer.on_event(TransportEvent{TransportEventKind::Data, false, 16});
    }
    REQUIRE_FALSE(composer.fired());

    timers.clock().advance(100ms);
    REQUIRE(composer.fired());
    REQUIRE(composer.failure()->phase == TimeoutPhase::Socket);
    REQUIRE(aborted == 1);
}

TEST_CASE("TimeoutComposer ignores events after completion", "[timeout]") {
    ManualTimerFactory timers;
    auto options = TimeoutOptions::inactivity(100ms);

    TimeoutComposer composer(options, timers, false, [] {});
    composer.start();
    composer.complete();
    composer.on_event(event(TransportEventKind::Socket));

    REQUIRE_FALSE(composer.is_armed(TimeoutPhase::Socket));
    timers.clock().advance(1s);
    REQUIRE_FALSE(composer.fired());
}

TEST_CASE("TimeoutComposer with no options never fires", "[timeout]") {
    ManualTimerFactory timers;
    TimeoutComposer composer(TimeoutOptions{}, timers, false, [] {});
    composer.start();
    composer.on_event(event(TransportEventKind::Socket));
    REQUIRE(timers.created() == 0);
    REQUIRE_FALSE(composer.fired());
}
