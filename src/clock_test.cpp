// =============================================================================
// src/clock_test.cpp - Timer source tests (virtual and asio-backed)
// =============================================================================
// The asio cases run a real io_context with millisecond timers; they check
// ordering and cancellation, never wall-clock precision.
// =============================================================================

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "recap/audio/SilentChannel.hpp"
#include "recap/infra/AsioClock.hpp"
#include "recap/infra/ManualClock.hpp"

using namespace recap;
using infra::fromMillis;

class ClockTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           RECAP CLOCKS - UNIT TESTS                              ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_manual_ordering();
        test_manual_repeat_and_cancel();
        test_manual_cancel_from_callback();
        test_asio_one_shot();
        test_asio_cancel_before_expiry();
        test_asio_cancel_queued_peer();
        test_asio_repeat_self_cancel();
        test_silent_channel();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    // =========================================================================
    // MANUAL CLOCK
    // =========================================================================

    void test_manual_ordering() {
        std::cout << "Testing ManualClock Ordering...\n";
        infra::ManualClock clock;
        std::vector<int> order;
        clock.after(fromMillis(30), [&] { order.push_back(30); });
        clock.after(fromMillis(10), [&] { order.push_back(10); });
        clock.after(fromMillis(20), [&] { order.push_back(20); });
        clock.after(fromMillis(10), [&] { order.push_back(11); });

        clock.advance(fromMillis(25));
        check(order == std::vector<int>({10, 11, 20}), "Expiry order, ties by creation",
              std::to_string(order.size()) + " fired");
        check(clock.now() == fromMillis(25) && clock.activeTimers() == 1, "advance() lands on the target",
              std::to_string(infra::toMillis(clock.now())));

        check(clock.runNext() && order.back() == 30 && clock.now() == fromMillis(30),
              "runNext() jumps to the next expiry", std::to_string(infra::toMillis(clock.now())));
        check(!clock.runNext(), "runNext() reports idle", "fired from empty");
        std::cout << "\n";
    }

    void test_manual_repeat_and_cancel() {
        std::cout << "Testing ManualClock Repeat...\n";
        infra::ManualClock clock;
        int n = 0;
        auto id = clock.every(fromMillis(100), [&] { ++n; });

        clock.advance(fromMillis(350));
        check(n == 3, "Three fires in 350ms", std::to_string(n));

        clock.cancel(id);
        clock.cancel(id);
        clock.advance(fromMillis(1000));
        check(n == 3 && clock.activeTimers() == 0, "Cancel is idempotent and final", std::to_string(n));
        std::cout << "\n";
    }

    void test_manual_cancel_from_callback() {
        std::cout << "Testing ManualClock Cancel-In-Callback...\n";
        infra::ManualClock clock;
        bool b_fired = false;
        infra::TimerId b = 0;
        clock.after(fromMillis(10), [&] { clock.cancel(b); });
        b = clock.after(fromMillis(10), [&] { b_fired = true; });

        clock.advance(fromMillis(20));
        check(!b_fired, "Peer due at the same instant is cancelled", "fired");
        std::cout << "\n";
    }

    // =========================================================================
    // ASIO CLOCK
    // =========================================================================

    void test_asio_one_shot() {
        std::cout << "Testing AsioClock One-Shot...\n";
        boost::asio::io_context io;
        infra::AsioClock clock(io);
        int n = 0;
        clock.after(fromMillis(1), [&] { ++n; });
        check(clock.activeTimers() == 1, "Scheduled timer is active", std::to_string(clock.activeTimers()));

        io.run();
        check(n == 1 && clock.activeTimers() == 0, "Fires once, then released", std::to_string(n));
        std::cout << "\n";
    }

    void test_asio_cancel_before_expiry() {
        std::cout << "Testing AsioClock Cancel...\n";
        boost::asio::io_context io;
        infra::AsioClock clock(io);
        bool fired = false;
        auto id = clock.after(fromMillis(5), [&] { fired = true; });
        clock.cancel(id);

        io.run();
        check(!fired && clock.activeTimers() == 0, "Cancelled timer never fires", "fired");
        std::cout << "\n";
    }

    void test_asio_cancel_queued_peer() {
        std::cout << "Testing AsioClock Queued Cancel...\n";
        boost::asio::io_context io;
        infra::AsioClock clock(io);
        bool b_fired = false;
        infra::TimerId b = 0;

        // Both expire together; by the time A runs, B's completion may
        // already be queued with success.
        clock.after(fromMillis(2), [&] { clock.cancel(b); });
        b = clock.after(fromMillis(2), [&] { b_fired = true; });

        io.run();
        check(!b_fired, "Cancelled peer stays silent", "fired");
        std::cout << "\n";
    }

    void test_asio_repeat_self_cancel() {
        std::cout << "Testing AsioClock Repeat...\n";
        boost::asio::io_context io;
        infra::AsioClock clock(io);
        int n = 0;
        infra::TimerId id = 0;
        id = clock.every(fromMillis(1), [&] {
            if (++n == 3) clock.cancel(id);
        });

        io.run();
        check(n == 3 && clock.activeTimers() == 0, "Repeats until cancelled from its own callback",
              std::to_string(n));
        std::cout << "\n";
    }

    // =========================================================================
    // SILENT CHANNEL
    // =========================================================================

    void test_silent_channel() {
        std::cout << "Testing SilentChannel...\n";
        infra::ManualClock clock;
        audio::SilentChannel channel(clock);

        std::string reason;
        bool completed = false;
        auto h = channel.play("clip.mp3", 1.0, [&] { completed = true; },
                              [&](const std::string& r) { reason = r; });
        check(reason.empty() && h != 0, "Failure is never reported from inside play()", reason);

        clock.runUntilIdle();
        check(reason == "muted: clip.mp3" && !completed && !channel.live(h),
              "Failure arrives on the next clock turn", reason);

        reason.clear();
        auto h2 = channel.play("other.mp3", 1.0, [] {}, [&](const std::string& r) { reason = r; });
        channel.stop(h2);
        clock.runUntilIdle();
        check(reason.empty() && clock.activeTimers() == 0, "Nothing is delivered after stop()", reason);
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                     ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                     ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    ClockTest tester;
    return tester.run_all_tests();
}
