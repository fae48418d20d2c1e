#include "celestiada/sdk/ConfirmationPoller.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

using namespace celestiada::sdk;

namespace {

const std::chrono::milliseconds INTERVAL(20);

// Reports the values in sequence, repeating the last one
struct ScriptedReader {
    explicit ScriptedReader(std::vector<uint64_t> values) : values(std::move(values)) {}

    Result<uint64_t> operator()(const CancellationToken&) {
        size_t index = calls < values.size() ? calls : values.size() - 1;
        ++calls;
        return values[index];
    }

    std::vector<uint64_t> values;
    size_t calls = 0;
};

} // namespace

BOOST_AUTO_TEST_SUITE(confirmation_poller_tests)

BOOST_AUTO_TEST_CASE(height_reached_on_first_read)
{
    ConfirmationPoller poller("height", INTERVAL);
    CancellationToken ctx;
    ScriptedReader reader({10});

    auto begin = std::chrono::steady_clock::now();
    auto result = poller.wait_for_height(ctx, std::ref(reader), 5);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    BOOST_REQUIRE(result.is_ok());
    BOOST_CHECK_EQUAL(result.value(), 10u);
    BOOST_CHECK_EQUAL(reader.calls, 1u);
    // Sleeps before the first read
    BOOST_CHECK(elapsed >= INTERVAL);
}

BOOST_AUTO_TEST_CASE(height_returns_once_target_reached)
{
    ConfirmationPoller poller("height", INTERVAL);
    CancellationToken ctx;
    ScriptedReader reader({1, 2, 3, 4});

    auto begin = std::chrono::steady_clock::now();
    auto result = poller.wait_for_height(ctx, std::ref(reader), 3);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    BOOST_REQUIRE(result.is_ok());
    BOOST_CHECK_EQUAL(result.value(), 3u);
    BOOST_CHECK_EQUAL(reader.calls, 3u);
    BOOST_CHECK(elapsed >= 3 * INTERVAL);
    BOOST_CHECK(elapsed < std::chrono::seconds(5));
}

BOOST_AUTO_TEST_CASE(nonce_must_exceed_target)
{
    ConfirmationPoller poller("nonce", INTERVAL);
    CancellationToken ctx;
    ScriptedReader reader({5, 5, 6});

    auto result = poller.wait_for_nonce(ctx, std::ref(reader), 5);
    BOOST_REQUIRE(result.is_ok());
    BOOST_CHECK_EQUAL(result.value(), 6u);
    BOOST_CHECK_EQUAL(reader.calls, 3u);
}

BOOST_AUTO_TEST_CASE(read_error_ends_wait)
{
    ConfirmationPoller poller("height", INTERVAL);
    CancellationToken ctx;
    size_t calls = 0;

    auto result = poller.wait_for_height(ctx, [&calls](const CancellationToken&) -> Result<uint64_t> {
        if (++calls == 2) {
            return {ErrorCode::TRANSPORT_ERROR, "connection refused"};
        }
        return uint64_t(1);
    }, 100);

    BOOST_CHECK(result.error() == ErrorCode::TRANSPORT_ERROR);
    BOOST_CHECK_EQUAL(result.error_detail(), "connection refused");
    BOOST_CHECK_EQUAL(calls, 2u);
}

BOOST_AUTO_TEST_CASE(cancelled_before_start)
{
    ConfirmationPoller poller("height", INTERVAL);
    CancellationToken ctx;
    ctx.cancel();
    ScriptedReader reader({100});

    auto result = poller.wait_for_height(ctx, std::ref(reader), 1);
    BOOST_CHECK(result.error() == ErrorCode::CANCELLED);
    BOOST_CHECK_EQUAL(reader.calls, 0u);
}

BOOST_AUTO_TEST_CASE(cancel_interrupts_sleep)
{
    ConfirmationPoller poller("nonce", std::chrono::seconds(30));
    CancellationToken ctx;
    ScriptedReader reader({100});

    std::thread canceller([&ctx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ctx.cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    auto result = poller.wait_for_nonce(ctx, std::ref(reader), 1);
    auto elapsed = std::chrono::steady_clock::now() - begin;
    canceller.join();

    BOOST_CHECK(result.error() == ErrorCode::CANCELLED);
    BOOST_CHECK_EQUAL(reader.calls, 0u);
    BOOST_CHECK(elapsed < std::chrono::seconds(10));
}

BOOST_AUTO_TEST_CASE(bounded_attempts_time_out)
{
    ConfirmationPoller poller("height", INTERVAL, 3);
    CancellationToken ctx;
    ScriptedReader reader({0});

    auto result = poller.wait_for_height(ctx, std::ref(reader), 1);
    BOOST_CHECK(result.error() == ErrorCode::TIMEOUT);
    BOOST_CHECK_EQUAL(reader.calls, 3u);
}

BOOST_AUTO_TEST_CASE(defaults)
{
    ConfirmationPoller poller("height");
    BOOST_CHECK(poller.interval() == std::chrono::milliseconds(5000));
    BOOST_CHECK_EQUAL(poller.max_attempts(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
