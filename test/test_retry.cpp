#include <doctest/doctest.h>

#include <atomic>

#include <podloader/episode_store.hpp>
#include <podloader/locks.hpp>
#include <podloader/retry.hpp>

#include "helpers.hpp"

using namespace podloader;
using namespace std::chrono_literals;

namespace
{
    RetryOptions fast_options(int max_attempts = 3)
    {
        RetryOptions options;
        options.max_attempts = max_attempts;
        options.base_delay = 5ms;
        options.multiplier = 2.0;
        options.min_delay = 1ms;
        options.max_delay = 50ms;
        options.jitter = false;
        return options;
    }

    RetryOptions slow_options()
    {
        RetryOptions options;
        options.base_delay = 60s;
        options.min_delay = 60s;
        options.jitter = false;
        return options;
    }

    DownloadError network_error()
    {
        return DownloadError{ ErrorCode::kNETWORK, ErrorLevel::INFO, "Connection refused" };
    }

    DownloadError http_error(long status)
    {
        return DownloadError{ ErrorCode::kHTTP_STATUS,
                              ErrorLevel::SERIOUS,
                              fmt::format("HTTP {}", status),
                              status };
    }

    tl::expected<void, DownloadError> no_resume(const Episode&)
    {
        return {};
    }
}

TEST_SUITE("retry_policy")
{
    TEST_CASE("base_delay")
    {
        RetryPolicy policy;
        CHECK_EQ(policy.base_delay_for(1), 5000ms);
        CHECK_EQ(policy.base_delay_for(2), 10000ms);
        CHECK_EQ(policy.base_delay_for(3), 20000ms);
        CHECK_EQ(policy.base_delay_for(10), 300000ms);
        CHECK_EQ(policy.base_delay_for(0), 5000ms);
    }

    TEST_CASE("delay_jitter_and_bounds")
    {
        RetryPolicy policy;
        for (int i = 0; i < 50; ++i)
        {
            auto d = policy.delay(2);
            CHECK(d >= 9000ms);
            CHECK(d <= 11000ms);
            CHECK(policy.delay(12) <= 300000ms);
        }

        RetryOptions options;
        options.base_delay = 100ms;
        options.min_delay = 1000ms;
        options.jitter = false;
        CHECK_EQ(RetryPolicy(options).delay(1), 1000ms);

        options.base_delay = 2000ms;
        CHECK_EQ(RetryPolicy(options).delay(1), 2000ms);
    }

    TEST_CASE("default_delays_stay_near_their_base")
    {
        RetryPolicy policy;
        for (int i = 0; i < 100; ++i)
        {
            const auto first = policy.delay(1);
            CHECK(first >= 4500ms);
            CHECK(first <= 5500ms);

            const auto third = policy.delay(3);
            CHECK(third >= 18000ms);
            CHECK(third <= 22000ms);

            for (int attempt = 1; attempt <= 20; ++attempt)
            {
                const auto d = policy.delay(attempt);
                CHECK(d >= 1000ms);
                CHECK(d <= 300000ms);
            }
        }
    }

    TEST_CASE("should_retry")
    {
        RetryPolicy policy;
        Episode ep;
        ep.retry_count = 2;
        CHECK(policy.should_retry(ep));
        ep.retry_count = 3;
        CHECK_FALSE(policy.should_retry(ep));
    }

    TEST_CASE("is_retryable")
    {
        RetryPolicy policy;
        CHECK(policy.is_retryable(network_error()));
        CHECK(policy.is_retryable(http_error(503)));
        CHECK(policy.is_retryable(http_error(500)));
        CHECK(policy.is_retryable(http_error(408)));
        CHECK(policy.is_retryable(http_error(429)));
        CHECK_FALSE(policy.is_retryable(http_error(404)));
        CHECK_FALSE(policy.is_retryable(http_error(403)));
        CHECK(policy.is_retryable(
            DownloadError{ ErrorCode::kMISSING_TEMP_FILE, ErrorLevel::SERIOUS, "gone" }));
        CHECK(policy.is_retryable(DownloadError{ ErrorCode::kWRITE, ErrorLevel::SERIOUS, "w" }));
        CHECK_FALSE(
            policy.is_retryable(DownloadError{ ErrorCode::kWRITE, ErrorLevel::FATAL, "w" }));
        CHECK_FALSE(
            policy.is_retryable(DownloadError{ ErrorCode::kBAD_URL, ErrorLevel::FATAL, "u" }));
        CHECK_FALSE(
            policy.is_retryable(DownloadError{ ErrorCode::kCANCELLED, ErrorLevel::INFO, "c" }));

        RetryOptions options;
        options.retry_client_errors = true;
        CHECK(RetryPolicy(options).is_retryable(http_error(404)));
    }
}

TEST_SUITE("retry_scheduler")
{
    TEST_CASE("schedules_retryable_failure")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        CHECK_EQ(scheduler.on_failure(ep, network_error(), no_resume), RetryDecision::kSCHEDULED);

        auto current = store.get_by_id(ep.id);
        CHECK_EQ(current->status, EpisodeStatus::kPENDING);
        CHECK_EQ(current->retry_count, 1);
        CHECK_EQ(current->last_error, "NetworkError: Connection refused");
        CHECK(scheduler.has_scheduled(1));
        CHECK_EQ(scheduler.scheduled_count(), 1);
        REQUIRE(scheduler.next_retry(1));
        CHECK(*scheduler.next_retry(1) > clock_type::now() + 30s);

        // a second failure replaces the timer
        CHECK_EQ(scheduler.on_failure(*current, network_error(), no_resume),
                 RetryDecision::kSCHEDULED);
        CHECK_EQ(scheduler.scheduled_ids().size(), 1);
        CHECK_EQ(store.get_by_id(ep.id)->retry_count, 2);

        CHECK(scheduler.cancel(1));
        CHECK_FALSE(scheduler.cancel(1));
        CHECK_FALSE(scheduler.has_scheduled(1));
        CHECK_EQ(store.get_by_id(ep.id)->status, EpisodeStatus::kPENDING);
    }

    TEST_CASE("fails_when_exhausted_or_permanent")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto exhausted = testing::make_episode(1, "http://localhost/1.mp3");
        exhausted.retry_count = 3;
        exhausted = *store.insert(exhausted);
        CHECK_EQ(scheduler.on_failure(exhausted, network_error(), no_resume),
                 RetryDecision::kFAILED);
        CHECK_EQ(store.get_by_id(exhausted.id)->status, EpisodeStatus::kFAILED);
        CHECK_EQ(store.get_by_id(exhausted.id)->retry_count, 3);

        auto missing = *store.insert(testing::make_episode(2, "http://localhost/2.mp3"));
        CHECK_EQ(scheduler.on_failure(missing, http_error(404), no_resume),
                 RetryDecision::kFAILED);
        auto current = store.get_by_id(missing.id);
        CHECK_EQ(current->status, EpisodeStatus::kFAILED);
        CHECK_EQ(current->retry_count, 0);
        CHECK_EQ(current->last_error, "HttpStatusError: HTTP 404");

        CHECK_EQ(scheduler.scheduled_count(), 0);
        CHECK_EQ(scheduler.stats().failed_episodes, 2);
    }

    TEST_CASE("cancelled_and_space_errors_are_not_retried")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto ep = testing::make_episode(1, "http://localhost/1.mp3");
        ep.status = EpisodeStatus::kDOWNLOADING;
        ep.progress = 40;
        ep = *store.insert(ep);

        DownloadError cancelled{ ErrorCode::kCANCELLED, ErrorLevel::INFO, "Download cancelled" };
        CHECK_EQ(scheduler.on_failure(ep, cancelled, no_resume), RetryDecision::kSKIPPED);
        auto current = store.get_by_id(ep.id);
        CHECK_EQ(current->status, EpisodeStatus::kPENDING);
        CHECK_EQ(current->progress, 0);
        CHECK_EQ(current->retry_count, 0);
        CHECK_EQ(current->last_error, "Cancelled: Download cancelled");

        EpisodeUpdate downloading;
        downloading.status = EpisodeStatus::kDOWNLOADING;
        store.update(ep.id, downloading);

        DownloadError full{ ErrorCode::kINSUFFICIENT_SPACE, ErrorLevel::SERIOUS, "Disk full" };
        CHECK_EQ(scheduler.on_failure(ep, full, no_resume), RetryDecision::kSKIPPED);
        current = store.get_by_id(ep.id);
        CHECK_EQ(current->status, EpisodeStatus::kPENDING);
        CHECK_EQ(current->retry_count, 0);
        CHECK_EQ(current->last_error, "InsufficientSpace: Disk full");

        CHECK_EQ(scheduler.scheduled_count(), 0);
    }

    TEST_CASE("already_active_is_ignored")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto ep = testing::make_episode(1, "http://localhost/1.mp3");
        ep.status = EpisodeStatus::kDOWNLOADING;
        ep = *store.insert(ep);

        DownloadError active{ ErrorCode::kALREADY_ACTIVE, ErrorLevel::INFO, "busy" };
        CHECK_EQ(scheduler.on_failure(ep, active, no_resume), RetryDecision::kSKIPPED);
        auto current = store.get_by_id(ep.id);
        CHECK_EQ(current->status, EpisodeStatus::kDOWNLOADING);
        CHECK(current->last_error.empty());
    }

    TEST_CASE("timer_resumes_pending_episode")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(fast_options(), store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        std::atomic<int> calls{ 0 };
        std::atomic<int> seen_retry_count{ -1 };
        auto resume = [&](const Episode& e) -> tl::expected<void, DownloadError>
        {
            seen_retry_count = e.retry_count;
            ++calls;
            return {};
        };

        CHECK_EQ(scheduler.on_failure(ep, network_error(), resume), RetryDecision::kSCHEDULED);
        CHECK(testing::wait_for([&] { return calls == 1; }));
        CHECK(testing::wait_for([&] { return scheduler.scheduled_count() == 0; }));
        CHECK_EQ(seen_retry_count, 1);
    }

    TEST_CASE("timer_dropped_when_no_longer_pending")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        auto options = fast_options();
        options.base_delay = 30ms;
        options.max_delay = 30ms;
        RetryScheduler scheduler(options, store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        std::atomic<int> calls{ 0 };
        auto resume = [&](const Episode&) -> tl::expected<void, DownloadError>
        {
            ++calls;
            return {};
        };

        CHECK_EQ(scheduler.on_failure(ep, network_error(), resume), RetryDecision::kSCHEDULED);
        EpisodeUpdate update;
        update.status = EpisodeStatus::kDOWNLOADED;
        store.update(ep.id, update);

        CHECK(testing::wait_for([&] { return scheduler.scheduled_count() == 0; }));
        std::this_thread::sleep_for(20ms);
        CHECK_EQ(calls, 0);
    }

    TEST_CASE("failed_resume_counts_as_attempt")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(fast_options(2), store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        std::atomic<int> calls{ 0 };
        auto resume = [&](const Episode&) -> tl::expected<void, DownloadError>
        {
            ++calls;
            return tl::unexpected(network_error());
        };

        CHECK_EQ(scheduler.on_failure(ep, network_error(), resume), RetryDecision::kSCHEDULED);
        CHECK(testing::wait_for(
            [&] { return store.get_by_id(ep.id)->status == EpisodeStatus::kFAILED; }));
        CHECK_EQ(calls, 2);
        CHECK_EQ(store.get_by_id(ep.id)->retry_count, 2);
        CHECK(testing::wait_for([&] { return scheduler.scheduled_count() == 0; }));
    }

    TEST_CASE("force_now_and_reset")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        scheduler.on_failure(ep, network_error(), no_resume);
        REQUIRE(scheduler.has_scheduled(1));

        int calls = 0;
        auto res = scheduler.force_now(ep,
                                       [&](const Episode& e) -> tl::expected<void, DownloadError>
                                       {
                                           ++calls;
                                           CHECK_EQ(e.status, EpisodeStatus::kPENDING);
                                           CHECK(e.last_error.empty());
                                           return {};
                                       });
        CHECK(res);
        CHECK_EQ(calls, 1);
        CHECK_FALSE(scheduler.has_scheduled(1));
        CHECK_EQ(store.get_by_id(ep.id)->retry_count, 1);

        auto reset = scheduler.reset(ep);
        REQUIRE(reset);
        CHECK_EQ(reset->retry_count, 0);
        CHECK(reset->last_error.empty());

        Episode unknown = testing::make_episode(99, "http://localhost/99.mp3");
        unknown.id = 1234;
        auto missing = scheduler.force_now(unknown, no_resume);
        REQUIRE_FALSE(missing);
        CHECK_EQ(missing.error().code, ErrorCode::kNOT_FOUND);
    }

    TEST_CASE("stats_and_pending_retries")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto a = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        auto b = *store.insert(testing::make_episode(2, "http://localhost/2.mp3"));
        store.insert(testing::make_episode(3, "http://localhost/3.mp3"));

        scheduler.on_failure(a, network_error(), no_resume);
        scheduler.on_failure(b, network_error(), no_resume);
        scheduler.on_failure(*store.get_by_id(b.id), network_error(), no_resume);

        auto stats = scheduler.stats();
        CHECK_EQ(stats.scheduled_retries, 2);
        CHECK_EQ(stats.failed_episodes, 0);
        CHECK_EQ(stats.max_attempts, 3);
        CHECK_EQ(stats.average_retry_count, doctest::Approx(1.5));
        CHECK_EQ(scheduler.pending_retries().size(), 2);

        CHECK_EQ(scheduler.cancel_all(), 2);
        CHECK_EQ(scheduler.scheduled_count(), 0);
    }

    TEST_CASE("stop_drops_timers")
    {
        MemoryEpisodeStore store;
        EpisodeLocks locks;
        RetryScheduler scheduler(slow_options(), store, locks);

        auto ep = *store.insert(testing::make_episode(1, "http://localhost/1.mp3"));
        scheduler.on_failure(ep, network_error(), no_resume);
        scheduler.stop();
        CHECK_EQ(scheduler.scheduled_count(), 0);

        // nothing armed after stop, the record is still updated
        scheduler.on_failure(*store.get_by_id(ep.id), network_error(), no_resume);
        CHECK_EQ(scheduler.scheduled_count(), 0);
        CHECK_EQ(store.get_by_id(ep.id)->retry_count, 2);
    }
}
