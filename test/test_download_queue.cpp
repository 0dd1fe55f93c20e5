#include <doctest/doctest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <podloader/download_queue.hpp>

#include "helpers.hpp"

using namespace podloader;
using namespace std::chrono_literals;

namespace
{
    Episode episode(std::int64_t id)
    {
        return testing::make_episode(id, fmt::format("http://localhost/{}.mp3", id));
    }

    DownloadResult ok_result(const Episode& e)
    {
        return fs::path(fmt::format("{}.mp3", e.episode_id));
    }
}

TEST_SUITE("download_queue")
{
    TEST_CASE("fifo_order")
    {
        std::mutex mutex;
        std::vector<std::int64_t> order;
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                std::lock_guard<std::mutex> lock(mutex);
                                order.push_back(e.episode_id);
                                return ok_result(e);
                            });

        auto first = queue.submit(episode(1));
        queue.submit(episode(2));
        queue.submit(episode(3));
        queue.wait_idle();

        CHECK_EQ(first.get().value(), fs::path("1.mp3"));
        const std::vector<std::int64_t> expected{ 1, 2, 3 };
        CHECK_EQ(order, expected);
        CHECK(queue.idle());
    }

    TEST_CASE("admission_cap")
    {
        std::atomic<int> current{ 0 };
        std::atomic<int> peak{ 0 };
        DownloadQueue queue(2,
                            [&](const Episode& e)
                            {
                                int now = ++current;
                                int seen = peak.load();
                                while (now > seen && !peak.compare_exchange_weak(seen, now))
                                {
                                }
                                std::this_thread::sleep_for(20ms);
                                --current;
                                return ok_result(e);
                            });

        std::vector<std::shared_future<DownloadResult>> results;
        for (std::int64_t id = 1; id <= 6; ++id)
            results.push_back(queue.submit(episode(id)));
        for (auto& r : results)
            CHECK(r.get());

        CHECK_EQ(peak.load(), 2);
        CHECK_EQ(queue.peak_running(), 2);
    }

    TEST_CASE("dedupe_and_remove")
    {
        std::promise<void> gate;
        std::shared_future<void> opened = gate.get_future().share();
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                opened.wait();
                                return ok_result(e);
                            });

        auto running = queue.submit(episode(1));
        REQUIRE(testing::wait_for([&] { return queue.running() == 1; }));

        auto a = queue.submit(episode(2));
        auto b = queue.submit(episode(2));
        queue.submit(episode(3));
        CHECK_EQ(queue.queued(), 2);
        CHECK(queue.is_queued(2));

        CHECK(queue.remove(3));
        CHECK_FALSE(queue.remove(3));
        CHECK_FALSE(queue.is_queued(3));

        gate.set_value();
        CHECK(running.get());
        CHECK(a.get());
        CHECK_EQ(a.get().value(), b.get().value());
        queue.wait_idle();
    }

    TEST_CASE("removed_entry_is_cancelled")
    {
        std::promise<void> gate;
        std::shared_future<void> opened = gate.get_future().share();
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                opened.wait();
                                return ok_result(e);
                            });

        queue.submit(episode(1));
        REQUIRE(testing::wait_for([&] { return queue.running() == 1; }));
        auto removed = queue.submit(episode(2));
        queue.remove(2);

        const auto& result = removed.get();
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().code, ErrorCode::kCANCELLED);
        gate.set_value();
    }

    TEST_CASE("stop_cancels_queued")
    {
        std::promise<void> gate;
        std::shared_future<void> opened = gate.get_future().share();
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                opened.wait();
                                return ok_result(e);
                            });

        auto running = queue.submit(episode(1));
        REQUIRE(testing::wait_for([&] { return queue.running() == 1; }));
        auto waiting = queue.submit(episode(2));

        std::thread stopper([&] { queue.stop(); });
        // a stopped queue refuses new entries right away
        CHECK(testing::wait_for(
            [&] { return queue.submit(episode(99)).wait_for(0s) == std::future_status::ready; }));
        gate.set_value();
        stopper.join();

        CHECK(running.get());
        REQUIRE_FALSE(waiting.get());
        CHECK_EQ(waiting.get().error().code, ErrorCode::kCANCELLED);

        auto refused = queue.submit(episode(3));
        CHECK_EQ(refused.wait_for(0s), std::future_status::ready);
        CHECK_EQ(refused.get().error().code, ErrorCode::kCANCELLED);
    }

    TEST_CASE("try_submit_reports_refusal")
    {
        DownloadQueue queue(1, ok_result);
        auto accepted = queue.try_submit(episode(1));
        REQUIRE(accepted);
        CHECK(accepted->get());

        queue.stop();
        auto refused = queue.try_submit(episode(2));
        REQUIRE_FALSE(refused);
        CHECK_EQ(refused.error().code, ErrorCode::kCANCELLED);
    }

    TEST_CASE("try_submit_returns_before_the_job_runs")
    {
        // the result of an accepted entry is never read as a refusal, even
        // when the job finishes before the caller looks at it
        std::atomic<int> runs{ 0 };
        DownloadQueue queue(2,
                            [&](const Episode&) -> DownloadResult
                            {
                                ++runs;
                                return tl::unexpected(DownloadError{
                                    ErrorCode::kNETWORK, ErrorLevel::INFO, "refused" });
                            });

        for (std::int64_t id = 1; id <= 20; ++id)
        {
            auto submitted = queue.try_submit(episode(id));
            REQUIRE(submitted);
        }
        queue.wait_idle();
        CHECK_EQ(runs.load(), 20);
    }

    TEST_CASE("pause_and_resume")
    {
        std::mutex mutex;
        std::vector<std::int64_t> order;
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                std::lock_guard<std::mutex> lock(mutex);
                                order.push_back(e.episode_id);
                                return ok_result(e);
                            });

        CHECK(queue.pause());
        CHECK_FALSE(queue.pause());
        CHECK(queue.paused());

        queue.submit(episode(1));
        queue.submit(episode(2));
        queue.submit_front(episode(3));
        std::this_thread::sleep_for(30ms);
        CHECK_EQ(queue.queued(), 3);
        CHECK_EQ(queue.running(), 0);
        CHECK_FALSE(queue.idle());
        CHECK_FALSE(queue.wait_idle_for(10ms));
        CHECK(queue.wait_running_for(10ms));

        CHECK(queue.resume());
        CHECK_FALSE(queue.resume());
        queue.wait_idle();

        const std::vector<std::int64_t> expected{ 3, 1, 2 };
        CHECK_EQ(order, expected);
    }

    TEST_CASE("stop_while_paused")
    {
        DownloadQueue queue(1, ok_result);
        queue.pause();
        auto waiting = queue.submit(episode(1));
        queue.stop();
        REQUIRE_FALSE(waiting.get());
        CHECK_EQ(waiting.get().error().code, ErrorCode::kCANCELLED);
        CHECK_FALSE(queue.pause());
    }

    TEST_CASE("worker_thread_detection")
    {
        std::atomic<bool> on_worker{ false };
        DownloadQueue* self = nullptr;
        DownloadQueue queue(1,
                            [&](const Episode& e)
                            {
                                on_worker = self->is_worker_thread();
                                return ok_result(e);
                            });
        self = &queue;

        CHECK_FALSE(queue.is_worker_thread());
        CHECK(queue.submit(episode(1)).get());
        CHECK(on_worker.load());
    }

    TEST_CASE("throwing_job")
    {
        DownloadQueue queue(1,
                            [](const Episode&) -> DownloadResult
                            { throw std::runtime_error("boom"); });

        auto result = queue.submit(episode(1)).get();
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().code, ErrorCode::kIO);
        CHECK_EQ(result.error().reason, "boom");
    }
}
