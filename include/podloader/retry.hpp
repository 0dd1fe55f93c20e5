#ifndef PODLOADER_RETRY_HPP
#define PODLOADER_RETRY_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <thread>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/enums.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>

namespace podloader
{
    class EpisodeStore;
    class EpisodeLocks;

    // Exponential backoff with jitter.
    class PODLOADER_API RetryPolicy
    {
    public:
        explicit RetryPolicy(RetryOptions options = {});

        // min(max_delay, base_delay * multiplier^(attempt - 1))
        std::chrono::milliseconds base_delay_for(int attempt) const;

        // Base delay with up to 10% jitter, clamped to [min_delay, max_delay].
        std::chrono::milliseconds delay(int attempt) const;

        bool should_retry(const Episode& episode) const noexcept;
        bool is_retryable(const DownloadError& error) const noexcept;

        const RetryOptions& options() const noexcept
        {
            return m_options;
        }

    private:
        RetryOptions m_options;
        mutable std::mutex m_rng_mutex;
        mutable std::mt19937 m_rng;
    };

    struct PODLOADER_API RetryStats
    {
        std::size_t scheduled_retries = 0;
        std::size_t failed_episodes = 0;
        int max_attempts = 0;
        // over the episodes that have been retried at least once
        double average_retry_count = 0.0;
    };

    // Owns the retry timers, one per episode at most, fired from a single
    // timer thread.
    class PODLOADER_API RetryScheduler
    {
    public:
        using resume_callback_t = std::function<tl::expected<void, DownloadError>(const Episode&)>;

        RetryScheduler(RetryOptions options, EpisodeStore& store, EpisodeLocks& locks);
        ~RetryScheduler();

        RetryScheduler(const RetryScheduler&) = delete;
        RetryScheduler& operator=(const RetryScheduler&) = delete;

        // Records a failed attempt and either arms a timer calling `resume`
        // with the latest record, or marks the episode as failed.
        RetryDecision on_failure(const Episode& episode,
                                 const DownloadError& error,
                                 resume_callback_t resume);

        // Disarms timers, persisted status is left as is.
        bool cancel(std::int64_t episode_id);
        std::size_t cancel_all();

        // Drops any timer, resets the episode to pending and resumes it now.
        tl::expected<void, DownloadError> force_now(const Episode& episode,
                                                    const resume_callback_t& resume);

        // retry_count back to 0, last_error cleared, timer dropped.
        std::optional<Episode> reset(const Episode& episode);

        bool has_scheduled(std::int64_t episode_id) const;
        std::set<std::int64_t> scheduled_ids() const;
        // Armed timers plus the ones currently firing.
        std::size_t scheduled_count() const;
        std::optional<clock_type::time_point> next_retry(std::int64_t episode_id) const;

        std::vector<Episode> pending_retries() const;
        RetryStats stats() const;

        const RetryPolicy& policy() const noexcept
        {
            return m_policy;
        }

        void stop();

    private:
        struct Timer
        {
            std::int64_t row_id = 0;
            std::chrono::steady_clock::time_point due;
            clock_type::time_point due_wall;
            resume_callback_t resume;
        };

        void arm(const Episode& episode, std::chrono::milliseconds delay, resume_callback_t resume);
        void timer_loop();
        void fire(const Timer& timer);

        RetryPolicy m_policy;
        EpisodeStore& m_store;
        EpisodeLocks& m_locks;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::map<std::int64_t, Timer> m_timers;
        std::set<std::int64_t> m_firing;
        bool m_stopped = false;
        std::thread m_thread;
    };
}

#endif
