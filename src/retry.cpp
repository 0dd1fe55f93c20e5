#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include <podloader/episode_store.hpp>
#include <podloader/locks.hpp>
#include <podloader/retry.hpp>

namespace podloader
{
    /***************
     * RetryPolicy *
     ***************/

    RetryPolicy::RetryPolicy(RetryOptions options)
        : m_options(options)
        , m_rng(std::random_device{}())
    {
    }

    std::chrono::milliseconds RetryPolicy::base_delay_for(int attempt) const
    {
        attempt = std::max(attempt, 1);
        const double base = static_cast<double>(m_options.base_delay.count())
                            * std::pow(m_options.multiplier, attempt - 1);
        const double capped = std::min(base, static_cast<double>(m_options.max_delay.count()));
        return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
    }

    std::chrono::milliseconds RetryPolicy::delay(int attempt) const
    {
        double value = static_cast<double>(base_delay_for(attempt).count());
        if (m_options.jitter)
        {
            std::uniform_real_distribution<double> dist(-0.1, 0.1);
            std::lock_guard<std::mutex> lock(m_rng_mutex);
            value += value * dist(m_rng);
        }

        // the ceiling holds after jitter, the floor wins over both
        value = std::min(value, static_cast<double>(m_options.max_delay.count()));
        value = std::max(value, static_cast<double>(m_options.min_delay.count()));
        return std::chrono::milliseconds(static_cast<std::int64_t>(std::lround(value)));
    }

    bool RetryPolicy::should_retry(const Episode& episode) const noexcept
    {
        return episode.retry_count < m_options.max_attempts;
    }

    bool RetryPolicy::is_retryable(const DownloadError& error) const noexcept
    {
        switch (error.code)
        {
            case ErrorCode::kNETWORK:
            case ErrorCode::kMISSING_TEMP_FILE:
            case ErrorCode::kIO:
                return true;
            case ErrorCode::kWRITE:
                return !error.is_fatal();
            case ErrorCode::kHTTP_STATUS:
                if (error.http_status == 408 || error.http_status == 429)
                    return true;
                if (error.is_client_error())
                    return m_options.retry_client_errors;
                return true;
            default:
                return false;
        }
    }

    /******************
     * RetryScheduler *
     ******************/

    RetryScheduler::RetryScheduler(RetryOptions options, EpisodeStore& store, EpisodeLocks& locks)
        : m_policy(options)
        , m_store(store)
        , m_locks(locks)
    {
        m_thread = std::thread(&RetryScheduler::timer_loop, this);
    }

    RetryScheduler::~RetryScheduler()
    {
        stop();
    }

    void RetryScheduler::stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopped)
                return;
            m_stopped = true;
            m_timers.clear();
        }
        m_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    RetryDecision RetryScheduler::on_failure(const Episode& episode,
                                             const DownloadError& error,
                                             resume_callback_t resume)
    {
        if (error.code == ErrorCode::kALREADY_ACTIVE)
        {
            spdlog::debug("Episode {} already active, no retry bookkeeping", episode.episode_id);
            return RetryDecision::kSKIPPED;
        }

        // Lock order is the episode lock first, then `m_mutex` inside `cancel`
        // and `arm`. The timer thread never holds `m_mutex` while it calls back
        // into here, see `timer_loop`.
        auto guard = m_locks.lock(episode.episode_id);
        auto current = m_store.get_by_id(episode.id);
        if (!current)
        {
            spdlog::warn("Episode {} vanished from the store", episode.episode_id);
            return RetryDecision::kSKIPPED;
        }

        const std::string reason = fmt::format("{}: {}", to_string(error.code), error.reason);
        EpisodeUpdate update;
        update.last_error = reason;

        if (error.code == ErrorCode::kCANCELLED)
        {
            cancel(current->episode_id);
            update.status = EpisodeStatus::kPENDING;
            update.progress = 0;
            m_store.update(current->id, update);
            spdlog::info("Episode {} cancelled, not retrying", current->episode_id);
            return RetryDecision::kSKIPPED;
        }

        if (error.code == ErrorCode::kINSUFFICIENT_SPACE)
        {
            // surfaced to the caller, a full disk is not fixed by waiting
            if (current->status == EpisodeStatus::kDOWNLOADING)
            {
                update.status = EpisodeStatus::kPENDING;
                update.progress = 0;
            }
            m_store.update(current->id, update);
            return RetryDecision::kSKIPPED;
        }

        if (!m_policy.is_retryable(error) || !m_policy.should_retry(*current))
        {
            cancel(current->episode_id);
            update.status = EpisodeStatus::kFAILED;
            m_store.update(current->id, update);
            spdlog::error("Episode {} marked as failed after {} retries: {}",
                          current->episode_id,
                          current->retry_count,
                          reason);
            return RetryDecision::kFAILED;
        }

        const int attempt = current->retry_count + 1;
        update.status = EpisodeStatus::kPENDING;
        update.progress = 0;
        update.retry_count = attempt;
        auto updated = m_store.update(current->id, update);

        const auto wait = m_policy.delay(attempt);
        spdlog::info("Retrying episode {} in {} ms (attempt {}/{})",
                     current->episode_id,
                     wait.count(),
                     attempt,
                     m_policy.options().max_attempts);
        arm(updated.value_or(*current), wait, std::move(resume));
        return RetryDecision::kSCHEDULED;
    }

    void RetryScheduler::arm(const Episode& episode,
                             std::chrono::milliseconds delay,
                             resume_callback_t resume)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopped)
            {
                spdlog::warn("Retry scheduler stopped, episode {} not rescheduled",
                             episode.episode_id);
                return;
            }

            Timer timer;
            timer.row_id = episode.id;
            timer.due = std::chrono::steady_clock::now() + delay;
            timer.due_wall = clock_type::now()
                             + std::chrono::duration_cast<clock_type::duration>(delay);
            timer.resume = std::move(resume);
            // replaces any timer already armed for this episode
            m_timers[episode.episode_id] = std::move(timer);
        }
        m_cv.notify_all();
    }

    void RetryScheduler::timer_loop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stopped)
        {
            if (m_timers.empty())
            {
                m_cv.wait(lock);
                continue;
            }

            auto next = std::min_element(m_timers.begin(),
                                         m_timers.end(),
                                         [](const auto& lhs, const auto& rhs)
                                         { return lhs.second.due < rhs.second.due; });

            if (next->second.due > std::chrono::steady_clock::now())
            {
                m_cv.wait_until(lock, next->second.due);
                continue;
            }

            const std::int64_t episode_id = next->first;
            Timer timer = std::move(next->second);
            m_timers.erase(next);
            m_firing.insert(episode_id);

            // `fire` takes the episode lock, so `m_mutex` is released first
            lock.unlock();
            fire(timer);
            lock.lock();

            m_firing.erase(episode_id);
            m_cv.notify_all();
        }
    }

    void RetryScheduler::fire(const Timer& timer)
    {
        auto episode = m_store.get_by_id(timer.row_id);
        if (!episode)
        {
            spdlog::warn("Retry timer fired for unknown episode row {}", timer.row_id);
            return;
        }
        if (episode->status != EpisodeStatus::kPENDING)
        {
            spdlog::debug("Episode {} is {}, dropping retry",
                          episode->episode_id,
                          to_string(episode->status));
            return;
        }

        spdlog::info("Retry timer fired for episode {}", episode->episode_id);

        tl::expected<void, DownloadError> result;
        try
        {
            result = timer.resume(*episode);
        }
        catch (const std::exception& e)
        {
            result = tl::unexpected(DownloadError{ ErrorCode::kIO, ErrorLevel::SERIOUS, e.what() });
        }

        if (!result)
        {
            // a failed resume is one more failed attempt, handled as a new transition
            auto latest = m_store.get_by_id(timer.row_id);
            on_failure(latest.value_or(*episode), result.error(), timer.resume);
        }
    }

    bool RetryScheduler::cancel(std::int64_t episode_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_timers.erase(episode_id) != 0;
    }

    std::size_t RetryScheduler::cancel_all()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::size_t count = m_timers.size();
        m_timers.clear();
        return count;
    }

    tl::expected<void, DownloadError> RetryScheduler::force_now(const Episode& episode,
                                                                const resume_callback_t& resume)
    {
        cancel(episode.episode_id);

        std::optional<Episode> updated;
        {
            auto guard = m_locks.lock(episode.episode_id);
            EpisodeUpdate update;
            update.status = EpisodeStatus::kPENDING;
            update.last_error = std::string();
            updated = m_store.update(episode.id, update);
        }
        if (!updated)
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kNOT_FOUND,
                ErrorLevel::FATAL,
                fmt::format("Episode {} not found in store", episode.episode_id) });
        }

        spdlog::info("Retrying episode {} now", episode.episode_id);
        return resume(*updated);
    }

    std::optional<Episode> RetryScheduler::reset(const Episode& episode)
    {
        auto guard = m_locks.lock(episode.episode_id);
        cancel(episode.episode_id);

        EpisodeUpdate update;
        update.retry_count = 0;
        update.last_error = std::string();
        return m_store.update(episode.id, update);
    }

    bool RetryScheduler::has_scheduled(std::int64_t episode_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_timers.count(episode_id) != 0;
    }

    std::set<std::int64_t> RetryScheduler::scheduled_ids() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::set<std::int64_t> ids;
        for (const auto& [id, timer] : m_timers)
            ids.insert(id);
        return ids;
    }

    std::size_t RetryScheduler::scheduled_count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t count = m_timers.size();
        for (auto id : m_firing)
        {
            if (m_timers.count(id) == 0)
                ++count;
        }
        return count;
    }

    std::optional<clock_type::time_point> RetryScheduler::next_retry(std::int64_t episode_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_timers.find(episode_id);
        if (it == m_timers.end())
            return std::nullopt;
        return it->second.due_wall;
    }

    std::vector<Episode> RetryScheduler::pending_retries() const
    {
        std::vector<Episode> result;
        for (auto& episode : m_store.get_by_status(EpisodeStatus::kPENDING))
        {
            if (episode.retry_count > 0 && m_policy.should_retry(episode))
                result.push_back(std::move(episode));
        }
        return result;
    }

    RetryStats RetryScheduler::stats() const
    {
        RetryStats stats;
        stats.scheduled_retries = scheduled_ids().size();
        stats.max_attempts = m_policy.options().max_attempts;

        std::size_t retried = 0;
        long total = 0;
        for (const auto& episode : m_store.get_all())
        {
            if (episode.status == EpisodeStatus::kFAILED)
                ++stats.failed_episodes;
            if (episode.retry_count > 0)
            {
                ++retried;
                total += episode.retry_count;
            }
        }
        if (retried > 0)
            stats.average_retry_count = static_cast<double>(total) / retried;
        return stats;
    }
}
