#include <algorithm>

#include <spdlog/spdlog.h>

#include <podloader/download_queue.hpp>

namespace podloader
{
    DownloadQueue::DownloadQueue(std::size_t max_parallel, job_t job)
        : m_job(std::move(job))
    {
        // one worker per admitted transfer, the pool size is the admission cap
        max_parallel = std::max<std::size_t>(max_parallel, 1);
        m_workers.reserve(max_parallel);
        for (std::size_t i = 0; i < max_parallel; ++i)
            m_workers.emplace_back(&DownloadQueue::worker_loop, this);
    }

    DownloadQueue::~DownloadQueue()
    {
        stop();
    }

    DownloadError DownloadQueue::cancelled_error(std::int64_t episode_id)
    {
        return DownloadError{ ErrorCode::kCANCELLED,
                              ErrorLevel::INFO,
                              fmt::format("Episode {} removed from the queue", episode_id) };
    }

    DownloadQueue::future_t DownloadQueue::refused(DownloadError error)
    {
        std::promise<DownloadResult> promise;
        promise.set_value(tl::unexpected(std::move(error)));
        return promise.get_future().share();
    }

    tl::expected<DownloadQueue::future_t, DownloadError> DownloadQueue::enqueue(
        const Episode& episode, bool front)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_stopped)
        {
            DownloadError error = cancelled_error(episode.episode_id);
            error.reason = fmt::format("Queue stopped, episode {} refused", episode.episode_id);
            return tl::unexpected(error);
        }

        // only waiting entries are de-duplicated, a running one may be queued again
        for (const auto& entry : m_queue)
        {
            if (entry->episode.episode_id == episode.episode_id)
                return entry->future;
        }

        auto entry = std::make_shared<Entry>();
        entry->episode = episode;
        entry->future = entry->promise.get_future().share();
        if (front)
            m_queue.push_front(entry);
        else
            m_queue.push_back(entry);
        spdlog::debug("Queued episode {} ({} waiting)", episode.episode_id, m_queue.size());

        m_work.notify_one();
        return entry->future;
    }

    tl::expected<DownloadQueue::future_t, DownloadError> DownloadQueue::try_submit(
        const Episode& episode)
    {
        return enqueue(episode, false);
    }

    DownloadQueue::future_t DownloadQueue::submit(const Episode& episode)
    {
        auto submitted = enqueue(episode, false);
        if (!submitted)
            return refused(submitted.error());
        return submitted.value();
    }

    DownloadQueue::future_t DownloadQueue::submit_front(const Episode& episode)
    {
        auto submitted = enqueue(episode, true);
        if (!submitted)
            return refused(submitted.error());
        return submitted.value();
    }

    bool DownloadQueue::remove(std::int64_t episode_id)
    {
        std::shared_ptr<Entry> removed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = std::find_if(m_queue.begin(),
                                   m_queue.end(),
                                   [&](const auto& entry)
                                   { return entry->episode.episode_id == episode_id; });
            if (it == m_queue.end())
                return false;
            removed = *it;
            m_queue.erase(it);
        }
        removed->promise.set_value(tl::unexpected(cancelled_error(episode_id)));
        m_idle.notify_all();
        return true;
    }

    bool DownloadQueue::pause()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_paused || m_stopped)
            return false;
        m_paused = true;
        spdlog::info("Download queue paused ({} waiting)", m_queue.size());
        return true;
    }

    bool DownloadQueue::resume()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_paused)
                return false;
            m_paused = false;
            spdlog::info("Download queue resumed ({} waiting)", m_queue.size());
        }
        m_work.notify_all();
        return true;
    }

    bool DownloadQueue::paused() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_paused;
    }

    bool DownloadQueue::is_queued(std::int64_t episode_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_queue.begin(),
                           m_queue.end(),
                           [&](const auto& entry)
                           { return entry->episode.episode_id == episode_id; });
    }

    std::size_t DownloadQueue::queued() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    std::size_t DownloadQueue::running() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running.size();
    }

    std::size_t DownloadQueue::peak_running() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peak_running;
    }

    bool DownloadQueue::idle() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty() && m_running.empty();
    }

    void DownloadQueue::wait_idle()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [&]() { return m_queue.empty() && m_running.empty(); });
    }

    bool DownloadQueue::wait_idle_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idle.wait_for(
            lock, timeout, [&]() { return m_queue.empty() && m_running.empty(); });
    }

    bool DownloadQueue::wait_running_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idle.wait_for(lock, timeout, [&]() { return m_running.empty(); });
    }

    bool DownloadQueue::is_worker_thread() const
    {
        const auto self = std::this_thread::get_id();
        return std::any_of(m_workers.begin(),
                           m_workers.end(),
                           [&](const std::thread& worker) { return worker.get_id() == self; });
    }

    void DownloadQueue::worker_loop()
    {
        for (;;)
        {
            std::shared_ptr<Entry> entry;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_work.wait(lock,
                            [&]() { return m_stopped || (!m_paused && !m_queue.empty()); });
                if (m_stopped)
                    return;

                // moved to running under the same lock, `idle` never misses it
                entry = m_queue.front();
                m_queue.pop_front();
                m_running.push_back(entry);
                m_peak_running = std::max(m_peak_running, m_running.size());
            }

            // the job runs without the queue lock, it may submit again
            DownloadResult result;
            try
            {
                result = m_job(entry->episode);
            }
            catch (const std::exception& e)
            {
                spdlog::error("Download job for episode {} threw: {}",
                              entry->episode.episode_id,
                              e.what());
                result = tl::unexpected(DownloadError{ ErrorCode::kIO, ErrorLevel::SERIOUS, e.what() });
            }
            entry->promise.set_value(std::move(result));

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_running.erase(std::find(m_running.begin(), m_running.end(), entry));
            }
            m_idle.notify_all();
        }
    }

    void DownloadQueue::stop()
    {
        std::deque<std::shared_ptr<Entry>> dropped;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopped)
                return;
            m_stopped = true;
            dropped.swap(m_queue);
        }
        m_work.notify_all();

        for (auto& worker : m_workers)
        {
            if (worker.joinable())
                worker.join();
        }

        for (auto& entry : dropped)
            entry->promise.set_value(tl::unexpected(cancelled_error(entry->episode.episode_id)));
        m_idle.notify_all();
    }
}
