#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include <podloader/episode_store.hpp>
#include <podloader/naming.hpp>
#include <podloader/pipeline.hpp>

namespace podloader
{
    namespace
    {
        DownloadError not_found(std::int64_t episode_id)
        {
            return DownloadError{ ErrorCode::kNOT_FOUND,
                                  ErrorLevel::FATAL,
                                  fmt::format("Episode {} not found in store", episode_id) };
        }

        void create_directory(const fs::path& dir)
        {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec)
            {
                spdlog::error("Could not create directory {}: {}", dir.string(), ec.message());
            }
        }
    }

    Pipeline::Pipeline(const Context& ctx,
                       EpisodeStore& store,
                       std::shared_ptr<StorageMonitor> storage)
        : m_ctx(ctx)
        , m_store(store)
        , m_storage(std::move(storage))
        , m_stager(ctx)
        , m_engine(ctx, store, *m_storage, m_locks)
        , m_scheduler(ctx.retry, store, m_locks)
        , m_queue(static_cast<std::size_t>(ctx.max_parallel_downloads),
                  [this](const Episode& episode) { return run_attempt(episode); })
    {
        podloader::create_directory(m_ctx.download_dir);
        podloader::create_directory(m_ctx.done_dir());
    }

    Pipeline::~Pipeline()
    {
        stop();
    }

    void Pipeline::stop()
    {
        m_scheduler.stop();
        m_engine.cancel_all();
        m_queue.stop();
    }

    std::optional<Episode> Pipeline::find(const Episode& episode) const
    {
        if (episode.id != 0)
        {
            if (auto found = m_store.get_by_id(episode.id))
                return found;
        }
        return m_store.get_by_episode_id(episode.episode_id);
    }

    DownloadResult Pipeline::run_attempt(const Episode& episode)
    {
        auto latest = find(episode);
        if (!latest)
            return tl::unexpected(not_found(episode.episode_id));

        emit(QueueEvent{ QueueEventType::kSTARTED, *latest, std::nullopt, std::nullopt });

        auto result = m_engine.download(*latest);
        if (result)
        {
            // a success wipes the retry history
            auto done = m_scheduler.reset(*latest);
            emit(QueueEvent{
                QueueEventType::kCOMPLETED, done.value_or(*latest), result.value(), std::nullopt });
            return result;
        }

        // the retry decision is recorded before listeners hear about the failure
        const auto failed = find(*latest).value_or(*latest);
        m_scheduler.on_failure(
            failed, result.error(), [this](const Episode& e) { return resubmit(e); });
        emit(QueueEvent{
            QueueEventType::kFAILED, find(*latest).value_or(failed), std::nullopt, result.error() });
        return result;
    }

    tl::expected<void, DownloadError> Pipeline::resubmit(const Episode& episode)
    {
        // only the refusal is reported here, the outcome of the attempt itself
        // goes through `run_attempt`
        auto submitted = m_queue.try_submit(episode);
        if (!submitted)
            return tl::unexpected(submitted.error());
        return {};
    }

    DownloadResult Pipeline::download(const Episode& episode)
    {
        return enqueue(episode).get();
    }

    std::shared_future<DownloadResult> Pipeline::enqueue(const Episode& episode)
    {
        return m_queue.submit(episode);
    }

    std::size_t Pipeline::enqueue_pending()
    {
        std::size_t count = 0;
        for (const auto& episode : m_store.get_by_status(EpisodeStatus::kPENDING))
        {
            if (m_scheduler.has_scheduled(episode.episode_id)
                || m_engine.is_active(episode.episode_id))
                continue;
            m_queue.submit(episode);
            ++count;
        }
        spdlog::info("Queued {} pending episodes", count);
        return count;
    }

    bool Pipeline::cancel(std::int64_t episode_id)
    {
        {
            // a cancelled episode is not brought back by `resume`
            std::lock_guard<std::mutex> lock(m_paused_mutex);
            m_paused_ids.erase(std::remove(m_paused_ids.begin(), m_paused_ids.end(), episode_id),
                               m_paused_ids.end());
        }
        bool cancelled = m_scheduler.cancel(episode_id);
        cancelled = m_queue.remove(episode_id) || cancelled;
        cancelled = m_engine.cancel(episode_id) || cancelled;
        return cancelled;
    }

    void Pipeline::cancel_all()
    {
        {
            std::lock_guard<std::mutex> lock(m_paused_mutex);
            m_paused_ids.clear();
        }
        m_scheduler.cancel_all();
        for (const auto& episode : m_store.get_by_status(EpisodeStatus::kPENDING))
            m_queue.remove(episode.episode_id);
        m_engine.cancel_all();
    }

    DownloadResult Pipeline::retry_now(const Episode& episode)
    {
        auto current = find(episode);
        if (!current)
            return tl::unexpected(not_found(episode.episode_id));

        const int max_attempts = m_scheduler.policy().options().max_attempts;
        if (current->retry_count >= max_attempts)
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kRETRIES_EXHAUSTED,
                ErrorLevel::FATAL,
                fmt::format("Episode {} used all {} attempts, reset it first",
                            current->episode_id,
                            max_attempts) });
        }

        if (m_engine.is_active(current->episode_id))
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kALREADY_ACTIVE,
                ErrorLevel::INFO,
                fmt::format("Episode {} is already downloading", current->episode_id) });
        }

        DownloadResult outcome = tl::unexpected(not_found(current->episode_id));
        auto forced = m_scheduler.force_now(
            *current,
            [this, &outcome](const Episode& e) -> tl::expected<void, DownloadError>
            {
                outcome = m_queue.submit(e).get();
                if (!outcome)
                    return tl::unexpected(outcome.error());
                return {};
            });

        if (!forced && forced.error().code == ErrorCode::kNOT_FOUND)
            return tl::unexpected(forced.error());
        return outcome;
    }

    std::optional<Episode> Pipeline::reset(const Episode& episode)
    {
        auto current = find(episode);
        if (!current)
            return std::nullopt;
        return m_scheduler.reset(*current);
    }

    ReconcileReport Pipeline::reconcile()
    {
        return m_stager.reconcile(m_store, m_locks);
    }

    std::size_t Pipeline::recover_interrupted()
    {
        std::size_t recovered = 0;
        for (const auto& episode : m_store.get_by_status(EpisodeStatus::kDOWNLOADING))
        {
            if (m_engine.is_active(episode.episode_id))
                continue;

            auto guard = m_locks.lock(episode.episode_id);
            EpisodeUpdate update;
            update.status = EpisodeStatus::kPENDING;
            update.progress = 0;
            if (m_store.update(episode.id, update))
            {
                m_stager.cleanup(temp_path(episode, m_ctx.download_dir));
                spdlog::info("Recovered interrupted download of episode {}", episode.episode_id);
                ++recovered;
            }
        }
        return recovered;
    }

    tl::expected<Episode, DownloadError> Pipeline::mark_transcribed(std::int64_t episode_id)
    {
        auto guard = m_locks.lock(episode_id);
        auto episode = m_store.get_by_episode_id(episode_id);
        if (!episode)
            return tl::unexpected(not_found(episode_id));

        if (episode->status != EpisodeStatus::kDOWNLOADED
            && episode->status != EpisodeStatus::kTRANSCRIBING)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kIO,
                                                 ErrorLevel::INFO,
                                                 fmt::format("Episode {} is {}, nothing to move",
                                                             episode_id,
                                                             to_string(episode->status)) });
        }

        auto moved = m_stager.move_to_done(episode->local_path);
        if (!moved)
            return tl::unexpected(moved.error());

        EpisodeUpdate update;
        update.status = EpisodeStatus::kTRANSCRIBED;
        update.local_path = moved->string();
        auto updated = m_store.update(episode->id, update);
        if (!updated)
            return tl::unexpected(not_found(episode_id));
        return *updated;
    }

    tl::expected<Episode, DownloadError> Pipeline::restore_from_done(std::int64_t episode_id)
    {
        auto guard = m_locks.lock(episode_id);
        auto episode = m_store.get_by_episode_id(episode_id);
        if (!episode)
            return tl::unexpected(not_found(episode_id));

        if (episode->status != EpisodeStatus::kTRANSCRIBED)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kIO,
                                                 ErrorLevel::INFO,
                                                 fmt::format("Episode {} is {}, not in {}",
                                                             episode_id,
                                                             to_string(episode->status),
                                                             m_ctx.done_dirname) });
        }

        auto moved = m_stager.move_back(episode->local_path);
        if (!moved)
            return tl::unexpected(moved.error());

        EpisodeUpdate update;
        update.status = EpisodeStatus::kDOWNLOADED;
        update.local_path = moved->string();
        auto updated = m_store.update(episode->id, update);
        if (!updated)
            return tl::unexpected(not_found(episode_id));
        return *updated;
    }

    StorageReport Pipeline::validate_storage() const
    {
        StorageReport report = m_storage->validate(m_ctx.download_dir);

        std::error_code ec;
        if (fs::exists(m_ctx.done_dir(), ec))
        {
            auto done = m_storage->validate(m_ctx.done_dir());
            report.ok = report.ok && done.ok;
            report.issues.insert(report.issues.end(), done.issues.begin(), done.issues.end());
        }

        if (!m_storage->has_space(m_ctx.download_dir, m_ctx.required_space))
        {
            report.ok = false;
            report.issues.push_back(
                fmt::format("Insufficient disk space in {}", m_ctx.download_dir.string()));
        }
        return report;
    }

    std::size_t Pipeline::subscribe(progress_callback_t observer)
    {
        return m_engine.subscribe(std::move(observer));
    }

    void Pipeline::unsubscribe(std::size_t token)
    {
        m_engine.unsubscribe(token);
    }

    std::size_t Pipeline::add_listener(queue_callback_t listener)
    {
        std::lock_guard<std::mutex> lock(m_listeners_mutex);
        const std::size_t token = m_next_token++;
        m_listeners.emplace(token, std::move(listener));
        return token;
    }

    void Pipeline::remove_listener(std::size_t token)
    {
        std::lock_guard<std::mutex> lock(m_listeners_mutex);
        m_listeners.erase(token);
    }

    void Pipeline::emit(const QueueEvent& event)
    {
        std::map<std::size_t, queue_callback_t> listeners;
        {
            std::lock_guard<std::mutex> lock(m_listeners_mutex);
            listeners = m_listeners;
        }
        for (auto& [token, listener] : listeners)
        {
            try
            {
                listener(event);
            }
            catch (const std::exception& e)
            {
                spdlog::error("Queue listener {} failed: {}", token, e.what());
            }
        }
    }

    std::size_t Pipeline::pause()
    {
        if (!m_queue.pause())
            return 0;

        std::vector<std::int64_t> active;
        auto cancel_active = [&]()
        {
            for (auto id : m_engine.active_ids())
            {
                if (std::find(active.begin(), active.end(), id) == active.end())
                    active.push_back(id);
                m_engine.cancel(id);
            }
        };
        cancel_active();

        // the cancelled attempts record their pending status before the jobs
        // return. A job admitted right before the pause may register late.
        if (!m_queue.is_worker_thread())
        {
            while (!m_queue.wait_running_for(std::chrono::milliseconds(50)))
                cancel_active();
        }

        {
            std::lock_guard<std::mutex> lock(m_paused_mutex);
            m_paused_ids.insert(m_paused_ids.end(), active.begin(), active.end());
        }

        for (auto id : active)
        {
            if (auto episode = m_store.get_by_episode_id(id))
                emit(QueueEvent{ QueueEventType::kPAUSED, *episode, std::nullopt, std::nullopt });
        }
        spdlog::info("Paused downloads, {} transfers cancelled", active.size());
        return active.size();
    }

    std::size_t Pipeline::resume()
    {
        if (!m_queue.paused())
            return 0;

        std::vector<std::int64_t> ids;
        {
            std::lock_guard<std::mutex> lock(m_paused_mutex);
            ids.swap(m_paused_ids);
        }

        // pushed to the front in reverse so that they keep their order
        std::vector<Episode> requeued;
        for (auto it = ids.rbegin(); it != ids.rend(); ++it)
        {
            auto episode = m_store.get_by_episode_id(*it);
            if (!episode || episode->status != EpisodeStatus::kPENDING)
                continue;
            m_queue.submit_front(*episode);
            requeued.push_back(*episode);
        }
        m_queue.resume();

        for (auto it = requeued.rbegin(); it != requeued.rend(); ++it)
            emit(QueueEvent{ QueueEventType::kRESUMED, *it, std::nullopt, std::nullopt });
        return requeued.size();
    }

    bool Pipeline::paused() const
    {
        return m_queue.paused();
    }

    QueueStats Pipeline::stats() const
    {
        QueueStats stats;
        for (const auto& episode : m_store.get_all())
        {
            ++stats.total_episodes;
            if (episode.status == EpisodeStatus::kDOWNLOADED)
                ++stats.completed;
            else if (episode.status == EpisodeStatus::kFAILED)
                ++stats.failed;
        }
        stats.queued = m_queue.queued();
        stats.downloading = m_engine.active_ids().size();
        if (m_queue.paused())
            stats.paused = stats.queued;
        return stats;
    }

    bool Pipeline::idle() const
    {
        // a finishing job may arm a timer between the two reads
        return m_scheduler.scheduled_count() == 0 && m_queue.idle()
               && m_scheduler.scheduled_count() == 0;
    }

    void Pipeline::wait_idle()
    {
        // retry timers re-enter the queue, so both have to be drained together
        while (!idle())
        {
            m_queue.wait_idle_for(std::chrono::milliseconds(100));
            if (m_queue.idle() && m_scheduler.scheduled_count() != 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}
