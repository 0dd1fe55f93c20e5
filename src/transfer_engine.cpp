#include <spdlog/spdlog.h>

#include <podloader/episode_store.hpp>
#include <podloader/locks.hpp>
#include <podloader/naming.hpp>
#include <podloader/storage.hpp>
#include <podloader/transfer_engine.hpp>
#include <podloader/url.hpp>
#include <podloader/utils.hpp>

namespace podloader
{
    TransferEngine::TransferEngine(const Context& ctx,
                                   EpisodeStore& store,
                                   const StorageMonitor& storage,
                                   EpisodeLocks& locks)
        : m_ctx(ctx)
        , m_store(store)
        , m_storage(storage)
        , m_locks(locks)
        , m_stager(ctx)
    {
    }

    TransferEngine::~TransferEngine()
    {
        cancel_all();
    }

    tl::expected<fs::path, DownloadError> TransferEngine::download(const Episode& episode)
    {
        if (auto valid = validate_url(m_ctx, episode.audio_url); !valid)
        {
            return tl::unexpected(valid.error());
        }

        // pre-flight, nothing is touched when it fails
        if (!m_storage.has_space(m_ctx.download_dir, m_ctx.required_space))
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kINSUFFICIENT_SPACE,
                ErrorLevel::SERIOUS,
                fmt::format("Insufficient disk space in {}, {} required",
                            m_ctx.download_dir.string(),
                            format_bytes(m_ctx.required_space + SPACE_SAFETY_BUFFER)) });
        }

        const fs::path temp = temp_path(episode, m_ctx.download_dir);
        const fs::path final = final_path(episode, m_ctx.download_dir);

        auto transfer = std::make_shared<Transfer>(
            m_ctx, episode, temp, [this, episode](const ProgressEvent& event) {
                on_progress(episode, event);
            });

        if (!register_transfer(transfer))
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kALREADY_ACTIVE,
                ErrorLevel::INFO,
                fmt::format("Episode {} is already downloading", episode.episode_id) });
        }

        {
            auto guard = m_locks.lock(episode.episode_id);
            EpisodeUpdate update;
            update.status = EpisodeStatus::kDOWNLOADING;
            update.progress = 0;
            if (!m_store.update(episode.id, update))
            {
                deregister_transfer(transfer);
                return tl::unexpected(DownloadError{
                    ErrorCode::kNOT_FOUND,
                    ErrorLevel::FATAL,
                    fmt::format("Episode {} not found in store", episode.episode_id) });
            }
        }

        spdlog::info("Downloading episode {} from {}", episode.episode_id, episode.audio_url);

        if (auto prepared = transfer->prepare(); !prepared)
        {
            return fail(transfer, reclassify_write_error(prepared.error()));
        }

        if (auto result = transfer->run(); !result)
        {
            return fail(transfer, reclassify_write_error(result.error()));
        }

        auto finalized = m_stager.finalize(temp, final);
        if (!finalized)
        {
            return fail(transfer, finalized.error());
        }

        {
            auto guard = m_locks.lock(episode.episode_id);
            EpisodeUpdate update;
            update.status = EpisodeStatus::kDOWNLOADED;
            update.progress = 100;
            update.local_path = final.string();
            update.last_error = std::string();
            m_store.update(episode.id, update);
        }

        const auto& effective_url = transfer->response().effective_url;
        if (!effective_url.empty() && effective_url != episode.audio_url)
        {
            spdlog::debug("Episode {} was redirected to {}", episode.episode_id, effective_url);
        }

        ProgressEvent done;
        done.episode_id = episode.episode_id;
        done.loaded = transfer->loaded();
        done.total = transfer->loaded();
        done.percentage = 100;
        done.speed = static_cast<double>(transfer->response().average_speed);
        done.eta = 0.0;

        deregister_transfer(transfer);
        notify(done);

        spdlog::info("Episode {} downloaded to {} ({})",
                     episode.episode_id,
                     final.string(),
                     format_bytes(transfer->loaded()));
        return final;
    }

    tl::expected<fs::path, DownloadError> TransferEngine::fail(
        const std::shared_ptr<Transfer>& transfer, DownloadError error)
    {
        m_stager.cleanup(transfer->temp_file());
        deregister_transfer(transfer);
        error.log();
        return tl::unexpected(std::move(error));
    }

    DownloadError TransferEngine::reclassify_write_error(DownloadError error) const
    {
        if (error.code != ErrorCode::kWRITE)
            return error;

        if (!m_storage.has_space(m_ctx.download_dir, 0))
        {
            error.code = ErrorCode::kINSUFFICIENT_SPACE;
            error.level = ErrorLevel::SERIOUS;
            error.reason = fmt::format("Disk full while writing: {}", error.reason);
            return error;
        }

        auto report = m_storage.validate(m_ctx.download_dir);
        if (!report.ok)
        {
            // the directory itself is broken, retrying would not help
            error.level = ErrorLevel::FATAL;
            for (const auto& issue : report.issues)
                error.reason += "; " + issue;
        }
        return error;
    }

    void TransferEngine::on_progress(const Episode& episode, const ProgressEvent& event)
    {
        {
            auto guard = m_locks.lock(episode.episode_id);
            EpisodeUpdate update;
            update.progress = event.percentage;
            m_store.update(episode.id, update);
        }
        notify(event);
    }

    void TransferEngine::notify(const ProgressEvent& event)
    {
        std::map<std::size_t, progress_callback_t> observers;
        {
            std::lock_guard<std::mutex> lock(m_observers_mutex);
            observers = m_observers;
        }
        for (auto& [token, observer] : observers)
        {
            try
            {
                observer(event);
            }
            catch (const std::exception& e)
            {
                spdlog::error("Progress observer {} failed: {}", token, e.what());
            }
        }
    }

    bool TransferEngine::register_transfer(const std::shared_ptr<Transfer>& transfer)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active.emplace(transfer->episode_id(), transfer).second;
    }

    void TransferEngine::deregister_transfer(const std::shared_ptr<Transfer>& transfer)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_active.find(transfer->episode_id());
            if (it != m_active.end() && it->second == transfer)
                m_active.erase(it);
        }
        m_teardown.notify_all();
    }

    bool TransferEngine::cancel(std::int64_t episode_id)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_active.find(episode_id);
        if (it == m_active.end())
            return false;

        auto transfer = it->second;
        spdlog::info("Cancelling download of episode {}", episode_id);
        transfer->cancel();

        // from a progress observer: the transfer unwinds once we return
        if (transfer->runs_on_this_thread())
            return true;

        m_teardown.wait(lock,
                        [&]()
                        {
                            auto found = m_active.find(episode_id);
                            return found == m_active.end() || found->second != transfer;
                        });
        lock.unlock();

        m_stager.cleanup(transfer->temp_file());
        return true;
    }

    std::size_t TransferEngine::cancel_all()
    {
        std::size_t count = 0;
        for (auto id : active_ids())
        {
            if (cancel(id))
                ++count;
        }
        return count;
    }

    bool TransferEngine::is_active(std::int64_t episode_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active.count(episode_id) != 0;
    }

    std::set<std::int64_t> TransferEngine::active_ids() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::set<std::int64_t> ids;
        for (const auto& [id, transfer] : m_active)
            ids.insert(id);
        return ids;
    }

    std::size_t TransferEngine::subscribe(progress_callback_t observer)
    {
        std::lock_guard<std::mutex> lock(m_observers_mutex);
        const std::size_t token = m_next_token++;
        m_observers.emplace(token, std::move(observer));
        return token;
    }

    void TransferEngine::unsubscribe(std::size_t token)
    {
        std::lock_guard<std::mutex> lock(m_observers_mutex);
        m_observers.erase(token);
    }
}
