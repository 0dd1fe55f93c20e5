#ifndef PODLOADER_LOCKS_HPP
#define PODLOADER_LOCKS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include <podloader/export.hpp>

namespace podloader
{
    // Registry of one mutex per episode identifier. Every read-modify-write of
    // an episode record happens under its lock.
    //
    // Entries are never erased: a returned lock may still be held or waited on
    // while its episode is reset or removed. The registry holds one mutex per
    // episode id seen by the process, so it is bounded by the catalogue.
    class PODLOADER_API EpisodeLocks
    {
    public:
        std::unique_lock<std::mutex> lock(std::int64_t episode_id)
        {
            std::mutex* m = nullptr;
            {
                std::lock_guard<std::mutex> guard(m_registry_mutex);
                auto& slot = m_locks[episode_id];
                if (!slot)
                    slot = std::make_unique<std::mutex>();
                m = slot.get();
            }
            return std::unique_lock<std::mutex>(*m);
        }

    private:
        std::mutex m_registry_mutex;
        std::map<std::int64_t, std::unique_ptr<std::mutex>> m_locks;
    };
}

#endif
