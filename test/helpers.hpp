#ifndef PODLOADER_TEST_HELPERS_HPP
#define PODLOADER_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

#include <spdlog/fmt/fmt.h>
#include <unistd.h>

#include <podloader/episode.hpp>
#include <podloader/storage.hpp>

namespace podloader::testing
{
    namespace fs = std::filesystem;

    // Unique scratch directory removed on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<int> counter{ 0 };
            m_path = fs::temp_directory_path()
                     / fmt::format("podloader-test-{}-{}", ::getpid(), counter++);
            fs::remove_all(m_path);
            fs::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const
        {
            return m_path;
        }

    private:
        fs::path m_path;
    };

    inline void write_file(const fs::path& path, const std::string& content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    inline Episode make_episode(std::int64_t episode_id,
                                const std::string& url,
                                std::int64_t podcast_id = 7)
    {
        Episode ep;
        ep.episode_id = episode_id;
        ep.podcast_id = podcast_id;
        ep.podcast_name = "Test Podcast";
        ep.episode_title = fmt::format("Episode {}", episode_id);
        ep.published_date = "2024-03-15";
        ep.audio_url = url;
        return ep;
    }

    // Reports a fixed amount of free space.
    class FixedSpaceMonitor : public StorageMonitor
    {
    public:
        explicit FixedSpaceMonitor(std::uintmax_t available)
            : m_available(available)
        {
        }

        tl::expected<std::uintmax_t, std::error_code> available_space(
            const fs::path&) const override
        {
            return m_available.load();
        }

        void set(std::uintmax_t available)
        {
            m_available = available;
        }

    private:
        std::atomic<std::uintmax_t> m_available;
    };

    inline bool wait_for(const std::function<bool()>& predicate,
                         std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }
}

#endif
