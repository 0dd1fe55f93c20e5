#include <doctest/doctest.h>

#include <stdexcept>

#include <podloader/episode_store.hpp>

#include "helpers.hpp"

using namespace podloader;
using podloader::testing::TempDir;

TEST_SUITE("store")
{
    TEST_CASE("memory_insert_and_lookup")
    {
        MemoryEpisodeStore store;
        auto a = store.insert(testing::make_episode(10, "http://localhost/10.mp3"));
        auto b = store.insert(testing::make_episode(11, "http://localhost/11.mp3"));
        REQUIRE(a);
        REQUIRE(b);
        CHECK_NE(a->id, b->id);
        CHECK(a->created_at != clock_type::time_point{});

        // episode_id is unique
        CHECK_FALSE(store.insert(testing::make_episode(10, "http://localhost/other.mp3")));
        CHECK_EQ(store.size(), 2);

        CHECK_EQ(store.get_by_episode_id(11)->id, b->id);
        CHECK_EQ(store.get_by_id(a->id)->episode_id, 10);
        CHECK_FALSE(store.get_by_id(999));
        CHECK_FALSE(store.get_by_episode_id(999));
    }

    TEST_CASE("memory_update")
    {
        MemoryEpisodeStore store;
        auto ep = store.insert(testing::make_episode(10, "http://localhost/10.mp3"));
        REQUIRE(ep);

        EpisodeUpdate update;
        update.status = EpisodeStatus::kFAILED;
        update.last_error = "BadUrl: empty URL";
        auto updated = store.update(ep->id, update);
        REQUIRE(updated);
        CHECK_EQ(updated->status, EpisodeStatus::kFAILED);
        CHECK_EQ(store.get_by_status(EpisodeStatus::kFAILED).size(), 1);
        CHECK(store.get_by_status(EpisodeStatus::kPENDING).empty());

        CHECK_FALSE(store.update(12345, update));
    }

    TEST_CASE("json_persists_changes")
    {
        TempDir dir;
        const auto path = dir.path() / "episodes.json";
        std::int64_t id = 0;
        {
            JsonEpisodeStore store(path);
            auto ep = store.insert(testing::make_episode(10, "http://localhost/10.mp3"));
            REQUIRE(ep);
            id = ep->id;
            CHECK(fs::exists(path));

            EpisodeUpdate update;
            update.status = EpisodeStatus::kDOWNLOADED;
            update.local_path = "downloads/7_10_2024-03-15.mp3";
            store.update(id, update);
        }

        JsonEpisodeStore reloaded(path);
        CHECK_EQ(reloaded.size(), 1);
        auto ep = reloaded.get_by_id(id);
        REQUIRE(ep);
        CHECK_EQ(ep->status, EpisodeStatus::kDOWNLOADED);
        CHECK_EQ(ep->local_path, "downloads/7_10_2024-03-15.mp3");
        CHECK_FALSE(fs::exists(dir.path() / "episodes.json.tmp"));

        // new ids continue after the loaded ones
        auto next = reloaded.insert(testing::make_episode(11, "http://localhost/11.mp3"));
        REQUIRE(next);
        CHECK_GT(next->id, id);
    }

    TEST_CASE("json_progress_is_flushed_lazily")
    {
        TempDir dir;
        const auto path = dir.path() / "episodes.json";
        std::int64_t id = 0;
        {
            JsonEpisodeStore store(path);
            id = store.insert(testing::make_episode(10, "http://localhost/10.mp3"))->id;

            EpisodeUpdate progress;
            progress.progress = 55;
            store.update(id, progress);

            JsonEpisodeStore on_disk(path);
            CHECK_EQ(on_disk.get_by_id(id)->progress, 0);
        }
        // the destructor writes pending progress
        JsonEpisodeStore reloaded(path);
        CHECK_EQ(reloaded.get_by_id(id)->progress, 55);
    }

    TEST_CASE("json_invalid_file")
    {
        TempDir dir;
        const auto path = dir.path() / "episodes.json";

        testing::write_file(path, "{ not json");
        CHECK_THROWS_AS(JsonEpisodeStore{ path }, std::runtime_error);

        testing::write_file(path, R"({"episode_id": 1})");
        CHECK_THROWS_AS(JsonEpisodeStore{ path }, std::runtime_error);
    }
}
