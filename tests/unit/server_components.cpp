#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "resumable/error_codes.hpp"
#include "resumable/server/deleter.hpp"
#include "resumable/server/filesystem.hpp"
#include "resumable/server/identity.hpp"
#include "resumable/server/state_cache.hpp"
#include "resumable/server/state_store.hpp"
#include "resumable/server/upload_state.hpp"
#include "resumable/server/write_behind_queue.hpp"

using namespace resumable;
using namespace resumable::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / name;
        cleanup_path(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void write_text(const std::filesystem::path &path, const std::string &text)
    {
        std::ofstream out(path, std::ios::trunc);
        out << text;
    }

    void test_store_roundtrip()
    {
        const auto dir = fresh_dir("resumable_store_roundtrip");
        const auto artifact = StateStore::artifact_path(dir);
        StateStore store;

        UploadState state;
        state.track_file("f1", 1000);
        state.track_file("f2", 42);
        const bool updated = state.update_file("f1", [](FileUploadState &file)
                                               { file.crced_bytes = 600; });
        assert(updated);

        const bool written = store.write(state, artifact);
        assert(written);
        assert(std::filesystem::exists(artifact));

        UploadState restored;
        const auto result = store.read(artifact, restored);
        assert(result.ok());
        assert(restored.file_count() == 2);
        const auto f1 = restored.file("f1");
        assert(f1);
        assert(f1->crced_bytes == 600);
        assert(f1->original_file_size_in_bytes == 1000);
        assert(restored.file("f2")->original_file_size_in_bytes == 42);

        // No temp files survive a successful write.
        std::size_t entries = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            (void)entry;
            ++entries;
        }
        assert(entries == 1);

        cleanup_path(dir);
    }

    void test_store_read_failures()
    {
        const auto dir = fresh_dir("resumable_store_failures");
        const auto artifact = StateStore::artifact_path(dir);
        StateStore store;

        UploadState target;
        target.track_file("keep", 5);

        const auto missing = store.read(artifact, target);
        assert(missing.error == ErrorCode::NotFound);

        write_text(artifact, "");
        assert(store.read(artifact, target).error == ErrorCode::CorruptArtifact);

        write_text(artifact, "{\"schema\": \"resumable.upload_state\", \"version\": 1, \"body\": {");
        assert(store.read(artifact, target).error == ErrorCode::CorruptArtifact);

        UploadState state;
        state.track_file("f1", 1000);
        const bool written = store.write(state, artifact);
        assert(written);

        nlohmann::json envelope;
        {
            std::ifstream in(artifact);
            in >> envelope;
        }

        auto tampered = envelope;
        tampered["body"]["files"]["f1"]["crced_bytes"] = 999;
        write_text(artifact, tampered.dump());
        assert(store.read(artifact, target).error == ErrorCode::CorruptArtifact);

        auto future_version = envelope;
        future_version["version"] = StateStore::kSchemaVersion + 1;
        write_text(artifact, future_version.dump());
        assert(store.read(artifact, target).error == ErrorCode::SchemaMismatch);

        auto foreign = envelope;
        foreign["schema"] = "something.else";
        write_text(artifact, foreign.dump());
        assert(store.read(artifact, target).error == ErrorCode::SchemaMismatch);

        // Failed reads leave the target as it was.
        assert(target.file_count() == 1);
        assert(target.file("keep"));

        cleanup_path(dir);
    }

    void test_store_write_failure_is_reported()
    {
        const auto dir = fresh_dir("resumable_store_write_failure");
        StateStore store;
        UploadState state;
        const bool written = store.write(state, dir / "missing" / StateStore::kArtifactName);
        assert(!written);
        cleanup_path(dir);
    }

    void test_store_create_and_quarantine()
    {
        const auto dir = fresh_dir("resumable_store_create");
        const auto artifact = StateStore::artifact_path(dir);
        StateStore store;

        store.create(artifact);
        assert(std::filesystem::exists(artifact));
        assert(std::filesystem::file_size(artifact) == 0);

        const auto moved = store.quarantine(artifact);
        assert(!moved.empty());
        assert(!std::filesystem::exists(artifact));
        assert(std::filesystem::exists(moved));

        bool caught = false;
        try
        {
            store.create(dir / "missing" / StateStore::kArtifactName);
        }
        catch (const UploadStateError &error)
        {
            caught = error.code() == ErrorCode::ArtifactCreateFailed;
        }
        assert(caught);

        assert(StateStore::is_artifact_name("upload_state.json"));
        assert(StateStore::is_artifact_name("upload_state.json.corrupt"));
        assert(StateStore::is_artifact_name("upload_state.json.tmp-1f-3"));
        assert(!StateStore::is_artifact_name("upload.part"));

        cleanup_path(dir);
    }

    void test_cache_single_flight()
    {
        std::atomic<int> loads{0};
        StateCache cache([&](const std::string &)
                         {
                             ++loads;
                             std::this_thread::sleep_for(std::chrono::milliseconds(50));
                             return std::make_shared<UploadState>(); },
                         std::chrono::hours(24));

        constexpr int kThreads = 8;
        std::vector<std::shared_ptr<UploadState>> seen(kThreads);
        std::vector<std::thread> threads;
        for (int i = 0; i < kThreads; ++i)
        {
            threads.emplace_back([&, i]
                                 { seen[i] = cache.get("u1"); });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        assert(loads.load() == 1);
        for (const auto &entity : seen)
        {
            assert(entity);
            assert(entity == seen.front());
        }
        assert(cache.get("u1") == seen.front());
        assert(cache.size() == 1);
    }

    void test_cache_presence_and_invalidate()
    {
        int loads = 0;
        StateCache cache([&](const std::string &)
                         {
                             ++loads;
                             return std::make_shared<UploadState>(); },
                         std::chrono::hours(24));

        assert(!cache.get_if_present("u1"));
        auto first = cache.get("u1");
        assert(cache.get_if_present("u1") == first);

        auto replacement = std::make_shared<UploadState>();
        cache.put("u1", replacement);
        assert(cache.get("u1") == replacement);

        cache.invalidate("u1");
        assert(!cache.get_if_present("u1"));
        auto reloaded = cache.get("u1");
        assert(reloaded != first);
        assert(reloaded != replacement);
        assert(loads == 2);
    }

    void test_cache_idle_expiry()
    {
        auto now = StateCache::Clock::now();
        int loads = 0;
        StateCache cache([&](const std::string &)
                         {
                             ++loads;
                             return std::make_shared<UploadState>(); },
                         std::chrono::hours(24), [&]
                         { return now; });

        auto entity = cache.get("u1");
        now += std::chrono::hours(23);
        assert(cache.get_if_present("u1") == entity);
        now += std::chrono::hours(23);
        assert(cache.get_if_present("u1") == entity);
        now += std::chrono::hours(25);
        assert(!cache.get_if_present("u1"));

        cache.get("u1");
        cache.get("u2");
        now += std::chrono::hours(24);
        assert(cache.cleanup_expired() == 2);
        assert(cache.size() == 0);
        assert(loads == 3);
    }

    void test_cache_failed_load_is_not_cached()
    {
        int loads = 0;
        StateCache cache([&](const std::string &) -> StateCache::Entity
                         {
                             if (++loads == 1)
                             {
                                 throw UploadStateError(ErrorCode::CorruptArtifact, "bad artifact");
                             }
                             return std::make_shared<UploadState>(); },
                         std::chrono::hours(24));

        bool caught = false;
        try
        {
            cache.get("u1");
        }
        catch (const UploadStateError &error)
        {
            caught = error.code() == ErrorCode::CorruptArtifact;
        }
        assert(caught);
        assert(!cache.get_if_present("u1"));
        assert(cache.get("u1"));
        assert(loads == 2);
    }

    // Occupies the worker until released so the test controls what is pending.
    struct Gate
    {
        std::promise<void> started;
        std::promise<void> release;
        std::shared_future<void> released{release.get_future().share()};

        WriteBehindQueue::Job job()
        {
            return [this]
            {
                started.set_value();
                released.wait();
            };
        }
    };

    void test_queue_order_and_coalescing()
    {
        std::mutex mutex;
        std::vector<std::string> executed;
        auto record = [&](std::string label)
        {
            return [&, label]
            {
                std::lock_guard lock(mutex);
                executed.push_back(label);
            };
        };

        WriteBehindQueue queue(16);
        Gate gate;
        auto started = gate.started.get_future();
        assert(queue.submit("gate", gate.job()));
        started.wait();

        assert(queue.submit("a", record("a1")));
        assert(queue.submit("b", record("b1")));
        assert(queue.submit("c", record("c1")));
        assert(queue.submit("a", record("a2")));
        assert(queue.pending() == 3);

        gate.release.set_value();
        queue.drain();
        assert(queue.pending() == 0);
        assert(executed == (std::vector<std::string>{"a2", "b1", "c1"}));
    }

    void test_queue_capacity_and_cancel()
    {
        std::atomic<int> runs{0};
        auto count = [&]
        { ++runs; };

        WriteBehindQueue queue(2);
        Gate gate;
        auto started = gate.started.get_future();
        assert(queue.submit("gate", gate.job()));
        started.wait();

        assert(queue.submit("x", count));
        assert(queue.submit("y", count));
        const bool overflowed = queue.submit("z", count);
        assert(!overflowed);
        assert(queue.submit("x", count));

        assert(queue.cancel("y"));
        assert(!queue.cancel("y"));
        assert(queue.pending() == 1);

        gate.release.set_value();
        queue.drain();
        assert(runs.load() == 1);
    }

    void test_queue_survives_failing_job()
    {
        std::atomic<bool> ran_after{false};
        WriteBehindQueue queue(4);
        assert(queue.submit("bad", []
                            { throw std::runtime_error("disk full"); }));
        assert(queue.submit("good", [&]
                            { ran_after = true; }));
        queue.drain();
        assert(ran_after.load());
    }

    void test_queue_destruction_runs_backlog()
    {
        std::atomic<int> runs{0};
        {
            WriteBehindQueue queue(8);
            for (int i = 0; i < 5; ++i)
            {
                queue.submit("k" + std::to_string(i), [&]
                             { ++runs; });
            }
        }
        assert(runs.load() == 5);
    }

    void test_identity_resolver()
    {
        ThreadIdentityResolver identity;
        assert(!identity.current());

        const auto issued = identity.identifier();
        assert(issued.size() == 32);
        assert(identity.identifier() == issued);

        {
            IdentityScope scope(identity, "u1");
            assert(identity.identifier() == "u1");

            std::string other_thread;
            std::thread([&]
                        { other_thread = identity.identifier(); })
                .join();
            assert(other_thread != "u1");
        }
        assert(identity.identifier() == issued);

        identity.clear_identifier();
        assert(!identity.current());
    }

    void test_directory_resolver()
    {
        const auto root = fresh_dir("resumable_paths");
        ThreadIdentityResolver identity;
        DirectoryPathResolver paths(root, identity);

        const auto dir = paths.directory("alice");
        assert(dir == root / "clients" / "alice");
        assert(std::filesystem::is_directory(dir));

        {
            IdentityScope scope(identity, "bob");
            assert(paths.directory() == root / "clients" / "bob");
        }

        for (const std::string bad : {"", ".", "..", "../escape", "a/b"})
        {
            bool caught = false;
            try
            {
                (void)paths.directory(bad);
            }
            catch (const UploadStateError &error)
            {
                caught = error.code() == ErrorCode::InvalidArgument;
            }
            assert(caught);
        }

        cleanup_path(root);
    }

    void test_async_deleter()
    {
        const auto root = fresh_dir("resumable_deleter");
        std::filesystem::create_directories(root / "client" / "nested");
        write_text(root / "client" / "nested" / "data.part", "abc");
        write_text(root / "single.part", "abc");

        AsyncDeleter deleter(2);
        deleter.delete_path(root / "client");
        deleter.delete_paths({root / "single.part", root / "never-existed"});
        deleter.wait_idle();

        assert(!std::filesystem::exists(root / "client"));
        assert(!std::filesystem::exists(root / "single.part"));

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_store_roundtrip();
    test_store_read_failures();
    test_store_write_failure_is_reported();
    test_store_create_and_quarantine();
    test_cache_single_flight();
    test_cache_presence_and_invalidate();
    test_cache_idle_expiry();
    test_cache_failed_load_is_not_cached();
    test_queue_order_and_coalescing();
    test_queue_capacity_and_cancel();
    test_queue_survives_failing_job();
    test_queue_destruction_runs_backlog();
    test_identity_resolver();
    test_directory_resolver();
    test_async_deleter();
}
