#include "engine/SettingsPersistenceService.hpp"
#include "engine/SettingFile.hpp"

#include "TestUtils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using tp::engine::SaveResult;
using tp::engine::SettingDocument;
using tp::engine::SettingsPersistenceService;

namespace
{

using Clock = SettingsPersistenceService::Clock;

// Records every file operation instead of touching the disk.
struct Recorder
{
    std::mutex mutex;
    std::vector<std::string> events;
    std::vector<std::string> payloads;
    std::vector<Clock::time_point> save_times;
    std::vector<SaveResult> results;
    bool verify_result = true;
    bool backup_result = true;

    void add(std::string event)
    {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(std::move(event));
    }

    std::size_t count(std::string const &event)
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<std::size_t>(
            std::count(events.begin(), events.end(), event));
    }

    std::ptrdiff_t index_of(std::string const &event)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = std::find(events.begin(), events.end(), event);
        return it == events.end() ? -1 : std::distance(events.begin(), it);
    }
};

SettingsPersistenceService::FileOps recording_ops(Recorder &recorder)
{
    SettingsPersistenceService::FileOps ops;
    ops.create_backup = [&recorder](std::string const &name,
                                    std::filesystem::path const &)
    {
        recorder.add("backup:" + name);
        std::lock_guard<std::mutex> lock(recorder.mutex);
        return recorder.backup_result;
    };
    ops.save = [&recorder](SettingDocument const &document,
                           std::string const &name, std::filesystem::path const &)
    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        recorder.events.push_back("save:" + name);
        recorder.payloads.push_back(document.serialize());
        recorder.save_times.push_back(Clock::now());
        return true;
    };
    ops.verify = [&recorder](SettingDocument const &, std::string const &name,
                             std::filesystem::path const &)
    {
        recorder.add("verify:" + name);
        std::lock_guard<std::mutex> lock(recorder.mutex);
        return recorder.verify_result;
    };
    ops.restore_backup = [&recorder](std::string const &name,
                                     std::filesystem::path const &)
    {
        recorder.add("restore:" + name);
        return true;
    };
    ops.delete_backup = [&recorder](std::string const &name,
                                    std::filesystem::path const &)
    {
        recorder.add("delete:" + name);
        return true;
    };
    return ops;
}

SettingsPersistenceService::Callbacks recording_callbacks(Recorder &recorder,
                                                          int max_attempts = 3)
{
    SettingsPersistenceService::Callbacks callbacks;
    callbacks.max_attempts = [max_attempts] { return max_attempts; };
    callbacks.on_saved = [&recorder](SaveResult const &result)
    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        recorder.results.push_back(result);
    };
    return callbacks;
}

SettingsPersistenceService::Options fast_options()
{
    SettingsPersistenceService::Options options;
    options.tick = 1ms;
    options.retry_delay = 5ms;
    return options;
}

tp::engine::SettingDocumentPtr make_document(char const *text)
{
    auto parsed = tp::json::Document::parse(text);
    REQUIRE(parsed.is_valid());
    return SettingDocument::make(
        tp::json::MutableDocument::copy_of(parsed.root()));
}

} // namespace

TEST_CASE("immediate save writes, verifies and cleans up the backup")
{
    tp::tests::TempDir dir("persist-basic");
    tp::tests::write_text(dir.path() / "default.json", "{}");
    Recorder recorder;
    auto document = make_document(R"({"units": {"speed_unit": "KPH"}})");
    {
        SettingsPersistenceService service(recording_callbacks(recorder, 10));
        service.request_save({"default.json", dir.path(), document}, 0);
        service.wait_until_idle();
        CHECK_FALSE(service.is_saving());
        CHECK(service.pending() == 0);
    }

    CHECK(tp::engine::verify_json_file(*document, "default.json", dir.path()));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "default.json.bak"));
    REQUIRE(recorder.results.size() == 1);
    auto const &result = recorder.results.front();
    CHECK(result.saved);
    CHECK(result.attempts_used == 1);
    CHECK(result.max_attempts == 10);
    CHECK(result.attempts_left == 9);
}

TEST_CASE("repeated requests before the write coalesce into one write")
{
    Recorder recorder;
    auto document = make_document(R"({"value": 0})");
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       recording_ops(recorder), fast_options());
    for (int value = 1; value <= 5; ++value)
    {
        document->set_int({"value"}, value);
        service.request_save({"default.json", "unused", document}, 30);
    }
    // Edits made after the last request still land in the single write.
    document->set_int({"value"}, 42);
    service.wait_until_idle();

    CHECK(recorder.count("save:default.json") == 1);
    REQUIRE(recorder.payloads.size() == 1);
    auto written = tp::json::Document::parse(recorder.payloads.front());
    REQUIRE(written.is_valid());
    CHECK(yyjson_get_int(yyjson_obj_get(written.root(), "value")) == 42);
}

TEST_CASE("distinct files are written one at a time in request order")
{
    Recorder recorder;
    auto ops = recording_ops(recorder);
    auto record_save = ops.save;
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    ops.save = [&, record_save](SettingDocument const &document,
                                std::string const &name,
                                std::filesystem::path const &path)
    {
        int now = ++active;
        int seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(5ms);
        bool ok = record_save(document, name, path);
        --active;
        return ok;
    };

    auto config = make_document(R"({"a": 1})");
    auto classes = make_document(R"({"b": 2})");
    auto brakes = make_document(R"({"c": 3})");
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       std::move(ops), fast_options());
    service.request_save({"config.json", "global", config}, 5);
    service.request_save({"classes.json", "presets", classes}, 5);
    service.request_save({"brakes.json", "presets", brakes}, 5);
    CHECK(service.is_saving());
    service.wait_until_idle();

    CHECK(max_active.load() == 1);
    CHECK(recorder.count("save:config.json") == 1);
    CHECK(recorder.count("save:classes.json") == 1);
    CHECK(recorder.count("save:brakes.json") == 1);
    // Each file finishes, backup cleanup included, before the next starts.
    CHECK(recorder.index_of("delete:config.json") <
          recorder.index_of("backup:classes.json"));
    CHECK(recorder.index_of("delete:classes.json") <
          recorder.index_of("backup:brakes.json"));
    REQUIRE(recorder.results.size() == 3);
    CHECK(recorder.results[0].filename == "config.json");
    CHECK(recorder.results[1].filename == "classes.json");
    CHECK(recorder.results[2].filename == "brakes.json");
}

TEST_CASE("failed verification restores the original file byte for byte")
{
    tp::tests::TempDir dir("persist-restore");
    auto const target = dir.path() / "config.json";
    std::string const original = "{\n  \"keep\":   [1, 2, 3]\n}\n";
    tp::tests::write_text(target, original);

    Recorder recorder;
    auto ops = SettingsPersistenceService::FileOps::json_files();
    ops.verify = [](SettingDocument const &, std::string const &,
                    std::filesystem::path const &) { return false; };
    auto document = make_document(R"({"changed": true})");
    {
        SettingsPersistenceService service(recording_callbacks(recorder, 3),
                                           std::move(ops), fast_options());
        service.request_save({"config.json", dir.path(), document}, 0);
        service.wait_until_idle();
    }

    CHECK(tp::tests::read_text(target) == original);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "config.json.bak"));
    REQUIRE(recorder.results.size() == 1);
    CHECK_FALSE(recorder.results.front().saved);
    CHECK(recorder.results.front().attempts_used == 3);
    CHECK(recorder.results.front().attempts_left == 0);
}

TEST_CASE("failed first write of a new file leaves no file behind")
{
    tp::tests::TempDir dir("persist-new-file");
    auto const target = dir.path() / "config.json";

    Recorder recorder;
    auto ops = SettingsPersistenceService::FileOps::json_files();
    ops.verify = [](SettingDocument const &, std::string const &,
                    std::filesystem::path const &) { return false; };
    auto document = make_document(R"({"changed": true})");
    {
        SettingsPersistenceService service(recording_callbacks(recorder, 3),
                                           std::move(ops), fast_options());
        service.request_save({"config.json", dir.path(), document}, 0);
        service.wait_until_idle();
    }

    CHECK_FALSE(std::filesystem::exists(target));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "config.json.bak"));
    REQUIRE(recorder.results.size() == 1);
    CHECK_FALSE(recorder.results.front().saved);
    CHECK(recorder.results.front().attempts_used == 3);
}

TEST_CASE("existing file is not written when its backup fails")
{
    Recorder recorder;
    recorder.backup_result = false;
    auto document = make_document(R"({"a": 1})");
    {
        SettingsPersistenceService service(recording_callbacks(recorder, 3),
                                           recording_ops(recorder),
                                           fast_options());
        service.request_save({"config.json", "global", document}, 0);
        service.wait_until_idle();
    }

    CHECK(recorder.count("backup:config.json") == 1);
    CHECK(recorder.count("save:config.json") == 0);
    CHECK(recorder.count("restore:config.json") == 0);
    REQUIRE(recorder.results.size() == 1);
    CHECK_FALSE(recorder.results.front().saved);
    CHECK(recorder.results.front().attempts_used == 0);
    CHECK(recorder.results.front().attempts_left == 3);
}

TEST_CASE("exhausted attempts are spaced by the retry delay then restored")
{
    Recorder recorder;
    recorder.verify_result = false;
    auto options = fast_options();
    options.retry_delay = 20ms;
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder, 3),
                                       recording_ops(recorder), options);
    service.request_save({"config.json", "global", document}, 0);
    service.wait_until_idle();

    CHECK(recorder.count("save:config.json") == 3);
    CHECK(recorder.count("verify:config.json") == 3);
    REQUIRE(recorder.save_times.size() == 3);
    CHECK(recorder.save_times[1] - recorder.save_times[0] >= 20ms);
    CHECK(recorder.save_times[2] - recorder.save_times[1] >= 20ms);

    std::vector<std::string> const tail(recorder.events.end() - 2,
                                        recorder.events.end());
    std::vector<std::string> const expected_tail = {"restore:config.json",
                                                    "delete:config.json"};
    CHECK(tail == expected_tail);
    CHECK(recorder.index_of("backup:config.json") == 0);
}

TEST_CASE("attempt budget never drops below three")
{
    Recorder recorder;
    recorder.verify_result = false;
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder, 1),
                                       recording_ops(recorder), fast_options());
    service.request_save({"config.json", "global", document}, 0);
    service.wait_until_idle();
    CHECK(recorder.count("save:config.json") == 3);
    REQUIRE(recorder.results.size() == 1);
    CHECK(recorder.results.front().max_attempts == 3);
}

TEST_CASE("write errors count against the attempt budget")
{
    Recorder recorder;
    auto ops = recording_ops(recorder);
    auto record_save = ops.save;
    int calls = 0;
    ops.save = [&calls, record_save](SettingDocument const &document,
                                     std::string const &name,
                                     std::filesystem::path const &path) -> bool
    {
        if (++calls == 1)
        {
            throw std::runtime_error("disk full");
        }
        return record_save(document, name, path);
    };
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder, 5),
                                       std::move(ops), fast_options());
    service.request_save({"default.json", "presets", document}, 0);
    service.wait_until_idle();

    REQUIRE(recorder.results.size() == 1);
    CHECK(recorder.results.front().saved);
    CHECK(recorder.results.front().attempts_used == 2);
    CHECK(recorder.results.front().attempts_left == 3);
    CHECK(recorder.count("restore:default.json") == 0);
}

TEST_CASE("a later request extends the debounce window")
{
    Recorder recorder;
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       recording_ops(recorder), fast_options());
    auto const first = Clock::now();
    service.request_save({"default.json", "presets", document}, 60);
    std::this_thread::sleep_for(30ms);
    auto const second = Clock::now();
    service.request_save({"default.json", "presets", document}, 60);
    service.wait_until_idle();

    REQUIRE(recorder.save_times.size() == 1);
    CHECK(recorder.save_times.front() - second >= 60ms);
    CHECK(recorder.save_times.front() - first >= 90ms);
}

TEST_CASE("a request during a write is saved in a second pass")
{
    Recorder recorder;
    auto ops = recording_ops(recorder);
    auto record_save = ops.save;
    std::promise<void> writing;
    std::promise<void> release;
    auto released = release.get_future().share();
    int calls = 0;
    ops.save = [&, record_save, released](SettingDocument const &document,
                                          std::string const &name,
                                          std::filesystem::path const &path)
    {
        if (++calls == 1)
        {
            writing.set_value();
            released.wait();
        }
        return record_save(document, name, path);
    };
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       std::move(ops), fast_options());
    service.request_save({"default.json", "presets", document}, 0);
    writing.get_future().wait();
    document->set_int({"a"}, 2);
    service.request_save({"default.json", "presets", document}, 0);
    CHECK(service.pending() == 1);
    release.set_value();
    service.wait_until_idle();

    CHECK(recorder.count("save:default.json") == 2);
    REQUIRE(recorder.payloads.size() == 2);
    auto last = tp::json::Document::parse(recorder.payloads.back());
    CHECK(yyjson_get_int(yyjson_obj_get(last.root(), "a")) == 2);
    CHECK(service.pending() == 0);
}

TEST_CASE("flush skips the debounce window")
{
    Recorder recorder;
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService::Options options;
    options.tick = 10ms;
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       recording_ops(recorder), options);
    service.request_save({"default.json", "presets", document}, 100000);
    auto const started = Clock::now();
    service.flush();
    CHECK(Clock::now() - started < 5s);
    CHECK(recorder.count("save:default.json") == 1);
    CHECK_FALSE(service.is_saving());
    CHECK(service.wait_until_idle(10ms));
}

TEST_CASE("worker is restarted for requests after the queue drained")
{
    Recorder recorder;
    auto document = make_document(R"({"a": 1})");
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       recording_ops(recorder), fast_options());
    service.request_save({"default.json", "presets", document}, 0);
    service.wait_until_idle();
    service.request_save({"config.json", "global", document}, 0);
    service.wait_until_idle();
    CHECK(recorder.count("save:default.json") == 1);
    CHECK(recorder.count("save:config.json") == 1);
    CHECK_FALSE(service.is_saving());
}

TEST_CASE("invalid requests are ignored")
{
    Recorder recorder;
    SettingsPersistenceService service(recording_callbacks(recorder),
                                       recording_ops(recorder), fast_options());
    service.request_save({"default.json", "presets", nullptr}, 0);
    CHECK_FALSE(service.is_saving());
    CHECK(service.pending() == 0);
}
