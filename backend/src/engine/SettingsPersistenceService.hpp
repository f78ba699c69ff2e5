#pragma once

#include "engine/SettingDocument.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tp::engine
{

// One pending write: target file and the live document to serialize.
struct SaveRequest
{
    std::string filename;
    std::filesystem::path filepath;
    SettingDocumentPtr document;
};

struct SaveResult
{
    std::string filename;
    std::filesystem::path filepath;
    bool saved = false;
    int max_attempts = 0;
    int attempts_used = 0;
    int attempts_left = 0;
    std::chrono::milliseconds elapsed{0};
};

// Timing of the save worker: debounce tick length and back-off between
// failed write attempts.
struct PersistenceOptions
{
    std::chrono::milliseconds tick{10};
    std::chrono::milliseconds retry_delay{50};
};

// SettingsPersistenceService serializes every setting write through a
// single on-demand worker thread.
//  - request_save() queues a file once (later requests coalesce into the
//    queued entry) and (re)arms the debounce deadline.
//  - The worker waits out the deadline, then runs backup, write+verify
//    attempts, restore on failure and backup cleanup, one file at a time in
//    request order, and exits when the queue is empty.
class SettingsPersistenceService
{
  public:
    using Clock = std::chrono::steady_clock;

    // File primitives used by the worker. Defaults to the JSON file helpers.
    struct FileOps
    {
        // Unset means the target is treated as existing.
        std::function<bool(std::string const &, std::filesystem::path const &)>
            exists;
        std::function<bool(std::string const &, std::filesystem::path const &)>
            create_backup;
        std::function<bool(SettingDocument const &, std::string const &,
                           std::filesystem::path const &)>
            save;
        std::function<bool(SettingDocument const &, std::string const &,
                           std::filesystem::path const &)>
            verify;
        std::function<bool(std::string const &, std::filesystem::path const &)>
            restore_backup;
        std::function<bool(std::string const &, std::filesystem::path const &)>
            delete_backup;
        // Undoes a failed first write of a file that did not exist.
        std::function<bool(std::string const &, std::filesystem::path const &)>
            remove;

        static FileOps json_files();
    };

    struct Callbacks
    {
        // Configured attempt budget; never less than kMinimumAttempts.
        std::function<int()> max_attempts;
        // Invoked on the worker thread after each file.
        std::function<void(SaveResult const &)> on_saved;
    };

    using Options = PersistenceOptions;

    static constexpr int kDefaultDelayTicks = 66;
    static constexpr int kMinimumAttempts = 3;

    explicit SettingsPersistenceService(Callbacks callbacks = {},
                                        FileOps file_ops = FileOps::json_files(),
                                        Options options = {});
    ~SettingsPersistenceService();

    SettingsPersistenceService(SettingsPersistenceService const &) = delete;
    SettingsPersistenceService &
    operator=(SettingsPersistenceService const &) = delete;

    // Never blocks on I/O. `delay_ticks` of 0 writes without debounce.
    void request_save(SaveRequest request, int delay_ticks = kDefaultDelayTicks);

    bool is_saving() const;
    std::size_t pending() const;

    // Blocks until the queue is drained and the worker has exited.
    void wait_until_idle() const;
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

    // Cuts the current debounce window short and waits for the queue.
    void flush();

  private:
    void run();
    SaveResult persist(SaveRequest const &request);
    int resolve_max_attempts() const;

    Callbacks callbacks_;
    FileOps file_ops_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    mutable std::condition_variable idle_cv_;
    std::deque<SaveRequest> queue_;
    Clock::time_point deadline_{};
    bool saving_ = false;
    bool flush_requested_ = false;
    std::thread worker_;
};

} // namespace tp::engine
