#include "engine/SettingsPersistenceService.hpp"

#include "engine/SettingFile.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace tp::engine
{

SettingsPersistenceService::FileOps
SettingsPersistenceService::FileOps::json_files()
{
    FileOps ops;
    ops.exists = json_file_exists;
    ops.create_backup = create_backup_file;
    ops.save = save_json_file;
    ops.verify = verify_json_file;
    ops.restore_backup = restore_backup_file;
    ops.delete_backup = delete_backup_file;
    ops.remove = delete_json_file;
    return ops;
}

SettingsPersistenceService::SettingsPersistenceService(Callbacks callbacks,
                                                       FileOps file_ops,
                                                       Options options)
    : callbacks_(std::move(callbacks)),
      file_ops_(std::move(file_ops)),
      options_(options)
{
}

SettingsPersistenceService::~SettingsPersistenceService()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_requested_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void SettingsPersistenceService::request_save(SaveRequest request,
                                              int delay_ticks)
{
    if (!request.document || request.filename.empty())
    {
        TP_LOG_ERROR("SETTING: invalid save request, skipping");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto queued = std::find_if(queue_.begin(), queue_.end(),
                               [&](SaveRequest const &entry)
                               { return entry.filename == request.filename; });
    if (queued == queue_.end())
    {
        queue_.push_back(std::move(request));
    }
    deadline_ = Clock::now() + options_.tick * std::max(delay_ticks, 0);
    if (saving_)
    {
        wake_cv_.notify_all();
        return;
    }
    // The previous worker already cleared saving_ as its last step.
    if (worker_.joinable())
    {
        worker_.join();
    }
    saving_ = true;
    flush_requested_ = false;
    worker_ = std::thread([this] { run(); });
}

bool SettingsPersistenceService::is_saving() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return saving_;
}

std::size_t SettingsPersistenceService::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void SettingsPersistenceService::wait_until_idle() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !saving_; });
}

bool SettingsPersistenceService::wait_until_idle(
    std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !saving_; });
}

void SettingsPersistenceService::flush()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!saving_)
        {
            return;
        }
        flush_requested_ = true;
    }
    wake_cv_.notify_all();
    wait_until_idle();
}

void SettingsPersistenceService::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!queue_.empty())
    {
        // New requests move deadline_ forward while we wait.
        while (!flush_requested_ && Clock::now() < deadline_)
        {
            wake_cv_.wait_until(lock, deadline_);
        }
        auto request = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        auto result = persist(request);
        if (callbacks_.on_saved)
        {
            try
            {
                callbacks_.on_saved(result);
            }
            catch (std::exception const &ex)
            {
                TP_LOG_ERROR("SETTING: save callback failed: {}", ex.what());
            }
        }

        lock.lock();
        // Remaining files follow without another debounce window.
        deadline_ = Clock::now();
    }
    saving_ = false;
    idle_cv_.notify_all();
}

int SettingsPersistenceService::resolve_max_attempts() const
{
    int configured = kMinimumAttempts;
    if (callbacks_.max_attempts)
    {
        configured = callbacks_.max_attempts();
    }
    return std::max(configured, kMinimumAttempts);
}

SaveResult SettingsPersistenceService::persist(SaveRequest const &request)
{
    auto const &name = request.filename;
    auto const &path = request.filepath;
    auto const &document = *request.document;

    SaveResult result;
    result.filename = name;
    result.filepath = path;
    result.max_attempts = resolve_max_attempts();

    auto guarded = [&name](char const *step, auto &&op) -> bool
    {
        try
        {
            return op();
        }
        catch (std::exception const &ex)
        {
            TP_LOG_ERROR("SETTING: {} of {} failed: {}", step, name, ex.what());
            return false;
        }
    };

    // A failed lookup counts as an existing file that needs a backup.
    bool const existed =
        !file_ops_.exists ||
        !guarded("lookup", [&] { return !file_ops_.exists(name, path); });

    if (existed && file_ops_.create_backup &&
        !guarded("backup", [&] { return file_ops_.create_backup(name, path); }))
    {
        // Without a recovery point the current file is left as it is.
        result.attempts_left = result.max_attempts;
        TP_LOG_ERROR("SETTING: failed saving {}, unable to back up", name);
        if (file_ops_.delete_backup)
        {
            guarded("backup cleanup",
                    [&] { return file_ops_.delete_backup(name, path); });
        }
        return result;
    }

    auto const started = Clock::now();
    int attempts = result.max_attempts;
    while (attempts > 0)
    {
        bool const written = guarded(
            "write",
            [&]
            {
                return file_ops_.save && file_ops_.verify &&
                       file_ops_.save(document, name, path) &&
                       file_ops_.verify(document, name, path);
            });
        if (written)
        {
            break;
        }
        --attempts;
        TP_LOG_ERROR("SETTING: failed saving {}, {} attempt(s) left", name,
                     attempts);
        if (attempts > 0)
        {
            std::this_thread::sleep_for(options_.retry_delay);
        }
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started);

    result.saved = attempts > 0;
    if (result.saved)
    {
        result.attempts_used = result.max_attempts - attempts + 1;
        result.attempts_left = attempts - 1;
    }
    else
    {
        result.attempts_used = result.max_attempts;
        result.attempts_left = 0;
        if (!existed)
        {
            if (file_ops_.remove)
            {
                guarded("removal", [&] { return file_ops_.remove(name, path); });
            }
        }
        else if (file_ops_.restore_backup)
        {
            guarded("restore",
                    [&] { return file_ops_.restore_backup(name, path); });
        }
    }
    TP_LOG_INFO("SETTING: {} {} (took {}ms, {}/{} attempts, {} left)", name,
                result.saved ? "saved" : "failed saving",
                result.elapsed.count(), result.attempts_used,
                result.max_attempts, result.attempts_left);

    if (file_ops_.delete_backup)
    {
        guarded("backup cleanup",
                [&] { return file_ops_.delete_backup(name, path); });
    }
    return result;
}

} // namespace tp::engine
