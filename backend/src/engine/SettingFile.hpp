#pragma once

#include "engine/SettingCategory.hpp"
#include "engine/SettingDocument.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace tp::engine
{

inline constexpr char kBackupExtension[] = ".bak";

// Copies `filepath/filename` to `filename.bak`. Returns false when there is
// no file to back up or the copy failed.
bool create_backup_file(std::string const &filename,
                        std::filesystem::path const &filepath);

// Copies the backup back over the target. Returns false without touching
// the target when no backup exists.
bool restore_backup_file(std::string const &filename,
                         std::filesystem::path const &filepath);

bool delete_backup_file(std::string const &filename,
                        std::filesystem::path const &filepath);

// True when the target exists or its status cannot be read.
bool json_file_exists(std::string const &filename,
                      std::filesystem::path const &filepath);

// Removes a target that had no previous version on disk.
bool delete_json_file(std::string const &filename,
                      std::filesystem::path const &filepath);

// Writes the document as indented JSON.
bool save_json_file(SettingDocument const &document, std::string const &filename,
                    std::filesystem::path const &filepath);

// Re-reads the file and compares it structurally with the document.
bool verify_json_file(SettingDocument const &document,
                      std::string const &filename,
                      std::filesystem::path const &filepath);

// Keeps an unreadable file as `<stem>-backup <timestamp>.json` so falling
// back to defaults never destroys user data.
std::optional<std::filesystem::path>
backup_invalid_json_file(std::string const &filename,
                         std::filesystem::path const &filepath);

// Loads a preset or the global config, validated against `defaults`. Falls
// back to a copy of `defaults` when the file is missing or unreadable.
SettingDocumentPtr load_setting_json_file(std::string const &filename,
                                          std::filesystem::path const &filepath,
                                          SettingDocument const &defaults);

// Loads a style file. A missing file is created from `defaults`.
SettingDocumentPtr load_style_json_file(std::string const &filename,
                                        std::filesystem::path const &filepath,
                                        Category category,
                                        SettingDocument const &defaults,
                                        bool check_missing = false);

inline SettingDocumentPtr copy_setting(SettingDocument const &source)
{
    return source.clone();
}

} // namespace tp::engine
