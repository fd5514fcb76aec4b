#pragma once

#include "fs_export.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace usbdeck::fs {

/**
 * @brief Filesystem operation result
 */
struct USBDECK_FS_EXPORT FsResult {
    bool success = false;
    std::error_code error;
    std::string message;
};

/**
 * @brief One directory entry
 */
struct USBDECK_FS_EXPORT FileEntry {
    std::filesystem::path path;         // Absolute path
    std::string name;                   // Last path component
    bool is_directory = false;
    bool is_regular_file = false;
    bool is_symlink = false;
    std::uintmax_t size = 0;            // 0 for directories
    std::optional<std::filesystem::file_time_type> modified;
    bool hidden = false;
};

/**
 * @brief Directory listing options
 */
struct USBDECK_FS_EXPORT ListOptions {
    bool include_hidden = false;
};

/**
 * @brief Filesystem capability bound to one storage device
 */
class USBDECK_FS_EXPORT FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * @brief List directory contents
     * @param directory Directory to list
     * @param options Listing options
     * @param entries Receives the entries, sorted by name ignoring case
     * @return Operation result; entries is left empty on failure
     */
    virtual FsResult listDirectory(const std::filesystem::path& directory,
                                   const ListOptions& options,
                                   std::vector<FileEntry>& entries) const = 0;

    /**
     * @brief Check if a path exists
     */
    virtual bool exists(const std::filesystem::path& path) const = 0;
};

/**
 * @brief FileSystem backed by the local host filesystem
 *
 * Dot-files are treated as hidden.
 */
class USBDECK_FS_EXPORT LocalFileSystem : public FileSystem {
public:
    FsResult listDirectory(const std::filesystem::path& directory,
                           const ListOptions& options,
                           std::vector<FileEntry>& entries) const override;

    bool exists(const std::filesystem::path& path) const override;
};

} // namespace usbdeck::fs
