#pragma once

#include "core_export.hpp"
#include "fs/filesystem.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace usbdeck::core {

/**
 * @brief Browsing state of one storage device
 *
 * Instances are owned by the PageCache. The page keeps the device's
 * filesystem capability alive until release() or destruction.
 */
class USBDECK_CORE_EXPORT FileBrowserPage {
public:
    /**
     * @brief Constructor
     * @param filesystem Capability used for listings
     * @param root Storage root of the device; empty if the device has no mounted volume
     * @param show_hidden Whether hidden entries are listed
     */
    FileBrowserPage(std::shared_ptr<fs::FileSystem> filesystem,
                    std::filesystem::path root,
                    bool show_hidden = false);
    ~FileBrowserPage();

    FileBrowserPage(const FileBrowserPage&) = delete;
    FileBrowserPage& operator=(const FileBrowserPage&) = delete;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& currentDirectory() const { return current_directory_; }
    const std::vector<fs::FileEntry>& entries() const { return entries_; }
    bool showHidden() const { return show_hidden_; }
    bool isReleased() const { return filesystem_ == nullptr; }

    /**
     * @brief Re-list the current directory
     */
    fs::FsResult reload();

    /**
     * @brief Move to another directory and list it
     *
     * The current directory is only changed if the listing succeeds.
     */
    fs::FsResult setDirectory(const std::filesystem::path& directory);

    /**
     * @brief Enter a subdirectory of the current directory by name
     */
    fs::FsResult enter(const std::string& name);

    /**
     * @brief Go to the parent directory, stopping at the root
     */
    fs::FsResult goUp();

    /**
     * @brief Rebind the page to a new storage root
     *
     * Used when the device was remounted elsewhere; the browsing location
     * moves to the new root.
     */
    fs::FsResult resetRoot(const std::filesystem::path& root);

    fs::FsResult setShowHidden(bool show);

    /**
     * @brief Drop the filesystem capability and the listing
     *
     * Idempotent. Every later operation fails.
     */
    void release();

private:
    fs::FsResult list(const std::filesystem::path& directory);

    std::shared_ptr<fs::FileSystem> filesystem_;
    std::filesystem::path root_;
    std::filesystem::path current_directory_;
    std::vector<fs::FileEntry> entries_;
    bool show_hidden_;
};

} // namespace usbdeck::core
