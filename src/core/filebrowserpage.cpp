#include "filebrowserpage.hpp"
#include "logging.hpp"
#include <QString>

namespace usbdeck::core {

namespace {

fs::FsResult failure(std::errc code, const std::string& message) {
    fs::FsResult result;
    result.error = std::make_error_code(code);
    result.message = message;
    return result;
}

fs::FsResult success() {
    fs::FsResult result;
    result.success = true;
    return result;
}

} // namespace

FileBrowserPage::FileBrowserPage(std::shared_ptr<fs::FileSystem> filesystem,
                                 std::filesystem::path root,
                                 bool show_hidden)
    : filesystem_(std::move(filesystem))
    , root_(std::move(root))
    , current_directory_(root_)
    , show_hidden_(show_hidden) {}

FileBrowserPage::~FileBrowserPage() {
    release();
}

fs::FsResult FileBrowserPage::reload() {
    return list(current_directory_);
}

fs::FsResult FileBrowserPage::setDirectory(const std::filesystem::path& directory) {
    return list(directory);
}

fs::FsResult FileBrowserPage::enter(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return failure(std::errc::invalid_argument, "Invalid directory name: " + name);
    }
    return list(current_directory_ / name);
}

fs::FsResult FileBrowserPage::goUp() {
    if (current_directory_.empty() || current_directory_ == root_) {
        return success();
    }
    std::filesystem::path parent = current_directory_.parent_path();
    if (parent == current_directory_) {
        return success();
    }
    return list(parent);
}

fs::FsResult FileBrowserPage::resetRoot(const std::filesystem::path& root) {
    qCDebug(lcPages) << "Page root moved from" << QString::fromStdString(root_.string())
                     << "to" << QString::fromStdString(root.string());
    root_ = root;
    current_directory_ = root;
    entries_.clear();
    if (root.empty()) {
        return failure(std::errc::no_such_file_or_directory, "Device has no mounted volume");
    }
    return list(root);
}

fs::FsResult FileBrowserPage::setShowHidden(bool show) {
    if (show == show_hidden_) {
        return success();
    }
    show_hidden_ = show;
    return reload();
}

void FileBrowserPage::release() {
    if (!filesystem_) {
        return;
    }
    filesystem_.reset();
    entries_.clear();
    entries_.shrink_to_fit();
}

fs::FsResult FileBrowserPage::list(const std::filesystem::path& directory) {
    if (!filesystem_) {
        return failure(std::errc::operation_not_permitted, "Page has been released");
    }
    if (directory.empty()) {
        return failure(std::errc::no_such_file_or_directory, "Device has no mounted volume");
    }

    fs::ListOptions options;
    options.include_hidden = show_hidden_;

    std::vector<fs::FileEntry> entries;
    fs::FsResult result = filesystem_->listDirectory(directory, options, entries);
    if (!result.success) {
        qCDebug(lcPages) << "Listing failed:" << QString::fromStdString(result.message);
        return result;
    }

    current_directory_ = directory;
    entries_ = std::move(entries);
    return result;
}

} // namespace usbdeck::core
