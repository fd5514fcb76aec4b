#include "filesystem.hpp"
#include <algorithm>
#include <cctype>

namespace usbdeck::fs {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

FsResult failure(std::error_code ec, const std::string& message) {
    FsResult result;
    result.success = false;
    result.error = ec;
    result.message = message;
    return result;
}

} // namespace

FsResult LocalFileSystem::listDirectory(const std::filesystem::path& directory,
                                        const ListOptions& options,
                                        std::vector<FileEntry>& entries) const {
    entries.clear();

    std::error_code ec;
    if (!std::filesystem::exists(directory, ec)) {
        return failure(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                       "Directory does not exist: " + directory.string());
    }
    if (!std::filesystem::is_directory(directory, ec)) {
        return failure(ec ? ec : std::make_error_code(std::errc::not_a_directory),
                       "Not a directory: " + directory.string());
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return failure(ec, "Cannot open directory: " + directory.string());
    }

    std::vector<FileEntry> result;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return failure(ec, "Cannot read directory: " + directory.string());
        }
        const std::filesystem::directory_entry& child = *it;
        FileEntry entry;
        entry.path = child.path();
        entry.name = child.path().filename().string();
        entry.hidden = !entry.name.empty() && entry.name.front() == '.';
        if (entry.hidden && !options.include_hidden) {
            continue;
        }

        std::error_code status_ec;
        entry.is_symlink = child.is_symlink(status_ec);
        entry.is_directory = child.is_directory(status_ec);
        entry.is_regular_file = child.is_regular_file(status_ec);
        if (entry.is_regular_file) {
            std::uintmax_t size = child.file_size(status_ec);
            entry.size = status_ec ? 0 : size;
        }

        std::error_code time_ec;
        auto modified = child.last_write_time(time_ec);
        if (!time_ec) {
            entry.modified = modified;
        }

        result.push_back(std::move(entry));
    }
    if (ec) {
        return failure(ec, "Cannot read directory: " + directory.string());
    }

    std::sort(result.begin(), result.end(), [](const FileEntry& a, const FileEntry& b) {
        return lowercase(a.name) < lowercase(b.name);
    });

    entries = std::move(result);
    FsResult ok;
    ok.success = true;
    return ok;
}

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace usbdeck::fs
