#include "fileservice.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <system_error>
#include <stdexcept>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

/**
 * Default constructor for FileService class
 */
FileService::FileService() {}

/**
 * Determines the type of a given path
 * param path The filesystem path to check
 * return "file" if path is a regular file
 *         "directory" if path is a directory
 *         "not exist" if path doesn't exist
 */
std::string FileService::check_path_type(const std::string& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return "file";
    } else if (fs::is_directory(path, ec)) {
        return "directory";
    }
    return "not exist";
}

/**
 * Absolute, lexically normalized form of a path without a trailing separator
 * Relative paths resolve against the current working directory
 */
std::string FileService::absolute_path(const std::string& path) {
    fs::path normalized = fs::absolute(path).lexically_normal();
    if (!normalized.has_filename() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }
    return normalized.string();
}

/**
 * Lists the regular files directly inside a directory (non-recursive)
 * Entries are sorted by name so repeated runs see the same order
 * param directory The directory path to read
 * return Vector of file paths
 */
std::vector<std::string> FileService::list_files(const std::string& directory) {
    std::vector<std::string> files;
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Cannot read directory " << directory << ": " << ec.message() << std::endl;
        return files;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(it->path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

/**
 * Walks a directory tree in pre-order
 * The root comes first, every directory precedes its children and siblings
 * are visited in name order. Symbolic links to directories are not followed.
 * param root The directory to walk
 * return Vector of directory paths including the root
 */
std::vector<std::string> FileService::list_directories_recursively(const std::string& root) {
    std::vector<std::string> directories;
    directories.push_back(root);

    std::vector<std::string> children;
    std::error_code ec;
    fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Cannot read directory " << root << ": " << ec.message() << std::endl;
        return directories;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code typeEc;
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) {
            children.push_back(it->path().string());
        }
    }

    std::sort(children.begin(), children.end());
    for (const auto& child : children) {
        auto nested = list_directories_recursively(child);
        directories.insert(directories.end(), nested.begin(), nested.end());
    }
    return directories;
}

/**
 * Checks if a file exists
 * param file_path The path to check
 * return true if file exists, false otherwise
 */
bool FileService::file_exists(const std::string& file_path) {
    std::error_code ec;
    return fs::exists(file_path, ec);
}

/**
 * Deletes a file at the specified path
 * param filename The path of the file to delete
 * throws std::filesystem::filesystem_error carrying no_such_file_or_directory
 *        if the file is already gone, or the OS error (e.g. permission_denied)
 */
void FileService::delete_file(const std::string& filename) {
    if (!fs::remove(filename)) {
        throw fs::filesystem_error("File not found", filename,
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }
}

/**
 * Removes a file if present, never throws
 * return true if a file was removed
 */
bool FileService::remove_if_exists(const std::string& filename) {
    std::error_code ec;
    return fs::remove(filename, ec);
}

void FileService::rename_file(const std::string& from, const std::string& to) {
    fs::rename(from, to);
}

std::uint64_t FileService::get_file_size(const std::string& filename) {
    return fs::file_size(filename);
}

/**
 * Reads access and modification times of a file
 * throws std::runtime_error if stat fails
 */
FileTimes FileService::get_file_times(const std::string& filename) {
    struct stat file_stat;
    if (stat(filename.c_str(), &file_stat) != 0) {
        throw std::runtime_error("stat failed for " + filename + ": " +
                                 std::error_code(errno, std::generic_category()).message());
    }
    return FileTimes{file_stat.st_atim, file_stat.st_mtim};
}

/**
 * Applies access and modification times to a file
 * throws std::runtime_error if utimensat fails
 */
void FileService::set_file_times(const std::string& filename, const FileTimes& times) {
    struct timespec values[2] = {times.accessTime, times.modificationTime};
    if (utimensat(AT_FDCWD, filename.c_str(), values, 0) != 0) {
        throw std::runtime_error("utimensat failed for " + filename + ": " +
                                 std::error_code(errno, std::generic_category()).message());
    }
}

/**
 * Replaces a file's content through a sibling temporary file and a rename,
 * so an interrupted write never leaves a truncated file behind
 * throws std::runtime_error if the temporary file cannot be written
 */
void FileService::write_file_atomically(const std::string& filename, const std::string& content) {
    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open " + tmp + " for writing");
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            remove_if_exists(tmp);
            throw std::runtime_error("Failed to write " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, filename, ec);
    if (ec) {
        remove_if_exists(tmp);
        throw std::runtime_error("Failed to replace " + filename + ": " + ec.message());
    }
}

/**
 * Reads a whole file into memory
 * throws std::runtime_error if the file cannot be opened
 */
std::string FileService::read_file(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + filename);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/**
 * Gets space details for a filesystem path
 * param path The path to check
 * return Tuple of {total, used, free} in bytes, free being what an
 *        unprivileged process can still allocate
 * throws std::filesystem::filesystem_error if the path cannot be queried
 */
std::tuple<std::uint64_t, std::uint64_t, std::uint64_t> FileService::get_memory_details(const std::string& path) {
    if (path.empty()) {
        throw std::runtime_error("Empty path provided to get_memory_details");
    }

    fs::space_info info = fs::space(path);
    std::uint64_t total_bytes = info.capacity;
    std::uint64_t used_bytes = info.capacity - info.free;
    std::uint64_t free_bytes = info.available;
    return {total_bytes, used_bytes, free_bytes};
}

/**
 * Gets available space for a filesystem path
 * param path The path to check
 * return Free bytes
 */
std::uint64_t FileService::get_total_available_memory(const std::string& path) {
    auto [total_memory, used_memory, free_memory] = get_memory_details(path);
    return free_memory;
}
