#ifndef FILESERVICE_HPP
#define FILESERVICE_HPP

#include <string>
#include <vector>
#include <tuple>
#include <cstdint>
#include <ctime>

// Access and modification times of a file, nanosecond precision
struct FileTimes {
    struct timespec accessTime;
    struct timespec modificationTime;
};

class FileService {
public:
    FileService();
    virtual ~FileService() = default;

    // Methods for file operations
    static std::string check_path_type(const std::string& path);
    static std::string absolute_path(const std::string& path);
    virtual std::vector<std::string> list_files(const std::string& directory);
    virtual std::vector<std::string> list_directories_recursively(const std::string& root);
    virtual bool file_exists(const std::string& file_path);
    virtual void delete_file(const std::string& filename);
    virtual bool remove_if_exists(const std::string& filename);
    virtual void rename_file(const std::string& from, const std::string& to);
    virtual std::uint64_t get_file_size(const std::string& filename);
    virtual FileTimes get_file_times(const std::string& filename);
    virtual void set_file_times(const std::string& filename, const FileTimes& times);
    virtual void write_file_atomically(const std::string& filename, const std::string& content);
    virtual std::string read_file(const std::string& filename);
    virtual std::tuple<std::uint64_t, std::uint64_t, std::uint64_t> get_memory_details(const std::string& path);
    virtual std::uint64_t get_total_available_memory(const std::string& path);
};

#endif // FILESERVICE_HPP
