#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Size and modification time of a file, read without opening it
 */
struct FileStat
{
    uint64_t size = 0;
    double mod_time = 0.0; // Seconds since epoch, sub-second precision where available
};

/**
 * @brief File utilities for efficient file operations
 */
class FileUtils
{
public:
    /**
     * @brief Get size and modification time of a regular file
     * @param file_path Path to the file
     * @return FileStat, or std::nullopt if the path is not an accessible regular file
     */
    static std::optional<FileStat> getFileStat(const std::string &file_path);

    /**
     * @brief Lower-case extension without the leading dot
     * @param file_path Path to the file
     * @return Extension, empty if the file has none
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief File name without directory and extension
     */
    static std::string getFileStem(const std::string &file_path);

    /**
     * Lists all files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Absolute, lexically normalised form of a path
     */
    static std::string toAbsolutePath(const std::string &path);
};
