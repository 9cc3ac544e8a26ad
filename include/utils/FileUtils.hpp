#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @namespace FileUtils
 * @brief Utilities for locating the project's data, configuration and output directories.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Locates and returns the project root directory.
     * @details Searches the working directory and up to five parents for
     * data, include, and src directories.
     * @return Path to the project root directory as a string
     */
    std::string getProjectRoot();

    /**
     * @brief Constructs a path to data/output with optional filename.
     * @details Creates the output directory if it doesn't exist.
     * @param filename [in] Optional filename to append to the output path (empty by default)
     * @return Full path to the output directory or file as a string
     */
    std::string getOutputPath(const std::string& filename = "");

    /** @return Path of `filename` under data/config of the project root. */
    std::string getConfigPath(const std::string& filename);

    /**
     * @brief Joins two path segments using the proper path separator.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);
}

#endif
