/**
 * @file TextFileReader.hpp
 * @brief Loads a text file so it can be submitted for scrolling.
 */
#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Reads plain text files for the `load_file` command.
 *
 * Handy for scrolling credits or long notices that are awkward to type at the
 * prompt. Files larger than the configured limit are refused rather than
 * truncated.
 */
class TextFileReader {
public:
    static constexpr std::size_t kDefaultLimit = 1024 * 1024;

    explicit TextFileReader(std::size_t maxBytes = kDefaultLimit) : limit(maxBytes) {}

    /**
     * @brief Read the whole file at @p path into @p content.
     *
     * @param path    File to read.
     * @param content Receives the file's bytes on success; untouched otherwise.
     * @param error   Receives a message on failure.
     * @return true when the file was read.
     */
    bool load(const std::string& path, std::string& content, std::string& error) const;

private:
    std::size_t limit;
};
