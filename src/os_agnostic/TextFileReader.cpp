/**
 * @file TextFileReader.cpp
 * @brief Loads a text file so it can be submitted for scrolling.
 */

#include "TextFileReader.hpp"
#include <exception>
#include <fstream>
#include <sstream>

/**
 * @brief Reads the file at @p path in one go.
 *
 * Opens in binary mode so the bytes reach the layout engine untouched; the
 * engine already strips the '\r' of CRLF line endings. I/O exceptions are
 * turned into an error message.
 */
bool TextFileReader::load(const std::string& path, std::string& content, std::string& error) const {
    if (path.empty()) {
        error = "no file given";
        return false;
    }

    try {
        std::ifstream in(path, std::ios::binary);  // open file stream

        if (!in) {
            error = "cannot open file: " + path;
            return false;
        }

        in.seekg(0, std::ios::end);
        const auto size = in.tellg();
        if (size > 0 && static_cast<std::size_t>(size) > limit) {
            error = "file too large (" + std::to_string(static_cast<long long>(size)) + " bytes, limit "
                    + std::to_string(limit) + ")";
            return false;
        }
        in.seekg(0, std::ios::beg);

        std::ostringstream ss;
        ss << in.rdbuf();  // fill the buffer with the entire file.
        if (in.bad()) {
            error = "read error on " + path;
            return false;
        }

        content = ss.str();
        return true;

    } catch (const std::exception& e) {
        // There was some sort of read error (permissions, I/O, etc.).
        error = "error reading '" + path + "': " + e.what();
        return false;
    }
}
