#ifndef COURIER_STRING_UTILS_HPP
#define COURIER_STRING_UTILS_HPP

#include <istream>
#include <string>
#include <string_view>

namespace string_utils {
    // libcurl CURLOPT_WRITEFUNCTION sink; userdata is a std::string*.
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    char ascii_lower(char c);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool ieq(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    /**
     * Reads the whole stream as UTF-8 text. Bytes are kept as-is; file streams are closed
     * afterwards, including when reading fails.
     */
    std::string read_text_and_close(std::istream& in);

    std::string read_file_text(const std::string& path);
}  // namespace string_utils

#endif
