#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    char ascii_lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | constants::ASCII_LOWERCASE_BIT) : c; }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (ascii_lower(buf[i]) != ascii_lower(key[i])) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool ieq(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string read_text_and_close(std::istream &in) {
        std::ostringstream oss;
        oss << in.rdbuf();
        const bool failed = in.bad();

        if (auto *file = dynamic_cast<std::ifstream *>(&in); file != nullptr) {
            file->close();
        }

        if (failed) {
            throw std::runtime_error("stream read failed");
        }
        return oss.str();
    }

    std::string read_file_text(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("open failed: " + path);
        }
        return read_text_and_close(in);
    }
}  // namespace string_utils
