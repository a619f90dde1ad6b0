#ifndef COURIER_CONSTANTS_HPP
#define COURIER_CONSTANTS_HPP

namespace constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long MILLISECONDS_PER_SECOND = 1000L;
    inline constexpr long DEFAULT_READ_TIMEOUT_MS = 3000L;
    inline constexpr long DEFAULT_CONNECT_TIMEOUT_MS = 3000L;
    inline constexpr int DEFAULT_MAX_REDIRECTS = 10;
    inline constexpr const char* JSON_MEDIA_TYPE = "application/json";
    inline constexpr const char* JSON_CONTENT_TYPE = "application/json; utf-8";
    inline constexpr const char* NO_LOCATION_HEADER = "No Location header";
}  // namespace constants

#endif
