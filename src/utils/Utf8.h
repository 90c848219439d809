#pragma once
#include <string>

namespace UTF8Utils {
    /**
     * @brief Validate a UTF-8 byte string, replacing invalid bytes with '?'.
     */
    std::string sanitize(const std::string& input);

    /** Number of code points in a valid UTF-8 string. */
    size_t codepointCount(const std::string& input);

    /** First `count` code points of a valid UTF-8 string. */
    std::string truncateCodepoints(const std::string& input, size_t count);
}
