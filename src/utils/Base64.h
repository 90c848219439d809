#pragma once
#include <string>

namespace Base64 {
    /** Decodes standard base64; whitespace and padding are skipped, invalid characters ignored. */
    std::string decode(const std::string& encoded);
}
