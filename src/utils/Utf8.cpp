#include "utils/Utf8.h"

namespace UTF8Utils {

namespace {
    bool isContinuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }
}

std::string sanitize(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        // ASCII
        if (c <= 0x7F) {
            output.push_back(static_cast<char>(c));
            i++;
        }
        // 2-byte sequence (0xC0-0xC1 are overlong)
        else if (c >= 0xC2 && c <= 0xDF) {
            if (i + 1 < input.size() && isContinuation(static_cast<unsigned char>(input[i + 1]))) {
                output.append(input, i, 2);
                i += 2;
                continue;
            }
            output.push_back('?');
            i++;
        }
        // 3-byte sequence
        else if (c >= 0xE0 && c <= 0xEF) {
            if (i + 2 < input.size()) {
                unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                if (isContinuation(c1) && isContinuation(c2)) {
                    if (c == 0xE0 && c1 < 0xA0) {
                        output.push_back('?');
                        i += 3;
                        continue;
                    }
                    output.append(input, i, 3);
                    i += 3;
                    continue;
                }
            }
            output.push_back('?');
            i++;
        }
        // 4-byte sequence
        else if (c >= 0xF0 && c <= 0xF4) {
            if (i + 3 < input.size()) {
                unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                unsigned char c3 = static_cast<unsigned char>(input[i + 3]);
                if (isContinuation(c1) && isContinuation(c2) && isContinuation(c3)) {
                    // overlong or beyond U+10FFFF
                    if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) {
                        output.push_back('?');
                        i += 4;
                        continue;
                    }
                    output.append(input, i, 4);
                    i += 4;
                    continue;
                }
            }
            output.push_back('?');
            i++;
        }
        // stray continuation byte or invalid lead byte
        else {
            output.push_back('?');
            i++;
        }
    }

    return output;
}

size_t codepointCount(const std::string& input) {
    size_t count = 0;
    for (char ch : input) {
        if (!isContinuation(static_cast<unsigned char>(ch))) count++;
    }
    return count;
}

std::string truncateCodepoints(const std::string& input, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        if (!isContinuation(static_cast<unsigned char>(input[i]))) {
            if (seen == count) return input.substr(0, i);
            seen++;
        }
    }
    return input;
}

} // namespace UTF8Utils
