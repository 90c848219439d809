#include "utils/Base64.h"
#include <array>
#include <cstdint>

namespace Base64 {

namespace {
constexpr const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<uint8_t, 256> makeTable() {
    std::array<uint8_t, 256> table{};
    table.fill(0xFF);
    for (uint8_t i = 0; i < 64; i++) {
        table[static_cast<uint8_t>(kAlphabet[i])] = i;
    }
    return table;
}
} // namespace

std::string decode(const std::string& encoded) {
    static const std::array<uint8_t, 256> table = makeTable();

    std::string out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    for (char ch : encoded) {
        uint8_t val = table[static_cast<uint8_t>(ch)];
        if (val == 0xFF) continue;   // '=', whitespace, junk

        accum = ((accum << 6) | val) & 0xFFFFFF;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((accum >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace Base64
