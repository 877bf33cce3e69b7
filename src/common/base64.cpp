#include "common/base64.hpp"
#include <array>
#include <cstdint>
#include "common/exceptions.hpp"

namespace executor {
using namespace std;

static const char *alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static array<int, 256> build_reverse_table() {
    array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i)
        table[(unsigned char)alphabet[i]] = i;
    return table;
}

string base64_encode(const string &data) {
    string result;
    result.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t chunk = (uint32_t)(unsigned char)data[i] << 16 |
                         (uint32_t)(unsigned char)data[i + 1] << 8 |
                         (uint32_t)(unsigned char)data[i + 2];
        result.push_back(alphabet[chunk >> 18 & 63]);
        result.push_back(alphabet[chunk >> 12 & 63]);
        result.push_back(alphabet[chunk >> 6 & 63]);
        result.push_back(alphabet[chunk & 63]);
    }
    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t chunk = (uint32_t)(unsigned char)data[i] << 16;
        result.push_back(alphabet[chunk >> 18 & 63]);
        result.push_back(alphabet[chunk >> 12 & 63]);
        result += "==";
    } else if (rest == 2) {
        uint32_t chunk = (uint32_t)(unsigned char)data[i] << 16 |
                         (uint32_t)(unsigned char)data[i + 1] << 8;
        result.push_back(alphabet[chunk >> 18 & 63]);
        result.push_back(alphabet[chunk >> 12 & 63]);
        result.push_back(alphabet[chunk >> 6 & 63]);
        result.push_back('=');
    }
    return result;
}

string base64_decode(const string &text) {
    static const array<int, 256> reverse = build_reverse_table();

    if (text.size() % 4 != 0)
        throw decode_error("illegal base64 data: length " + std::to_string(text.size()) + " is not a multiple of 4");

    string result;
    result.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = i + 4 == text.size();
        int padding = 0;
        uint32_t chunk = 0;
        for (size_t j = 0; j < 4; ++j) {
            unsigned char c = text[i + j];
            int value;
            if (c == '=') {
                // '=' 只能出现在最后一组的第 3、4 位，并且之后只能是 '='
                if (!last || j < 2)
                    throw decode_error("illegal base64 data at input byte " + std::to_string(i + j));
                ++padding;
                value = 0;
            } else {
                if (padding > 0 || reverse[c] < 0)
                    throw decode_error("illegal base64 data at input byte " + std::to_string(i + j));
                value = reverse[c];
            }
            chunk = chunk << 6 | (uint32_t)value;
        }

        result.push_back((char)(chunk >> 16 & 0xFF));
        if (padding < 2) result.push_back((char)(chunk >> 8 & 0xFF));
        if (padding < 1) result.push_back((char)(chunk & 0xFF));
    }
    return result;
}

}  // namespace executor
