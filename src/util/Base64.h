#pragma once

#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 base64 with the standard alphabet. Decoding is strict: padded
// input only, no whitespace, no URL-safe characters.
class Base64 {
public:
    static size_t encodedSize(size_t len) { return 4 * ((len + 2) / 3); }

    static std::string encode(const uint8_t* data, size_t len) {
        static const char table[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string out;
        out.reserve(encodedSize(len));

        size_t i = 0;
        for (; i + 3 <= len; i += 3) {
            uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.push_back(table[(n >> 6) & 0x3F]);
            out.push_back(table[n & 0x3F]);
        }

        size_t rest = len - i;
        if (rest == 1) {
            uint32_t n = uint32_t(data[i]) << 16;
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.append("==");
        } else if (rest == 2) {
            uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.push_back(table[(n >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    static std::string encode(const std::vector<uint8_t>& data) {
        return encode(data.data(), data.size());
    }

    static bool decode(const std::string& in, std::vector<uint8_t>& out) {
        out.clear();
        if (in.size() % 4 != 0) return false;
        if (in.empty()) return true;

        size_t padding = 0;
        if (in[in.size() - 1] == '=') {
            padding++;
            if (in[in.size() - 2] == '=') padding++;
        }

        out.reserve(in.size() / 4 * 3 - padding);

        for (size_t i = 0; i < in.size(); i += 4) {
            bool lastQuad = (i + 4 == in.size());
            uint32_t n = 0;
            for (size_t j = 0; j < 4; ++j) {
                char c = in[i + j];
                int v;
                if (c == '=') {
                    // Padding is only legal in the tail of the final quad.
                    if (!lastQuad || j < 4 - padding) return false;
                    v = 0;
                } else {
                    v = decodeChar(c);
                    if (v < 0) return false;
                }
                n = (n << 6) | static_cast<uint32_t>(v);
            }

            out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
            if (!lastQuad || padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
            if (!lastQuad || padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
        }
        return true;
    }

private:
    static int decodeChar(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
};
