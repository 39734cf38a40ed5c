#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>
#include <vector>

namespace ByteUtils {

    /**
     * Поэлементное сравнение двух массивов байт.
     * Сначала сравниваются длины.
     */
    inline bool equal(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }

    /**
     * HEX-представление для логов: "41 42 43".
     * Если байт больше чем max_bytes — обрезаем и дописываем "... (+N)".
     */
    inline std::string to_hex(const uint8_t *data, size_t len, size_t max_bytes = 32) {
        std::string out;
        const size_t shown = len < max_bytes ? len : max_bytes;
        out.reserve(shown * 3 + 16);

        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) {
                out += ' ';
            }
            out += fmt::format("{:02X}", data[i]);
        }

        if (shown < len) {
            out += fmt::format(" ... (+{})", len - shown);
        }
        return out;
    }

    inline std::string to_hex(const std::vector<uint8_t> &bytes, size_t max_bytes = 32) {
        return to_hex(bytes.data(), bytes.size(), max_bytes);
    }

}
