// ort_bridge/utf8.hpp
// Strict UTF-8 validation for string tensor content.
//
// Rejects what std::string would happily hold: overlong encodings, UTF-16
// surrogates (U+D800..U+DFFF), code points above U+10FFFF, stray
// continuation bytes and truncated sequences.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ort_bridge {

struct Utf8Failure {
    std::size_t offset;  // first byte of the offending sequence
    const char* reason;
};

[[nodiscard]] constexpr std::optional<Utf8Failure> validate_utf8(std::string_view bytes) noexcept {
    const std::size_t n = bytes.size();
    std::size_t i = 0;

    auto byte = [&](std::size_t k) { return static_cast<std::uint8_t>(bytes[k]); };
    auto is_cont = [&](std::size_t k) { return (byte(k) & 0xC0u) == 0x80u; };

    while (i < n) {
        const std::uint8_t lead = byte(i);

        if (lead < 0x80u) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((lead & 0xE0u) == 0xC0u) {
            len = 2; cp = lead & 0x1Fu; min_cp = 0x80u;
        } else if ((lead & 0xF0u) == 0xE0u) {
            len = 3; cp = lead & 0x0Fu; min_cp = 0x800u;
        } else if ((lead & 0xF8u) == 0xF0u) {
            len = 4; cp = lead & 0x07u; min_cp = 0x10000u;
        } else {
            return Utf8Failure{i, "invalid leading byte"};
        }

        if (n - i < len) {
            return Utf8Failure{i, "truncated sequence"};
        }
        for (std::size_t k = 1; k < len; ++k) {
            if (!is_cont(i + k)) {
                return Utf8Failure{i, "missing continuation byte"};
            }
            cp = (cp << 6) | (byte(i + k) & 0x3Fu);
        }

        if (cp < min_cp) {
            return Utf8Failure{i, "overlong encoding"};
        }
        if (cp >= 0xD800u && cp <= 0xDFFFu) {
            return Utf8Failure{i, "surrogate code point"};
        }
        if (cp > 0x10FFFFu) {
            return Utf8Failure{i, "code point above U+10FFFF"};
        }
        i += len;
    }
    return std::nullopt;
}

} // namespace ort_bridge
