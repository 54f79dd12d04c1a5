#include "ADL/Utf8.hpp"
#include <sstream>

namespace ADL {

namespace {

// Width of a sequence introduced by lead byte b, 0 if b can never start one.
std::size_t sequenceWidth(uint8_t b) {
    if (b < 0x80) return 1;
    if (b >= 0xC2 && b <= 0xDF) return 2;
    if ((b & 0xF0) == 0xE0) return 3;
    if (b >= 0xF0 && b <= 0xF4) return 4;
    return 0;
}

} // anonymous namespace

std::string Utf8Error::message() const {
    std::ostringstream oss;
    if (errorLength) {
        oss << "invalid utf-8 sequence of " << *errorLength << " bytes from index " << validUpTo;
    } else {
        oss << "incomplete utf-8 byte sequence from index " << validUpTo;
    }
    return oss.str();
}

std::expected<std::string_view, Utf8Error> decodeUtf8(const std::vector<uint8_t>& bytes) {
    const std::size_t size = bytes.size();
    std::size_t i = 0;
    while (i < size) {
        const uint8_t lead = bytes[i];
        const std::size_t width = sequenceWidth(lead);
        if (width == 0) {
            return std::unexpected(Utf8Error{i, 1});
        }
        for (std::size_t k = 1; k < width; ++k) {
            if (i + k >= size) {
                return std::unexpected(Utf8Error{i, std::nullopt});
            }
            // Second-byte ranges exclude overlongs (E0, F0), surrogates (ED) and > U+10FFFF (F4)
            uint8_t lo = 0x80;
            uint8_t hi = 0xBF;
            if (k == 1) {
                if (lead == 0xE0) lo = 0xA0;
                else if (lead == 0xED) hi = 0x9F;
                else if (lead == 0xF0) lo = 0x90;
                else if (lead == 0xF4) hi = 0x8F;
            }
            const uint8_t c = bytes[i + k];
            if (c < lo || c > hi) {
                return std::unexpected(Utf8Error{i, k});
            }
        }
        i += width;
    }
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), size);
}

} // namespace ADL
