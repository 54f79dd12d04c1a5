// include/ADL/Utf8.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ADL {

/**
 * @brief Describes where a byte buffer stops being valid UTF-8.
 */
struct Utf8Error {
    std::size_t validUpTo = 0;               ///< Length of the longest valid prefix
    std::optional<std::size_t> errorLength;  ///< Bytes in the invalid sequence, empty if the input ended mid-sequence

    std::string message() const;

    bool operator==(const Utf8Error&) const = default;
};

/**
 * @brief Validate a byte buffer as UTF-8 and view it as text.
 * @param bytes Raw bytes, e.g. a captured process stream
 * @return View over @p bytes on success, or the position of the first invalid sequence
 *
 * Overlong encodings, surrogate code points and code points above U+10FFFF are rejected.
 */
std::expected<std::string_view, Utf8Error> decodeUtf8(const std::vector<uint8_t>& bytes);

} // namespace ADL
