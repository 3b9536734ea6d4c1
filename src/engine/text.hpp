#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace scry::engine::text {

    /**
     * @brief Strict UTF-8 check (rejects overlongs, surrogates and code points past U+10FFFF).
     */
    bool is_valid_utf8(const std::string& s);

    /**
     * @brief Cuts @p s to at most @p max_bytes without splitting a multi-byte sequence.
     */
    std::string utf8_truncate(const std::string& s, size_t max_bytes);

    /**
     * @brief Decodes UTF-8 into UTF-16 code units. Invalid bytes map to U+FFFD.
     */
    std::vector<uint16_t> utf16_units(const std::string& s);

    /**
     * @brief Splits on '\n'. Always returns at least one element; a trailing newline yields an empty last line.
     */
    std::vector<std::string> split_lines(const std::string& s);

    std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end);

}
