#include "text.hpp"

namespace scry::engine::text {

    namespace {

        // Decodes one sequence at s[i]. Returns its byte length, 0 if invalid.
        size_t decode(const std::string& s, size_t i, uint32_t& cp) {
            const auto* p = reinterpret_cast<const unsigned char*>(s.data());
            size_t n = s.size();
            unsigned char c = p[i];

            if (c < 0x80) { cp = c; return 1; }

            size_t len;
            uint32_t min;
            if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
            else return 0;

            if (i + len > n) return 0;
            for (size_t k = 1; k < len; ++k) {
                if ((p[i + k] & 0xC0) != 0x80) return 0;
                cp = (cp << 6) | (p[i + k] & 0x3F);
            }
            if (cp < min || cp > 0x10FFFF) return 0;
            if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
            return len;
        }

    }

    bool is_valid_utf8(const std::string& s) {
        size_t i = 0;
        uint32_t cp;
        while (i < s.size()) {
            size_t len = decode(s, i, cp);
            if (len == 0) return false;
            i += len;
        }
        return true;
    }

    std::string utf8_truncate(const std::string& s, size_t max_bytes) {
        if (s.size() <= max_bytes) return s;
        size_t cut = max_bytes;
        // Back up to a lead byte so the cut never lands inside a sequence.
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
        return s.substr(0, cut);
    }

    std::vector<uint16_t> utf16_units(const std::string& s) {
        std::vector<uint16_t> units;
        units.reserve(s.size());
        size_t i = 0;
        uint32_t cp;
        while (i < s.size()) {
            size_t len = decode(s, i, cp);
            if (len == 0) {
                cp = 0xFFFD;
                len = 1;
            }
            if (cp >= 0x10000) {
                cp -= 0x10000;
                units.push_back(static_cast<uint16_t>(0xD800 + (cp >> 10)));
                units.push_back(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
            } else {
                units.push_back(static_cast<uint16_t>(cp));
            }
            i += len;
        }
        return units;
    }

    std::vector<std::string> split_lines(const std::string& s) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (true) {
            size_t nl = s.find('\n', start);
            if (nl == std::string::npos) {
                lines.push_back(s.substr(start));
                break;
            }
            lines.push_back(s.substr(start, nl - start));
            start = nl + 1;
        }
        return lines;
    }

    std::string join_lines(const std::vector<std::string>& lines, size_t begin, size_t end) {
        std::string out;
        for (size_t i = begin; i < end; ++i) {
            if (i > begin) out += '\n';
            out += lines[i];
        }
        return out;
    }

}
