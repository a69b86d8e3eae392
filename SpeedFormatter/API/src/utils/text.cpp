#include "utils/text.h"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace {
const char kReplacement[] = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at i, or the number of bytes
// forming the maximal invalid prefix (>= 1) negated.
long sequence_length(const std::string& s, std::size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;

    std::size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        need = 1;
    } else if (c == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        need = 2;
    } else if (c == 0xED) {
        need = 2; hi = 0x9F;
    } else if (c == 0xF0) {
        need = 3; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        need = 3;
    } else if (c == 0xF4) {
        need = 3; hi = 0x8F;
    } else {
        return -1;
    }

    std::size_t got = 0;
    for (std::size_t k = 1; k <= need; ++k) {
        if (i + k >= s.size()) break;
        const unsigned char n = static_cast<unsigned char>(s[i + k]);
        const bool ok = (k == 1) ? (n >= lo && n <= hi) : is_continuation(n);
        if (!ok) break;
        ++got;
    }
    if (got == need) return static_cast<long>(need + 1);
    return -static_cast<long>(got + 1);
}
} // namespace

std::string lossy_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const long len = sequence_length(bytes, i);
        if (len > 0) {
            out.append(bytes, i, static_cast<std::size_t>(len));
            i += static_cast<std::size_t>(len);
        } else {
            out += kReplacement;
            i += static_cast<std::size_t>(-len);
        }
    }
    return out;
}

std::string trim_copy(std::string s) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}
