/**
 * @file Util.cpp
 * @brief String helpers: splitting, trimming, ASCII folding, natural order
 */

#include "fluent/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace fluent {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(start, end - start + 1);
}

namespace {
    // U+00C0 .. U+00FF
    const char* const kLatin1[64] = {
        "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
        "D", "N", "O", "O", "O", "O", "O", "x", "O", "U", "U", "U", "U", "Y", "TH", "ss",
        "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
        "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y",
    };

    // U+0100 .. U+017F
    const char* const kLatinExtA[128] = {
        "A", "a", "A", "a", "A", "a", "C", "c", "C", "c", "C", "c", "C", "c", "D", "d",
        "D", "d", "E", "e", "E", "e", "E", "e", "E", "e", "E", "e", "G", "g", "G", "g",
        "G", "g", "G", "g", "H", "h", "H", "h", "I", "i", "I", "i", "I", "i", "I", "i",
        "I", "i", "IJ", "ij", "J", "j", "K", "k", "k", "L", "l", "L", "l", "L", "l", "L",
        "l", "L", "l", "N", "n", "N", "n", "N", "n", "n", "N", "n", "O", "o", "O", "o",
        "O", "o", "OE", "oe", "R", "r", "R", "r", "R", "r", "S", "s", "S", "s", "S", "s",
        "S", "s", "T", "t", "T", "t", "T", "t", "U", "u", "U", "u", "U", "u", "U", "u",
        "U", "u", "U", "u", "W", "w", "Y", "y", "Y", "Z", "z", "Z", "z", "Z", "z", "s",
    };

    /**
     * @brief Decode one UTF-8 code point starting at `i`, advancing `i`.
     * @return The code point, or 0xFFFD for a malformed sequence
     */
    std::uint32_t next_code_point(const std::string& s, size_t& i) {
        const auto lead = static_cast<unsigned char>(s[i++]);
        if (lead < 0x80) return lead;

        int extra = 0;
        std::uint32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
        else return 0xFFFD;

        for (int k = 0; k < extra; ++k) {
            if (i >= s.size()) return 0xFFFD;
            const auto cont = static_cast<unsigned char>(s[i]);
            if ((cont & 0xC0) != 0x80) return 0xFFFD;
            cp = (cp << 6) | (cont & 0x3F);
            ++i;
        }
        return cp;
    }
}

std::string fold_ascii(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const std::uint32_t cp = next_code_point(s, i);
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp == 0xA0) {
            out += ' ';
        } else if (cp >= 0xC0 && cp <= 0xFF) {
            out += kLatin1[cp - 0xC0];
        } else if (cp >= 0x100 && cp <= 0x17F) {
            out += kLatinExtA[cp - 0x100];
        }
        // anything else has no ASCII form and is dropped
    }
    return out;
}

int natural_compare(const std::string& a, const std::string& b, bool fold_case) {
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[j]);

        if (std::isdigit(ca) && std::isdigit(cb)) {
            // Compare digit runs by magnitude: skip leading zeros, then length, then digits
            size_t ia = i;
            size_t jb = j;
            while (ia < a.size() && a[ia] == '0') ++ia;
            while (jb < b.size() && b[jb] == '0') ++jb;
            size_t ea = ia;
            size_t eb = jb;
            while (ea < a.size() && std::isdigit(static_cast<unsigned char>(a[ea]))) ++ea;
            while (eb < b.size() && std::isdigit(static_cast<unsigned char>(b[eb]))) ++eb;

            const size_t len_a = ea - ia;
            const size_t len_b = eb - jb;
            if (len_a != len_b) return len_a < len_b ? -1 : 1;

            const int cmp = a.compare(ia, len_a, b, jb, len_b);
            if (cmp != 0) return cmp < 0 ? -1 : 1;

            i = ea;
            j = eb;
            continue;
        }

        const int xa = fold_case ? std::tolower(ca) : ca;
        const int xb = fold_case ? std::tolower(cb) : cb;
        if (xa != xb) return xa < xb ? -1 : 1;
        ++i;
        ++j;
    }

    if (i < a.size()) return 1;
    if (j < b.size()) return -1;
    return 0;
}

} // namespace fluent
