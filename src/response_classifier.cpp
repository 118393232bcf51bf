#include "response_classifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace {

constexpr double kMinPrintableRatio = 0.7;
constexpr std::size_t kMaxStatusLength = 50;

// Matched case-insensitively as substrings.
constexpr std::array<std::string_view, 6> kResponseTokens = {
    "ok", "error", "timeout", "out of range", "false", "true"
};

bool is_ascii(std::string_view bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

bool is_printable(unsigned char c) {
    return c >= 32 && c <= 126;
}

bool is_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        std::size_t extra = 0;
        unsigned int code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF are rejected.
        if ((extra == 2 && code_point < 0x800) ||
            (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            out.push_back(c);
        } else {
            out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return out;
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\n\r\v\f";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::size_t count_code_points(std::string_view utf8) {
    return static_cast<std::size_t>(std::count_if(utf8.begin(), utf8.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

bool is_all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool parses_as_float(const std::string& text) {
    char* end = nullptr;
    std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

} // namespace

bool is_binary(std::string_view bytes) {
    if (is_ascii(bytes)) {
        return false;
    }
    auto printable = std::count_if(bytes.begin(), bytes.end(), [](char c) {
        return is_printable(static_cast<unsigned char>(c));
    });
    return static_cast<double>(printable) / static_cast<double>(bytes.size()) < kMinPrintableRatio;
}

std::optional<std::string> decode_text(std::string_view bytes) {
    // ASCII is a subset of UTF-8.
    if (is_utf8(bytes)) {
        return trim(bytes);
    }
    // Latin-1 maps every byte, so this branch cannot fail.
    return trim(latin1_to_utf8(bytes));
}

bool is_valid_response(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    if (is_all_digits(text)) {
        return true;
    }
    const std::string lowered = to_lower(text);
    for (auto token : kResponseTokens) {
        if (lowered.find(token) != std::string::npos) {
            return true;
        }
    }
    if (parses_as_float(std::string(text))) {
        return true;
    }
    // Short free-form status strings are accepted as-is.
    return count_code_points(text) <= kMaxStatusLength;
}

std::optional<std::string> classify_datagram(std::string_view bytes) {
    if (bytes.empty() || is_binary(bytes)) {
        return std::nullopt;
    }
    auto text = decode_text(bytes);
    if (!text || !is_valid_response(*text)) {
        return std::nullopt;
    }
    return text;
}
