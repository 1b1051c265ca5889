// ==============================================================================
// unicode.cpp - UTF-16 code units <-> UTF-8
// ==============================================================================

#include <cstring>
#include <ntreg/unicode.hpp>

namespace ntreg {

namespace {

bool is_high_surrogate(char16_t c) {
    return c >= 0xD800 && c <= 0xDBFF;
}

bool is_low_surrogate(char16_t c) {
    return c >= 0xDC00 && c <= 0xDFFF;
}

void append_utf8(std::string& out, std::uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

const char* conversion_message(RegErrorKind kind) {
    return kind == RegErrorKind::StringConversion ? "Could not convert registry data to string"
                                                  : "Could not convert name into string";
}

}  // anonymous namespace

std::optional<CodeUnits> utf8_to_code_units(std::string_view text) {
    CodeUnits result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::uint32_t codepoint = 0;
        std::size_t extra = 0;

        if (lead < 0x80) {
            codepoint = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            codepoint = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            codepoint = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            codepoint = lead & 0x07;
            extra = 3;
        } else {
            return std::nullopt;
        }

        if (extra > 0 && i + extra >= text.size()) {
            return std::nullopt;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return std::nullopt;
            }
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }

        // Overlong-последовательности и surrogate code points невалидны
        constexpr std::uint32_t MIN_CODEPOINT[4] = {0, 0x80, 0x800, 0x10000};
        if (codepoint < MIN_CODEPOINT[extra] || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return std::nullopt;
        }

        if (codepoint >= 0x10000) {
            codepoint -= 0x10000;
            result.push_back(static_cast<char16_t>(0xD800 + (codepoint >> 10)));
            result.push_back(static_cast<char16_t>(0xDC00 + (codepoint & 0x3FF)));
        } else {
            result.push_back(static_cast<char16_t>(codepoint));
        }

        i += extra + 1;
    }

    return result;
}

std::variant<std::string, RegError> code_units_to_utf8(std::u16string_view units,
                                                       RegErrorKind kind) {
    std::string result;
    result.reserve(units.size());

    for (std::size_t i = 0; i < units.size(); ++i) {
        char16_t wchar = units[i];

        if (wchar == 0) {
            continue;
        }

        if (is_high_surrogate(wchar)) {
            if (i + 1 < units.size() && is_low_surrogate(units[i + 1])) {
                std::uint32_t codepoint =
                    0x10000 + ((static_cast<std::uint32_t>(wchar - 0xD800) << 10) |
                               static_cast<std::uint32_t>(units[i + 1] - 0xDC00));
                append_utf8(result, codepoint);
                ++i;
                continue;
            }
            return make_error(kind,
                              std::string(conversion_message(kind)) + ": unpaired high surrogate");
        }

        if (is_low_surrogate(wchar)) {
            return make_error(kind,
                              std::string(conversion_message(kind)) + ": unpaired low surrogate");
        }

        append_utf8(result, wchar);
    }

    return result;
}

CodeUnits strip_terminators(std::u16string_view units) {
    CodeUnits result;
    result.reserve(units.size());
    for (char16_t c : units) {
        if (c != 0) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<std::uint8_t> code_units_to_bytes(std::u16string_view units, bool terminate) {
    std::vector<std::uint8_t> bytes((units.size() + (terminate ? 1 : 0)) * sizeof(char16_t), 0);
    if (!units.empty()) {
        std::memcpy(bytes.data(), units.data(), units.size() * sizeof(char16_t));
    }
    return bytes;
}

}  // namespace ntreg
