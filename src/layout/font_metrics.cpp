#include <loom/layout/font_metrics.h>
#include <numeric>

#include <unicode/uchar.h>

namespace loom::layout {

float TextMetrics::width() const {
    return std::accumulate(advances.begin(), advances.end(), 0.0f);
}

std::vector<char32_t> decode_utf8(std::string_view text) {
    std::vector<char32_t> out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto b0 = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        char32_t cp = 0;
        if (b0 < 0x80) {
            len = 1;
            cp = b0;
        } else if ((b0 & 0xE0) == 0xC0) {
            len = 2;
            cp = b0 & 0x1F;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3;
            cp = b0 & 0x0F;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4;
            cp = b0 & 0x07;
        }

        bool valid = len > 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            auto b = static_cast<unsigned char>(text[i + k]);
            if ((b & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

float FixedFontMetrics::advance(const FontSpec& font, char32_t code_point) const {
    auto c = static_cast<UChar32>(code_point);
    int8_t type = u_charType(c);
    if (type == U_NON_SPACING_MARK || type == U_ENCLOSING_MARK || type == U_CONTROL_CHAR ||
        c == 0x200B || c == 0x200C || c == 0x200D || c == 0xFEFF) {
        return 0;
    }

    auto width = static_cast<UEastAsianWidth>(u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH));
    if (width == U_EA_WIDE || width == U_EA_FULLWIDTH) {
        return font.size;
    }
    return font.size * (font.bold ? 0.55f : 0.5f);
}

TextMetrics FixedFontMetrics::measure(const FontSpec& font, std::string_view text) const {
    TextMetrics metrics;
    for (char32_t cp : decode_utf8(text)) {
        metrics.advances.push_back(advance(font, cp));
    }
    metrics.ascent = font.size * 0.8f;
    metrics.descent = font.size * 0.2f;
    metrics.line_height = font.size * 1.2f;
    return metrics;
}

} // namespace loom::layout
