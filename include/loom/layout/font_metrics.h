#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace loom::layout {

struct FontSpec {
    std::string family = "serif";
    float size = 16.0f;
    bool bold = false;
    bool italic = false;

    bool operator==(const FontSpec& other) const {
        return family == other.family && size == other.size &&
               bold == other.bold && italic == other.italic;
    }
};

struct TextMetrics {
    std::vector<float> advances;  // one entry per code point
    float ascent = 0;
    float descent = 0;
    float line_height = 0;

    float width() const;
};

// Font measurement capability injected into layout. Implementations must be
// deterministic and safe to call from several threads at once.
class FontMetrics {
public:
    virtual ~FontMetrics() = default;
    virtual TextMetrics measure(const FontSpec& font, std::string_view text) const = 0;
};

// Synthetic metrics with fixed advances: East Asian wide and fullwidth
// characters are one em wide, combining marks and zero-width characters take
// no space, everything else is half an em (slightly more for bold).
class FixedFontMetrics : public FontMetrics {
public:
    TextMetrics measure(const FontSpec& font, std::string_view text) const override;

    float advance(const FontSpec& font, char32_t code_point) const;
};

// Decodes UTF-8; invalid sequences decode to U+FFFD one byte at a time.
std::vector<char32_t> decode_utf8(std::string_view text);

} // namespace loom::layout
