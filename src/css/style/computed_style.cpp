#include <loom/css/style/computed_style.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <unordered_map>

namespace loom::css {

const std::vector<PropertyDefinition>& property_registry() {
    static const std::vector<PropertyDefinition> registry = {
        {"display", "inline", false},
        {"color", "black", true},
        {"background-color", "transparent", false},
        {"font-size", "16px", true},
        {"font-weight", "normal", true},
        {"font-style", "normal", true},
        {"font-family", "serif", true},
        {"text-align", "left", true},
        {"line-height", "normal", true},
        {"white-space", "normal", true},
        {"width", "auto", false},
        {"height", "auto", false},
        {"margin-top", "0", false},
        {"margin-right", "0", false},
        {"margin-bottom", "0", false},
        {"margin-left", "0", false},
        {"padding-top", "0", false},
        {"padding-right", "0", false},
        {"padding-bottom", "0", false},
        {"padding-left", "0", false},
        {"border-top-width", "0", false},
        {"border-right-width", "0", false},
        {"border-bottom-width", "0", false},
        {"border-left-width", "0", false},
        {"border-top-color", "currentcolor", false},
        {"border-right-color", "currentcolor", false},
        {"border-bottom-color", "currentcolor", false},
        {"border-left-color", "currentcolor", false},
    };
    return registry;
}

const PropertyDefinition* find_property(std::string_view name) {
    for (const auto& def : property_registry()) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

// ============================================================================
// Colors
// ============================================================================

static std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::optional<Color> parse_hex_color(const std::string& hex) {
    for (char c : hex) {
        if (hex_value(c) < 0) return std::nullopt;
    }
    auto nibble = [&](size_t i) { return static_cast<uint8_t>(hex_value(hex[i]) * 17); };
    auto byte = [&](size_t i) {
        return static_cast<uint8_t>(hex_value(hex[i]) * 16 + hex_value(hex[i + 1]));
    };
    switch (hex.size()) {
        case 3: return Color{nibble(0), nibble(1), nibble(2), 255};
        case 4: return Color{nibble(0), nibble(1), nibble(2), nibble(3)};
        case 6: return Color{byte(0), byte(2), byte(4), 255};
        case 8: return Color{byte(0), byte(2), byte(4), byte(6)};
        default: return std::nullopt;
    }
}

static std::optional<float> parse_number(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    float v = std::strtof(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return std::nullopt;
    return v;
}

static uint8_t clamp_channel(float v) {
    return static_cast<uint8_t>(std::clamp(std::round(v), 0.0f, 255.0f));
}

// rgb() and rgba() share one grammar; both accept an optional alpha.
static std::optional<Color> parse_rgb_function(const std::string& args) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : args) {
        if (c == ',' || c == ' ' || c == '/') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) parts.push_back(current);
    if (parts.size() != 3 && parts.size() != 4) return std::nullopt;

    Color color;
    uint8_t* channels[3] = {&color.r, &color.g, &color.b};
    for (size_t i = 0; i < 3; ++i) {
        std::string p = parts[i];
        bool percent = !p.empty() && p.back() == '%';
        if (percent) p.pop_back();
        auto v = parse_number(p);
        if (!v) return std::nullopt;
        *channels[i] = clamp_channel(percent ? *v * 2.55f : *v);
    }
    if (parts.size() == 4) {
        std::string p = parts[3];
        bool percent = !p.empty() && p.back() == '%';
        if (percent) p.pop_back();
        auto v = parse_number(p);
        if (!v) return std::nullopt;
        float alpha = percent ? *v / 100.0f : *v;
        color.a = clamp_channel(std::clamp(alpha, 0.0f, 1.0f) * 255.0f);
    }
    return color;
}

std::optional<Color> parse_color(const std::string& value) {
    static const std::unordered_map<std::string, Color> named = {
        {"black", {0, 0, 0, 255}},
        {"silver", {192, 192, 192, 255}},
        {"gray", {128, 128, 128, 255}},
        {"grey", {128, 128, 128, 255}},
        {"white", {255, 255, 255, 255}},
        {"maroon", {128, 0, 0, 255}},
        {"red", {255, 0, 0, 255}},
        {"purple", {128, 0, 128, 255}},
        {"fuchsia", {255, 0, 255, 255}},
        {"magenta", {255, 0, 255, 255}},
        {"green", {0, 128, 0, 255}},
        {"lime", {0, 255, 0, 255}},
        {"olive", {128, 128, 0, 255}},
        {"yellow", {255, 255, 0, 255}},
        {"navy", {0, 0, 128, 255}},
        {"blue", {0, 0, 255, 255}},
        {"teal", {0, 128, 128, 255}},
        {"aqua", {0, 255, 255, 255}},
        {"cyan", {0, 255, 255, 255}},
        {"orange", {255, 165, 0, 255}},
        {"brown", {165, 42, 42, 255}},
        {"pink", {255, 192, 203, 255}},
        {"gold", {255, 215, 0, 255}},
        {"indigo", {75, 0, 130, 255}},
        {"violet", {238, 130, 238, 255}},
        {"lightgray", {211, 211, 211, 255}},
        {"lightgrey", {211, 211, 211, 255}},
        {"darkgray", {169, 169, 169, 255}},
        {"darkgrey", {169, 169, 169, 255}},
        {"lightblue", {173, 216, 230, 255}},
        {"darkblue", {0, 0, 139, 255}},
        {"darkred", {139, 0, 0, 255}},
        {"darkgreen", {0, 100, 0, 255}},
        {"whitesmoke", {245, 245, 245, 255}},
        {"beige", {245, 245, 220, 255}},
        {"transparent", {0, 0, 0, 0}},
    };

    std::string v = to_lower(trim(value));
    if (v.empty()) return std::nullopt;

    if (v[0] == '#') {
        return parse_hex_color(v.substr(1));
    }

    auto it = named.find(v);
    if (it != named.end()) {
        return it->second;
    }

    auto open = v.find('(');
    if (open != std::string::npos && v.back() == ')') {
        std::string fn = trim(v.substr(0, open));
        std::string args = v.substr(open + 1, v.size() - open - 2);
        if (fn == "rgb" || fn == "rgba") {
            return parse_rgb_function(args);
        }
    }

    return std::nullopt;
}

std::string color_to_string(const Color& color) {
    char buf[32];
    if (color.a == 255) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    }
    return buf;
}

// ============================================================================
// Lengths
// ============================================================================

float Length::to_px(float percent_base, float em_base) const {
    switch (unit) {
        case Unit::Px:      return value;
        case Unit::Em:      return value * em_base;
        case Unit::Percent: return value / 100.0f * percent_base;
        case Unit::Auto:    return 0;
    }
    return 0;
}

std::optional<Length> parse_length(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v.empty()) return std::nullopt;
    if (v == "auto") return Length::auto_val();

    size_t i = 0;
    if (v[i] == '+' || v[i] == '-') ++i;
    bool digits = false;
    while (i < v.size() && (std::isdigit(static_cast<unsigned char>(v[i])) || v[i] == '.')) {
        digits = digits || std::isdigit(static_cast<unsigned char>(v[i]));
        ++i;
    }
    if (!digits) return std::nullopt;

    auto number = parse_number(v.substr(0, i));
    if (!number) return std::nullopt;
    std::string unit = v.substr(i);

    if (unit.empty()) {
        // Only zero may omit its unit.
        if (*number == 0) return Length::px(0);
        return std::nullopt;
    }
    if (unit == "px") return Length::px(*number);
    if (unit == "pt") return Length::px(*number * 4.0f / 3.0f);
    if (unit == "em") return Length::em(*number);
    if (unit == "rem") return Length::px(*number * 16.0f);
    if (unit == "%") return Length::percent(*number);
    return std::nullopt;
}

std::optional<float> resolve_font_size(const std::string& value, float parent_font_size) {
    static const std::unordered_map<std::string, float> keywords = {
        {"xx-small", 9.0f}, {"x-small", 10.0f}, {"small", 13.0f},
        {"medium", 16.0f}, {"large", 18.0f}, {"x-large", 24.0f},
        {"xx-large", 32.0f}, {"xxx-large", 48.0f},
    };

    std::string v = to_lower(trim(value));
    auto it = keywords.find(v);
    if (it != keywords.end()) return it->second;
    if (v == "smaller") return parent_font_size / 1.2f;
    if (v == "larger") return parent_font_size * 1.2f;

    auto length = parse_length(v);
    if (!length || length->is_auto() || length->value < 0) return std::nullopt;
    return length->to_px(parent_font_size, parent_font_size);
}

std::string format_px(float px) {
    char buf[32];
    float rounded = std::round(px * 100.0f) / 100.0f;
    std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(rounded));
    return std::string(buf) + "px";
}

// ============================================================================
// ComputedStyle
// ============================================================================

ComputedStyle ComputedStyle::initial() {
    ComputedStyle style;
    for (const auto& def : property_registry()) {
        style.values_.emplace(std::string(def.name), std::string(def.initial_value));
    }
    return style;
}

std::string ComputedStyle::get(std::string_view property) const {
    auto it = values_.find(property);
    if (it != values_.end()) {
        return it->second;
    }
    if (const auto* def = find_property(property)) {
        return std::string(def->initial_value);
    }
    return "";
}

void ComputedStyle::set(const std::string& property, std::string value) {
    values_[property] = std::move(value);
}

bool ComputedStyle::has(std::string_view property) const {
    return values_.find(property) != values_.end();
}

} // namespace loom::css
