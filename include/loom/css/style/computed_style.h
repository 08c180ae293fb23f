#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom::css {

struct PropertyDefinition {
    std::string_view name;
    std::string_view initial_value;
    bool inherited;
};

// Every property the resolver knows about. Declarations naming anything else
// are skipped by the cascade.
const std::vector<PropertyDefinition>& property_registry();
const PropertyDefinition* find_property(std::string_view name);

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    bool is_transparent() const { return a == 0; }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

// Accepts named colors, #rgb, #rrggbb, #rrggbbaa, rgb() and rgba().
std::optional<Color> parse_color(const std::string& value);
std::string color_to_string(const Color& color);

struct Length {
    enum class Unit { Px, Em, Percent, Auto };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length em(float v) { return {v, Unit::Em}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length auto_val() { return {0, Unit::Auto}; }

    bool is_auto() const { return unit == Unit::Auto; }

    // percent_base is the containing block dimension, em_base the font size.
    float to_px(float percent_base, float em_base) const;

    bool operator==(const Length& other) const {
        return value == other.value && unit == other.unit;
    }
};

// Accepts "auto", unitless zero, and px/pt/em/rem/% dimensions.
std::optional<Length> parse_length(const std::string& value);

// Resolves a font-size value (length, percentage or keyword) to px against the
// parent's font size.
std::optional<float> resolve_font_size(const std::string& value, float parent_font_size);

std::string format_px(float px);

// Resolved property values for one element. Once the resolver is done every
// registered property is present.
class ComputedStyle {
public:
    static ComputedStyle initial();

    // Returns the stored value, or the property's initial value when the slot
    // has not been resolved yet.
    std::string get(std::string_view property) const;
    void set(const std::string& property, std::string value);
    bool has(std::string_view property) const;

    const std::map<std::string, std::string, std::less<>>& values() const { return values_; }
    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    bool operator==(const ComputedStyle& other) const { return values_ == other.values_; }

private:
    std::map<std::string, std::string, std::less<>> values_;
};

} // namespace loom::css
