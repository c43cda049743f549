#pragma once

#include <cstdint>
#include <optional>
#include <stepplot/color.hpp>
#include <string_view>
#include <vector>

namespace stepplot
{

// ─── Dash Styles ─────────────────────────────────────────────────────────────
// Presets for LineStyle::dashes, named after MATLAB line specifiers.

enum class DashStyle : uint8_t
{
    Solid,       // '-'   ────────────
    Dashed,      // '--'  ── ── ── ──
    Dotted,      // ':'   ··············
    DashDot,     // '-.'  ──·──·──·──
    DashDotDot,  // '-..' ──··──··──··
};

constexpr const char* dash_style_name(DashStyle s)
{
    switch (s)
    {
        case DashStyle::Solid:
            return "Solid";
        case DashStyle::Dashed:
            return "Dashed";
        case DashStyle::Dotted:
            return "Dotted";
        case DashStyle::DashDot:
            return "Dash-Dot";
        case DashStyle::DashDotDot:
            return "Dash-Dot-Dot";
    }
    return "Unknown";
}

constexpr const char* dash_style_symbol(DashStyle s)
{
    switch (s)
    {
        case DashStyle::Solid:
            return "-";
        case DashStyle::Dashed:
            return "--";
        case DashStyle::Dotted:
            return ":";
        case DashStyle::DashDot:
            return "-.";
        case DashStyle::DashDotDot:
            return "-..";
    }
    return "";
}

constexpr int DASH_STYLE_COUNT = 5;

constexpr DashStyle ALL_DASH_STYLES[] = {
    DashStyle::Solid,
    DashStyle::Dashed,
    DashStyle::Dotted,
    DashStyle::DashDot,
    DashStyle::DashDotDot,
};

// Alternating on/off lengths in canvas units, scaled by the line width.
// Solid lines have an empty pattern.
inline std::vector<double> dash_pattern(DashStyle style, double line_width = 1.0)
{
    const double w = line_width;
    switch (style)
    {
        case DashStyle::Solid:
            return {};
        case DashStyle::Dashed:
            return {8.0 * w, 4.0 * w};
        case DashStyle::Dotted:
            return {2.0 * w, 4.0 * w};
        case DashStyle::DashDot:
            return {8.0 * w, 3.5 * w, 2.0 * w, 3.5 * w};
        case DashStyle::DashDotDot:
            return {8.0 * w, 3.0 * w, 2.0 * w, 3.0 * w, 2.0 * w, 3.0 * w};
    }
    return {};
}

// ─── Line Style ──────────────────────────────────────────────────────────────
// Stroke parameters handed to the canvas. Opaque to path construction.

struct LineStyle
{
    double              width = 1.0;
    Color               color = colors::black;
    std::vector<double> dashes;   // empty = solid
    double              dash_offset = 0.0;

    bool is_dashed() const { return !dashes.empty(); }

    LineStyle& dash(DashStyle style)
    {
        dashes = dash_pattern(style, width);
        return *this;
    }

    bool operator==(const LineStyle&) const = default;
};

// One unit wide, solid black.
inline LineStyle default_line_style()
{
    return LineStyle{};
}

// ─── MATLAB Line Spec Parser ─────────────────────────────────────────────────
// Parses strings like "r--", "b:", "-.g", "k".
//
// Format: [color][dash], in either order
//   Color chars: r g b c m y k w
//   Dashes:      - -- : -. -..
//
// Examples:
//   ""       → default_line_style()
//   "r"      → red solid line
//   "r--"    → red dashed line
//   ":k"     → black dotted line
//
// Unknown characters are skipped.

struct LineSpec
{
    std::optional<Color> color;   // nullopt = keep the current color
    DashStyle            dash = DashStyle::Solid;
};

inline LineSpec parse_line_spec_parts(std::string_view spec)
{
    LineSpec out;

    size_t i = 0;
    while (i < spec.size())
    {
        char c = spec[i];

        // ── Color specifiers ──
        auto try_color = [&]() -> bool
        {
            switch (c)
            {
                case 'r':
                    out.color = colors::red;
                    return true;
                case 'g':
                    out.color = colors::green;
                    return true;
                case 'b':
                    out.color = colors::blue;
                    return true;
                case 'c':
                    out.color = colors::cyan;
                    return true;
                case 'm':
                    out.color = colors::magenta;
                    return true;
                case 'y':
                    out.color = colors::yellow;
                    return true;
                case 'k':
                    out.color = colors::black;
                    return true;
                case 'w':
                    out.color = colors::white;
                    return true;
                default:
                    return false;
            }
        };

        // ── Dash specifiers (multi-char first) ──
        auto try_dash = [&]() -> bool
        {
            if (c == '-')
            {
                if (i + 1 < spec.size() && spec[i + 1] == '-')
                {
                    out.dash = DashStyle::Dashed;
                    i += 2;
                    return true;
                }
                if (i + 2 < spec.size() && spec[i + 1] == '.' && spec[i + 2] == '.')
                {
                    out.dash = DashStyle::DashDotDot;
                    i += 3;
                    return true;
                }
                if (i + 1 < spec.size() && spec[i + 1] == '.')
                {
                    out.dash = DashStyle::DashDot;
                    i += 2;
                    return true;
                }
                out.dash = DashStyle::Solid;
                i += 1;
                return true;
            }
            if (c == ':')
            {
                out.dash = DashStyle::Dotted;
                i += 1;
                return true;
            }
            return false;
        };

        if (try_dash())
            continue;
        try_color();
        ++i;
    }

    return out;
}

// Applies color and dash from `spec` to `base`, keeping its width.
inline LineStyle apply_line_spec(LineStyle base, std::string_view spec)
{
    const LineSpec parts = parse_line_spec_parts(spec);
    if (parts.color.has_value())
        base.color = *parts.color;
    base.dash(parts.dash);
    return base;
}

inline LineStyle parse_line_spec(std::string_view spec)
{
    return apply_line_spec(default_line_style(), spec);
}

}   // namespace stepplot
