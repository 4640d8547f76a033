#pragma once

#include <hudtext/display-profile.h>
#include <string_view>
#include <vector>

namespace hudtext::profiles {

// Rendered hyphen and space widths of the built-in fonts
constexpr int kG1HyphenWidthPx = 10;
constexpr int kG1SpaceWidthPx = 6;
constexpr int kZ100HyphenWidthPx = 7;
constexpr int kZ100SpaceWidthPx = 5;

// Even Realities G1: 576px, 5 lines, pixels = (glyphUnits + 1) * 2
const DisplayProfile::Ptr& g1();

// G1 at 420px for clients that wrap a second time on the phone side
const DisplayProfile::Ptr& g1Legacy();

// Vuzix Z100: 390px, 7 lines, glyph table already in pixels
const DisplayProfile::Ptr& z100();

// Mentra Nex: same font and geometry as the G1
const DisplayProfile::Ptr& nex();

const std::vector<DisplayProfile::Ptr>& all();

Result<DisplayProfile::Ptr> findProfile(std::string_view id);

} // namespace hudtext::profiles
