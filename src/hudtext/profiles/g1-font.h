#pragma once

#include <hudtext/display-profile.h>

namespace hudtext::profiles {

// G1 hardware font. Shared by every profile that ships the G1 firmware font.
DisplayProfile makeG1Profile(std::string id, std::string name, int displayWidthPx);

} // namespace hudtext::profiles
