#include "g1-font.h"
#include <hudtext/profiles.h>

namespace hudtext::profiles {

// The Nex firmware ships the G1 font at the same geometry
const DisplayProfile::Ptr& nex() {
    static const DisplayProfile::Ptr profile = std::make_shared<const DisplayProfile>(
        makeG1Profile("mentra-nex", "Mentra Nex", 576));
    return profile;
}

} // namespace hudtext::profiles
