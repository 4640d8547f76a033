#include <hudtext/profiles.h>
#include <ytrace/ytrace.hpp>

namespace hudtext::profiles {

const std::vector<DisplayProfile::Ptr>& all() {
    static const std::vector<DisplayProfile::Ptr> profiles = {
        g1(), g1Legacy(), z100(), nex(),
    };
    return profiles;
}

Result<DisplayProfile::Ptr> findProfile(std::string_view id) {
    for (const auto& profile : all()) {
        if (profile->id == id) {
            return Ok(profile);
        }
    }
    // Short aliases used on the command line
    if (id == "g1") return Ok(g1());
    if (id == "g1-legacy") return Ok(g1Legacy());
    if (id == "z100") return Ok(z100());
    if (id == "nex") return Ok(nex());

    ydebug("findProfile: no profile named '{}'", id);
    return Err<DisplayProfile::Ptr>("Unknown display profile: " + std::string(id));
}

} // namespace hudtext::profiles
