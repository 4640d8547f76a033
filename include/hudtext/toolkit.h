#pragma once

#include <hudtext/column-composer.h>
#include <hudtext/display-helpers.h>
#include <hudtext/display-profile.h>
#include <hudtext/result.hpp>
#include <hudtext/text-measurer.h>
#include <hudtext/text-wrapper.h>

namespace hudtext {

// Everything a caller needs to lay text out for one glasses model
struct DisplayToolkit {
    DisplayProfile::Ptr profile;
    TextMeasurer::Ptr measurer;
    TextWrapper::Ptr wrapper;
    DisplayHelpers::Ptr helpers;
    ColumnComposer::Ptr composer;
};

// The composer uses wrapOptions.breakMode, or Word when unset
Result<DisplayToolkit> createDisplayToolkit(DisplayProfile::Ptr profile,
                                            const WrapOptions& wrapOptions = {}) noexcept;

// Built-in profiles, CharacterNoHyphen
Result<DisplayToolkit> createG1Toolkit() noexcept;
Result<DisplayToolkit> createG1LegacyToolkit() noexcept;
Result<DisplayToolkit> createZ100Toolkit() noexcept;
Result<DisplayToolkit> createNexToolkit() noexcept;

} // namespace hudtext
