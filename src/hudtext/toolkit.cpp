#include <hudtext/profiles.h>
#include <hudtext/toolkit.h>
#include <ytrace/ytrace.hpp>

namespace hudtext {

namespace {

Result<DisplayToolkit> createNoHyphenToolkit(const DisplayProfile::Ptr& profile) {
    WrapOptions options;
    options.breakMode = BreakMode::CharacterNoHyphen;
    return createDisplayToolkit(profile, options);
}

} // namespace

Result<DisplayToolkit> createDisplayToolkit(DisplayProfile::Ptr profile,
                                            const WrapOptions& wrapOptions) noexcept {
    DisplayToolkit toolkit;
    toolkit.profile = profile;

    auto measurer = TextMeasurer::create(profile);
    if (!measurer) {
        return Err<DisplayToolkit>("Failed to create TextMeasurer", measurer);
    }
    toolkit.measurer = *measurer;

    auto wrapper = TextWrapper::create(toolkit.measurer, wrapOptions);
    if (!wrapper) {
        return Err<DisplayToolkit>("Failed to create TextWrapper", wrapper);
    }
    toolkit.wrapper = *wrapper;

    auto helpers = DisplayHelpers::create(toolkit.measurer, toolkit.wrapper);
    if (!helpers) {
        return Err<DisplayToolkit>("Failed to create DisplayHelpers", helpers);
    }
    toolkit.helpers = *helpers;

    auto composer = ColumnComposer::create(toolkit.measurer,
                                           wrapOptions.breakMode.value_or(BreakMode::Word));
    if (!composer) {
        return Err<DisplayToolkit>("Failed to create ColumnComposer", composer);
    }
    toolkit.composer = *composer;

    ydebug("createDisplayToolkit: {} mode={}", profile->id,
           breakModeName(toolkit.wrapper->getOptions().breakMode));
    return Ok(std::move(toolkit));
}

Result<DisplayToolkit> createG1Toolkit() noexcept {
    return createNoHyphenToolkit(profiles::g1());
}

Result<DisplayToolkit> createG1LegacyToolkit() noexcept {
    return createNoHyphenToolkit(profiles::g1Legacy());
}

Result<DisplayToolkit> createZ100Toolkit() noexcept {
    return createNoHyphenToolkit(profiles::z100());
}

Result<DisplayToolkit> createNexToolkit() noexcept {
    return createNoHyphenToolkit(profiles::nex());
}

} // namespace hudtext
