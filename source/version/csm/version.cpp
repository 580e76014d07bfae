#include <csm/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view CardSheetMakerVersion()
{
#ifdef CSM_VERSION
    return TOSTRING(CSM_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view CardSheetMakerBuildTime()
{
#ifdef CSM_NOW
    return TOSTRING(CSM_NOW);
#else
    return "<unknown build time>";
#endif
}
