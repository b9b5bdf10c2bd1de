#pragma once

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

#define PLUME_PROFILE_SCOPE() ZoneScoped
#define PLUME_PROFILE_SCOPE_NAMED(name) ZoneScopedN(name)
#define PLUME_PROFILE_FRAME_MARK() FrameMark
#define PLUME_PROFILE_PLOT(name, value) TracyPlot(name, value)

#else

#define PLUME_PROFILE_SCOPE()
#define PLUME_PROFILE_SCOPE_NAMED(name)
#define PLUME_PROFILE_FRAME_MARK()
#define PLUME_PROFILE_PLOT(name, value)

#endif
