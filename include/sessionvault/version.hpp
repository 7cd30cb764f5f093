#pragma once

#define SESSIONVAULT_VERSION_MAJOR 0
#define SESSIONVAULT_VERSION_MINOR 1
#define SESSIONVAULT_VERSION_PATCH 0

#define SESSIONVAULT_STRINGIFY_IMPL(x) #x
#define SESSIONVAULT_STRINGIFY(x) SESSIONVAULT_STRINGIFY_IMPL(x)

#define SESSIONVAULT_VERSION_STRING                 \
  SESSIONVAULT_STRINGIFY(SESSIONVAULT_VERSION_MAJOR) "." \
  SESSIONVAULT_STRINGIFY(SESSIONVAULT_VERSION_MINOR) "." \
  SESSIONVAULT_STRINGIFY(SESSIONVAULT_VERSION_PATCH)

// MMmmpp, for #if checks against a minimum library version
#define SESSIONVAULT_VERSION                                          \
  (SESSIONVAULT_VERSION_MAJOR * 10000 + SESSIONVAULT_VERSION_MINOR * 100 + \
   SESSIONVAULT_VERSION_PATCH)

namespace sessionvault {

/** Library version of the linked build, e.g. "0.1.0". */
inline const char* Version() { return SESSIONVAULT_VERSION_STRING; }

}  // namespace sessionvault
