#pragma once

#define ASCIIFY_VERSION_MAJOR 0
#define ASCIIFY_VERSION_MINOR 1
#define ASCIIFY_VERSION_PATCH 0

#define ASCIIFY_VERSION_STRING "0.1.0"

// For compile-time version checks
#define ASCIIFY_VERSION \
  (ASCIIFY_VERSION_MAJOR * 10000 + ASCIIFY_VERSION_MINOR * 100 + ASCIIFY_VERSION_PATCH)

namespace asciify {

inline const char* Version() { return ASCIIFY_VERSION_STRING; }

}  // namespace asciify
