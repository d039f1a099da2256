#ifndef SRC_LUNAR_VERSION_H_
#define SRC_LUNAR_VERSION_H_

#define LUNAR_MAJOR_VERSION 0
#define LUNAR_MINOR_VERSION 4
#define LUNAR_PATCH_VERSION 0

#define LUNAR_VERSION_IS_RELEASE 0

#ifndef LUNAR_STRINGIFY
#define LUNAR_STRINGIFY(n) LUNAR_STRINGIFY_HELPER(n)
#define LUNAR_STRINGIFY_HELPER(n) #n
#endif

#ifndef LUNAR_TAG
# if LUNAR_VERSION_IS_RELEASE
#  define LUNAR_TAG ""
# else
#  define LUNAR_TAG "-pre"
# endif
#endif

#define LUNAR_VERSION_STRING  LUNAR_STRINGIFY(LUNAR_MAJOR_VERSION) "." \
                              LUNAR_STRINGIFY(LUNAR_MINOR_VERSION) "." \
                              LUNAR_STRINGIFY(LUNAR_PATCH_VERSION)     \
                              LUNAR_TAG

#define LUNAR_VERSION "v" LUNAR_VERSION_STRING

#define LUNAR_VERSION_AT_LEAST(major, minor, patch) \
  (( (major) < LUNAR_MAJOR_VERSION) \
  || ((major) == LUNAR_MAJOR_VERSION && (minor) < LUNAR_MINOR_VERSION) \
  || ((major) == LUNAR_MAJOR_VERSION && \
      (minor) == LUNAR_MINOR_VERSION && (patch) <= LUNAR_PATCH_VERSION))

#endif  // SRC_LUNAR_VERSION_H_
