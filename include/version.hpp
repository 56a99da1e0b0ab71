#ifndef AUTOSUBSYNC_VERSION_HPP
#define AUTOSUBSYNC_VERSION_HPP

#define AUTOSUBSYNC_VERSION_MAJOR 0
#define AUTOSUBSYNC_VERSION_MINOR 3
#define AUTOSUBSYNC_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow, "rolling" for local builds.
 */
#ifndef AUTOSUBSYNC_VERSION_STR
#define AUTOSUBSYNC_VERSION_STR "rolling"
#endif

constexpr const char* AUTOSUBSYNC_VERSION = AUTOSUBSYNC_VERSION_STR;

/* Sent as the User-Agent of every hosting API request. */
constexpr const char* AUTOSUBSYNC_USER_AGENT = "autosubsync/" AUTOSUBSYNC_VERSION_STR;

#endif /* AUTOSUBSYNC_VERSION_HPP */
