#ifndef PATHMON_VERSION_HPP
#define PATHMON_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define PATHMON_VERSION_MAJOR 0
#define PATHMON_VERSION_MINOR 3
#define PATHMON_VERSION_PATCH 0

#define PATHMON_VERSION_STR "0.3.0"
#define PATHMON_VERSION_RC PATHMON_VERSION_MAJOR, PATHMON_VERSION_MINOR, PATHMON_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

#ifndef RC_INVOKED
constexpr const char* PATHMON_VERSION = PATHMON_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* PATHMON_VERSION_HPP */
