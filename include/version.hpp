#ifndef REFGATE_VERSION_HPP
#define REFGATE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define REFGATE_VERSION_MAJOR 0
#define REFGATE_VERSION_MINOR 3
#define REFGATE_VERSION_PATCH 0

/* Full version string reported by --version. */
#define REFGATE_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* REFGATE_VERSION = REFGATE_VERSION_STR;

#endif /* REFGATE_VERSION_HPP */
