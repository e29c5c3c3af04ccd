#ifndef DEPLOYLOOP_VERSION_HPP
#define DEPLOYLOOP_VERSION_HPP

#define DEPLOYLOOP_VERSION_MAJOR 0
#define DEPLOYLOOP_VERSION_MINOR 1
#define DEPLOYLOOP_VERSION_PATCH 0

/* Overridden by the build when a release tag is known. */
#ifndef DEPLOYLOOP_VERSION_STR
#define DEPLOYLOOP_VERSION_STR "0.1.0"
#endif

constexpr const char* DEPLOYLOOP_VERSION = DEPLOYLOOP_VERSION_STR;

#endif /* DEPLOYLOOP_VERSION_HPP */
