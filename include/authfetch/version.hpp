/*
 * Fallback version header for authfetch
 *
 * The build system passes AUTHFETCH_VERSION_STRING from the project version;
 * these defaults only apply when the header is consumed without it.
 */

#pragma once

#ifndef AUTHFETCH_VERSION_MAJOR
#define AUTHFETCH_VERSION_MAJOR 0
#endif

#ifndef AUTHFETCH_VERSION_MINOR
#define AUTHFETCH_VERSION_MINOR 0
#endif

#ifndef AUTHFETCH_VERSION_PATCH
#define AUTHFETCH_VERSION_PATCH 0
#endif

#ifndef AUTHFETCH_VERSION_STRING
#define AUTHFETCH_VERSION_STRING "0.0.0+dev"
#endif
