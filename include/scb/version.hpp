#pragma once

// Set by the build from the project version.
#ifndef SCB_VERSION
#define SCB_VERSION "unknown"
#endif
