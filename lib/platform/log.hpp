#pragma once

#include <cstdio>

// All log output goes to stderr; stdout carries JSON Lines telemetry.
#define logInfo(fmt, ...) fprintf(stderr, fmt "\n", ##__VA_ARGS__)
#define logError(fmt, ...) fprintf(stderr, "ERROR: " fmt "\n", ##__VA_ARGS__)
#define logWarn(fmt, ...) fprintf(stderr, "WARN: " fmt "\n", ##__VA_ARGS__)

#ifdef KBHALL_DEBUG
    #define logDebug(fmt, ...) fprintf(stderr, "DEBUG: " fmt "\n", ##__VA_ARGS__)
#else
    #define logDebug(fmt, ...) do { } while (0)
#endif
