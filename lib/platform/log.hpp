#pragma once

#include <cstdio>

#define LOG_TAG "HARMONIA"

#define logInfo(fmt, ...) printf("[" LOG_TAG "] " fmt "\n", ##__VA_ARGS__)
#define logError(fmt, ...) fprintf(stderr, "[" LOG_TAG "] ERROR: " fmt "\n", ##__VA_ARGS__)
#define logWarn(fmt, ...) printf("[" LOG_TAG "] WARN: " fmt "\n", ##__VA_ARGS__)

#ifdef HARMONIA_DEBUG_LOG
    #define logDebug(fmt, ...) printf("[" LOG_TAG "] DEBUG: " fmt "\n", ##__VA_ARGS__)
#else
    #define logDebug(fmt, ...) do {} while (0)
#endif
