#pragma once

/// Cross-platform logging macros for the flow layout core.
/// Android: uses __android_log_print
/// Other platforms: uses fprintf(stderr, ...)

#ifdef __ANDROID__

#include <android/log.h>

#define FL_LOG_TAG "FlowLayout"
#define FL_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, FL_LOG_TAG, __VA_ARGS__)
#define FL_LOGI(...) __android_log_print(ANDROID_LOG_INFO,  FL_LOG_TAG, __VA_ARGS__)
#define FL_LOGW(...) __android_log_print(ANDROID_LOG_WARN,  FL_LOG_TAG, __VA_ARGS__)

#else

#include <cstdio>

#define FL_LOGD(fmt, ...) fprintf(stderr, "[FlowLayout D] " fmt "\n", ##__VA_ARGS__)
#define FL_LOGI(fmt, ...) fprintf(stderr, "[FlowLayout I] " fmt "\n", ##__VA_ARGS__)
#define FL_LOGW(fmt, ...) fprintf(stderr, "[FlowLayout W] " fmt "\n", ##__VA_ARGS__)

#endif
