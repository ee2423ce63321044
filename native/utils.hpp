/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UTILS_HPP_
#define UTILS_HPP_

#define TAG "[ScoutbotNative]"

#include <string>
#include <algorithm>
#include <cstdio>
#include "Base.h"

#ifdef __ANDROID__

#include <android/log.h>

#define LOGD(fmt, ...) __android_log_print(ANDROID_LOG_DEBUG,TAG ,fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) __android_log_print(ANDROID_LOG_INFO,TAG ,fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) __android_log_print(ANDROID_LOG_WARN,TAG ,fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) __android_log_print(ANDROID_LOG_ERROR,TAG ,fmt, ##__VA_ARGS__)
#define LOGF(fmt, ...) __android_log_print(ANDROID_LOG_FATAL,TAG ,fmt, ##__VA_ARGS__)
#else
#define Time_Format_Now (scoutbot::getTimeFormatStr().c_str())
#define LOGD(fmt, ...) printf(TAG "[%s] DEBUG[%s][%s][%d]:" fmt "\n", Time_Format_Now, __FILE__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
#define LOGI(fmt, ...) printf(TAG "[%s] :" fmt "\n", Time_Format_Now ,##__VA_ARGS__)
#define LOGW(fmt, ...) printf(TAG "[%s] WARNING:" fmt "\n", Time_Format_Now, ##__VA_ARGS__)
#define LOGE(fmt, ...) printf(TAG "[%s] ERROR:" fmt "\n", Time_Format_Now, ##__VA_ARGS__)
#define LOGF(...)
#endif

#if SCOUTBOT_QUIET_DEBUG
#define BDLOG(...)
#define BDLOGE(fmt, ...)  LOGE(fmt,##__VA_ARGS__)
#else
#define BDLOG(fmt, ...)   LOGD(fmt,##__VA_ARGS__)
#define BDLOGE(fmt, ...)  LOGE(fmt,##__VA_ARGS__)
#endif

#define BLOG(fmt, ...)    LOGI(fmt,##__VA_ARGS__)
#define BLOGE(fmt, ...)   LOGE(fmt,##__VA_ARGS__)

// Log long string at INFO level (for debug information like state)
inline void logLongStringInfo(const std::string& longStr) {
    // Android logcat has a limit of ~4KB per log line, but considering log prefix
    // (timestamp, tag, pid, etc.), we use a smaller chunk size to ensure complete output
    const size_t MAX_LOG_LEN = 3000; // Reduced from 4000 to ensure no truncation
    size_t pos = 0;
    size_t totalLen = longStr.length();
    
    if (totalLen <= MAX_LOG_LEN) {
        BDLOG("%s", longStr.c_str());
        return;
    }
    
    // Split into chunks
    size_t chunkNum = 0;
    size_t totalChunks = (totalLen + MAX_LOG_LEN - 1) / MAX_LOG_LEN;
    while (pos < totalLen) {
        size_t chunkLen = std::min(MAX_LOG_LEN, totalLen - pos);
        std::string chunk = longStr.substr(pos, chunkLen);
        BDLOG("[chunk %zu/%zu] %s", chunkNum + 1, totalChunks, chunk.c_str());
        pos += chunkLen;
        chunkNum++;
    }
}

/// Compile-time timestamp (e.g. "Jan 30 2026 08:15:28")
#define SCOUTBOT_VERSION __DATE__ " " __TIME__

#endif // UTILS_HPP_

