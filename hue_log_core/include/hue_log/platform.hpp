#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define HUE_LOG_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define HUE_LOG_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define HUE_LOG_PLATFORM_MACOS 1
#endif

// ===== 编码缓冲区初始容量 =====
#ifndef HUE_LOG_INITIAL_BUF_SIZE
    #define HUE_LOG_INITIAL_BUF_SIZE 4096
#endif

// ===== 消息最小列宽（左对齐，右侧补空格，不截断） =====
#ifndef HUE_LOG_MSG_MIN_WIDTH
    #define HUE_LOG_MSG_MIN_WIDTH 25
#endif

// ===== 对象池最多保留的空闲实例数 =====
#ifndef HUE_LOG_POOL_MAX_IDLE
    #define HUE_LOG_POOL_MAX_IDLE 64
#endif

// ===== 时间格式化临时缓冲区大小 =====
#ifndef HUE_LOG_TIME_BUF_SIZE
    #define HUE_LOG_TIME_BUF_SIZE 128
#endif
