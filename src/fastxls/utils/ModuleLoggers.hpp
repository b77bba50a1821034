#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 * 便于调试时快速识别日志来源和等级
 */

// 记录流细粒度日志（逐条记录），默认关闭
#ifndef FASTXLS_ENABLE_RECORD_TRACE
#define FASTXLS_ENABLE_RECORD_TRACE 0
#endif

// 核心模块 (core)
#define CORE_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][CORE] " __VA_ARGS__)
#define CORE_INFO(...)     FASTXLS_LOG_INFO("[INF][CORE] " __VA_ARGS__)
#define CORE_WARN(...)     FASTXLS_LOG_WARN("[WRN][CORE] " __VA_ARGS__)
#define CORE_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][CORE] " __VA_ARGS__)
#define CORE_CRITICAL(...) FASTXLS_LOG_CRITICAL("[CRT][CORE] " __VA_ARGS__)

// 复合文档模块 (cfb)
#define CFB_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][cfb ] " __VA_ARGS__)
#define CFB_INFO(...)     FASTXLS_LOG_INFO("[INF][cfb ] " __VA_ARGS__)
#define CFB_WARN(...)     FASTXLS_LOG_WARN("[WRN][cfb ] " __VA_ARGS__)
#define CFB_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][cfb ] " __VA_ARGS__)
#define CFB_CRITICAL(...) FASTXLS_LOG_CRITICAL("[CRT][cfb ] " __VA_ARGS__)

// 记录流模块 (record)
#define RECORD_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][rec ] " __VA_ARGS__)
#define RECORD_INFO(...)     FASTXLS_LOG_INFO("[INF][rec ] " __VA_ARGS__)
#define RECORD_WARN(...)     FASTXLS_LOG_WARN("[WRN][rec ] " __VA_ARGS__)
#define RECORD_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][rec ] " __VA_ARGS__)
#define RECORD_CRITICAL(...) FASTXLS_LOG_CRITICAL("[CRT][rec ] " __VA_ARGS__)

// 公式模块 (formula)
#define FORMULA_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][fmla] " __VA_ARGS__)
#define FORMULA_INFO(...)     FASTXLS_LOG_INFO("[INF][fmla] " __VA_ARGS__)
#define FORMULA_WARN(...)     FASTXLS_LOG_WARN("[WRN][fmla] " __VA_ARGS__)
#define FORMULA_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][fmla] " __VA_ARGS__)

// 结构模型模块 (model)
#define MODEL_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][modl] " __VA_ARGS__)
#define MODEL_INFO(...)     FASTXLS_LOG_INFO("[INF][modl] " __VA_ARGS__)
#define MODEL_WARN(...)     FASTXLS_LOG_WARN("[WRN][modl] " __VA_ARGS__)
#define MODEL_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][modl] " __VA_ARGS__)
#define MODEL_CRITICAL(...) FASTXLS_LOG_CRITICAL("[CRT][modl] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     FASTXLS_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     FASTXLS_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 示例程序 (examples)
#define EXAMPLE_DEBUG(...)    FASTXLS_LOG_DEBUG("[DBG][demo] " __VA_ARGS__)
#define EXAMPLE_INFO(...)     FASTXLS_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     FASTXLS_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    FASTXLS_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if FASTXLS_ENABLE_RECORD_TRACE
    #define FASTXLS_LOG_RECORD_TRACE(...) FASTXLS_LOG_TRACE("[TRC][rec ] " __VA_ARGS__)
#else
    #define FASTXLS_LOG_RECORD_TRACE(...) do {} while(0)
#endif
