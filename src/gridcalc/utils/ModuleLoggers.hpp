#pragma once
#include "gridcalc/utils/Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 存储与工作簿 (core)
#define CORE_TRACE(...)    GRIDCALC_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    GRIDCALC_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     GRIDCALC_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     GRIDCALC_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    GRIDCALC_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 公式解析与求值 (formula)
#define FORMULA_TRACE(...) GRIDCALC_LOG_TRACE("[TRC][fmla] " __VA_ARGS__)
#define FORMULA_DEBUG(...) GRIDCALC_LOG_DEBUG("[DBG][fmla] " __VA_ARGS__)
#define FORMULA_INFO(...)  GRIDCALC_LOG_INFO("[INF][fmla] " __VA_ARGS__)
#define FORMULA_WARN(...)  GRIDCALC_LOG_WARN("[WRN][fmla] " __VA_ARGS__)
#define FORMULA_ERROR(...) GRIDCALC_LOG_ERROR("[ERR][fmla] " __VA_ARGS__)

// 依赖图与重算 (calc)
#define CALC_TRACE(...)    GRIDCALC_LOG_TRACE("[TRC][calc] " __VA_ARGS__)
#define CALC_DEBUG(...)    GRIDCALC_LOG_DEBUG("[DBG][calc] " __VA_ARGS__)
#define CALC_INFO(...)     GRIDCALC_LOG_INFO("[INF][calc] " __VA_ARGS__)
#define CALC_WARN(...)     GRIDCALC_LOG_WARN("[WRN][calc] " __VA_ARGS__)
#define CALC_ERROR(...)    GRIDCALC_LOG_ERROR("[ERR][calc] " __VA_ARGS__)

// 重算过程的逐单元格跟踪日志，量大，默认关闭
#ifndef GRIDCALC_ENABLE_RECALC_TRACE
#define GRIDCALC_ENABLE_RECALC_TRACE 0
#endif

#if GRIDCALC_ENABLE_RECALC_TRACE
    #define GRIDCALC_LOG_RECALC_TRACE(...) CALC_TRACE(__VA_ARGS__)
#else
    #define GRIDCALC_LOG_RECALC_TRACE(...) do {} while(0)
#endif
