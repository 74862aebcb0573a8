#pragma once

#include "gridcalc/core/CellValue.hpp"
#include "gridcalc/core/CellAddress.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace gridcalc {
namespace formula {

/**
 * @brief 求值上下文接口 - 为求值器提供单元格取值和时钟
 *
 * 求值器只通过该接口读取数据，不依赖 Sheet 的存储结构。
 */
class EvaluationContext {
public:
    virtual ~EvaluationContext() = default;

    /**
     * @brief 读取单元格的值，未写入的单元格返回 std::nullopt
     */
    virtual std::optional<core::CellValue> getCell(const core::CellRef& ref) const = 0;

    /**
     * @brief 按行优先顺序返回区域内所有非空值
     *
     * 默认实现逐格调用 getCell；稀疏存储可以重写为只遍历已存储的单元格。
     */
    virtual std::vector<core::CellValue> getRangeValues(const core::CellRange& range) const;

    /**
     * @brief 当前时间，供 TODAY()/NOW() 使用
     */
    virtual std::chrono::system_clock::time_point now() const {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief 基于回调的上下文，便于在没有 Sheet 的场景下求值
 */
class CallbackContext : public EvaluationContext {
public:
    using Lookup = std::function<std::optional<core::CellValue>(const core::CellRef&)>;

    explicit CallbackContext(Lookup lookup) : lookup_(std::move(lookup)) {}

    std::optional<core::CellValue> getCell(const core::CellRef& ref) const override {
        return lookup_ ? lookup_(ref) : std::nullopt;
    }

    /**
     * @brief 固定时钟，测试中让 TODAY()/NOW() 可预测
     */
    void setNow(std::chrono::system_clock::time_point now) { fixed_now_ = now; }

    std::chrono::system_clock::time_point now() const override {
        return fixed_now_ ? *fixed_now_ : EvaluationContext::now();
    }

private:
    Lookup lookup_;
    std::optional<std::chrono::system_clock::time_point> fixed_now_;
};

}} // namespace gridcalc::formula
