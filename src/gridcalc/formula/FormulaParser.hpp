#pragma once

#include "gridcalc/formula/FormulaAst.hpp"
#include "gridcalc/formula/FormulaLexer.hpp"
#include "gridcalc/core/Expected.hpp"
#include <string_view>
#include <vector>
#include <optional>

namespace gridcalc {
namespace formula {

/**
 * @brief 递归下降的公式语法分析器
 *
 * 优先级由低到高：
 *   比较 (= <> < <= > >=) -> 连接 (&) -> 加减 -> 乘除 -> 乘方 (^, 左结合)
 *   -> 一元 (- +) -> 后缀 (%) -> 基本项
 * 基本项：数值、字符串、TRUE/FALSE、单元格引用、区域 A1:B2、
 * 函数调用 NAME(args...)、括号表达式。
 */
class FormulaParser {
public:
    /**
     * @brief 解析公式体（不含前导 '='）
     */
    static core::Result<ExprPtr> parse(std::string_view body);

private:
    explicit FormulaParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    using ParseFn = core::Result<ExprPtr> (FormulaParser::*)();
    using MatchFn = std::optional<BinaryOp> (*)(const Token&);

    // 左结合的二元运算层：operand (op operand)*
    core::Result<ExprPtr> parseLeftAssociative(ParseFn operand, MatchFn match);

    core::Result<ExprPtr> parseComparison();
    core::Result<ExprPtr> parseConcat();
    core::Result<ExprPtr> parseAdditive();
    core::Result<ExprPtr> parseMultiplicative();
    core::Result<ExprPtr> parsePower();
    core::Result<ExprPtr> parseUnary();
    core::Result<ExprPtr> parsePostfix();
    core::Result<ExprPtr> parsePrimary();
    core::Result<ExprPtr> parseIdentifier(const Token& token);
    core::Result<ExprPtr> parseFunctionCall(const Token& name);

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }
    bool atEnd() const { return peek().type == TokenType::End; }

    core::Error syntaxError(const std::string& message) const;

    static constexpr size_t kMaxNestingDepth = 256;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;
};

}} // namespace gridcalc::formula
