#pragma once

#include "gridcalc/core/Expected.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace gridcalc {
namespace formula {

enum class TokenType : uint8_t {
    Number,       // 123、1.5、.5、1e3
    String,       // "text"，"" 表示一个双引号
    Identifier,   // 函数名、单元格引用（可带 $）、TRUE/FALSE
    Operator,     // + - * / ^ & % = <> < <= > >=
    LParen,
    RParen,
    Comma,
    Colon,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;        // 字符串字面量为去掉引号和转义后的内容
    double number = 0.0;     // 仅 Number 有效
    size_t position = 0;     // 在公式体中的字节偏移

    bool isOperator(std::string_view op) const {
        return type == TokenType::Operator && text == op;
    }
};

/**
 * @brief 公式词法分析器
 *
 * 输入为去掉前导 '=' 的公式体；空白被跳过。
 * 末尾总会追加一个 End 记号。
 */
class FormulaLexer {
public:
    static core::Result<std::vector<Token>> tokenize(std::string_view body);

private:
    static bool isIdentifierStart(char c);
    static bool isIdentifierChar(char c);
};

}} // namespace gridcalc::formula
