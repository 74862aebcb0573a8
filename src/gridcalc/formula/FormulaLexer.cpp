#include "gridcalc/formula/FormulaLexer.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace gridcalc {
namespace formula {

bool FormulaLexer::isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '$' || c == '_';
}

bool FormulaLexer::isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '$' || c == '_' || c == '.';
}

core::Result<std::vector<Token>> FormulaLexer::tokenize(std::string_view body) {
    std::vector<Token> tokens;
    size_t pos = 0;
    const size_t size = body.size();

    while (pos < size) {
        char c = body[pos];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        Token token;
        token.position = pos;

        // 数值：整数部分、小数部分、指数部分
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos + 1 < size && std::isdigit(static_cast<unsigned char>(body[pos + 1])))) {
            size_t start = pos;
            while (pos < size && std::isdigit(static_cast<unsigned char>(body[pos]))) ++pos;
            if (pos < size && body[pos] == '.') {
                ++pos;
                while (pos < size && std::isdigit(static_cast<unsigned char>(body[pos]))) ++pos;
            }
            if (pos < size && (body[pos] == 'e' || body[pos] == 'E')) {
                size_t exp = pos + 1;
                if (exp < size && (body[exp] == '+' || body[exp] == '-')) ++exp;
                if (exp < size && std::isdigit(static_cast<unsigned char>(body[exp]))) {
                    pos = exp;
                    while (pos < size && std::isdigit(static_cast<unsigned char>(body[pos]))) ++pos;
                }
            }
            // 数字后紧跟字母（如 "1A"）不是合法记号
            if (pos < size && isIdentifierStart(body[pos])) {
                return core::makeError(core::ErrorCode::InvalidSyntax,
                                       fmt::format("Unexpected character '{}' after number at {}", body[pos], pos));
            }
            token.type = TokenType::Number;
            token.text = std::string(body.substr(start, pos - start));
            auto value = utils::CommonUtils::parseNumber(token.text);
            if (!value) {
                return core::makeError(core::ErrorCode::InvalidSyntax,
                                       fmt::format("Invalid number literal '{}'", token.text));
            }
            token.number = *value;
            tokens.push_back(std::move(token));
            continue;
        }

        if (c == '"') {
            ++pos;
            std::string text;
            bool closed = false;
            while (pos < size) {
                if (body[pos] == '"') {
                    if (pos + 1 < size && body[pos + 1] == '"') {
                        text += '"';
                        pos += 2;
                        continue;
                    }
                    ++pos;
                    closed = true;
                    break;
                }
                text += body[pos++];
            }
            if (!closed) {
                return core::makeError(core::ErrorCode::InvalidSyntax,
                                       fmt::format("Unterminated string literal at {}", token.position));
            }
            token.type = TokenType::String;
            token.text = std::move(text);
            tokens.push_back(std::move(token));
            continue;
        }

        if (isIdentifierStart(c)) {
            size_t start = pos;
            while (pos < size && isIdentifierChar(body[pos])) ++pos;
            if (pos < size && body[pos] == '!') {
                return core::makeError(core::ErrorCode::InvalidRef,
                                       fmt::format("Cross-sheet reference '{}!' is not supported",
                                                   body.substr(start, pos - start)));
            }
            token.type = TokenType::Identifier;
            token.text = std::string(body.substr(start, pos - start));
            tokens.push_back(std::move(token));
            continue;
        }

        switch (c) {
            case '(': token.type = TokenType::LParen; token.text = "("; ++pos; break;
            case ')': token.type = TokenType::RParen; token.text = ")"; ++pos; break;
            case ',': token.type = TokenType::Comma;  token.text = ","; ++pos; break;
            case ':': token.type = TokenType::Colon;  token.text = ":"; ++pos; break;
            case '+': case '-': case '*': case '/': case '^': case '&': case '%': case '=':
                token.type = TokenType::Operator;
                token.text = std::string(1, c);
                ++pos;
                break;
            case '<':
                token.type = TokenType::Operator;
                if (pos + 1 < size && (body[pos + 1] == '=' || body[pos + 1] == '>')) {
                    token.text = std::string(body.substr(pos, 2));
                    pos += 2;
                } else {
                    token.text = "<";
                    ++pos;
                }
                break;
            case '>':
                token.type = TokenType::Operator;
                if (pos + 1 < size && body[pos + 1] == '=') {
                    token.text = ">=";
                    pos += 2;
                } else {
                    token.text = ">";
                    ++pos;
                }
                break;
            case '!':
                return core::makeError(core::ErrorCode::InvalidRef,
                                       fmt::format("Cross-sheet reference at {} is not supported", pos));
            default:
                return core::makeError(core::ErrorCode::InvalidSyntax,
                                       fmt::format("Unexpected character '{}' at {}", c, pos));
        }
        tokens.push_back(std::move(token));
    }

    Token end;
    end.type = TokenType::End;
    end.position = size;
    tokens.push_back(std::move(end));
    return tokens;
}

}} // namespace gridcalc::formula
