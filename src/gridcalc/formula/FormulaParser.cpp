#include "gridcalc/formula/FormulaParser.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace gridcalc {
namespace formula {

namespace {

struct DepthGuard {
    explicit DepthGuard(size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }
    size_t& depth_;
};

// 接受 A1、$A1、A$1、$A$1；去掉 $ 后按 A1 记法解析（引用不做相对调整）
std::optional<core::CellRef> parseReferenceToken(std::string_view text) {
    std::string plain;
    size_t i = 0;
    if (i < text.size() && text[i] == '$') ++i;
    size_t letters = i;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) plain += text[i++];
    if (i == letters) return std::nullopt;
    if (i < text.size() && text[i] == '$') ++i;
    size_t digits = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) plain += text[i++];
    if (i == digits || i != text.size()) return std::nullopt;
    return core::CellRef::parse(plain);
}

std::optional<BinaryOp> matchComparison(const Token& token) {
    if (token.type != TokenType::Operator) return std::nullopt;
    if (token.text == "=")  return BinaryOp::Eq;
    if (token.text == "<>") return BinaryOp::Ne;
    if (token.text == "<")  return BinaryOp::Lt;
    if (token.text == "<=") return BinaryOp::Le;
    if (token.text == ">")  return BinaryOp::Gt;
    if (token.text == ">=") return BinaryOp::Ge;
    return std::nullopt;
}

std::optional<BinaryOp> matchConcat(const Token& token) {
    if (token.isOperator("&")) return BinaryOp::Concat;
    return std::nullopt;
}

std::optional<BinaryOp> matchAdditive(const Token& token) {
    if (token.isOperator("+")) return BinaryOp::Add;
    if (token.isOperator("-")) return BinaryOp::Sub;
    return std::nullopt;
}

std::optional<BinaryOp> matchMultiplicative(const Token& token) {
    if (token.isOperator("*")) return BinaryOp::Mul;
    if (token.isOperator("/")) return BinaryOp::Div;
    return std::nullopt;
}

std::optional<BinaryOp> matchPower(const Token& token) {
    if (token.isOperator("^")) return BinaryOp::Pow;
    return std::nullopt;
}

} // namespace

core::Result<ExprPtr> FormulaParser::parse(std::string_view body) {
    auto tokens = FormulaLexer::tokenize(body);
    if (!tokens) {
        return tokens.error();
    }

    FormulaParser parser(std::move(tokens).value());
    if (parser.atEnd()) {
        return core::makeError(core::ErrorCode::InvalidSyntax, "Empty formula");
    }

    auto expr = parser.parseComparison();
    if (!expr) {
        return expr;
    }
    if (!parser.atEnd()) {
        return parser.syntaxError(fmt::format("Unexpected token '{}'", parser.peek().text));
    }
    return expr;
}

core::Error FormulaParser::syntaxError(const std::string& message) const {
    return core::makeError(core::ErrorCode::InvalidSyntax,
                           fmt::format("{} at position {}", message, peek().position));
}

core::Result<ExprPtr> FormulaParser::parseLeftAssociative(ParseFn operand, MatchFn match) {
    auto left = (this->*operand)();
    if (!left) {
        return left;
    }
    ExprPtr expr = std::move(left).value();

    while (auto op = match(peek())) {
        advance();
        auto right = (this->*operand)();
        if (!right) {
            return right;
        }
        expr = FormulaExpr::binary(*op, std::move(expr), std::move(right).value());
    }
    return expr;
}

core::Result<ExprPtr> FormulaParser::parseComparison() {
    return parseLeftAssociative(&FormulaParser::parseConcat, &matchComparison);
}

core::Result<ExprPtr> FormulaParser::parseConcat() {
    return parseLeftAssociative(&FormulaParser::parseAdditive, &matchConcat);
}

core::Result<ExprPtr> FormulaParser::parseAdditive() {
    return parseLeftAssociative(&FormulaParser::parseMultiplicative, &matchAdditive);
}

core::Result<ExprPtr> FormulaParser::parseMultiplicative() {
    return parseLeftAssociative(&FormulaParser::parsePower, &matchMultiplicative);
}

core::Result<ExprPtr> FormulaParser::parsePower() {
    return parseLeftAssociative(&FormulaParser::parseUnary, &matchPower);
}

core::Result<ExprPtr> FormulaParser::parseUnary() {
    DepthGuard guard(depth_);
    if (depth_ > kMaxNestingDepth) {
        return syntaxError("Formula is nested too deeply");
    }

    if (peek().isOperator("-") || peek().isOperator("+")) {
        UnaryOp op = peek().text == "-" ? UnaryOp::Neg : UnaryOp::Plus;
        advance();
        auto operand = parseUnary();
        if (!operand) {
            return operand;
        }
        return FormulaExpr::unary(op, std::move(operand).value());
    }
    return parsePostfix();
}

core::Result<ExprPtr> FormulaParser::parsePostfix() {
    auto primary = parsePrimary();
    if (!primary) {
        return primary;
    }
    ExprPtr expr = std::move(primary).value();
    while (peek().isOperator("%")) {
        advance();
        expr = FormulaExpr::unary(UnaryOp::Percent, std::move(expr));
    }
    return expr;
}

core::Result<ExprPtr> FormulaParser::parsePrimary() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::Number:
            advance();
            return FormulaExpr::literal(core::CellValue::number(token.number));

        case TokenType::String:
            advance();
            return FormulaExpr::literal(core::CellValue::text(token.text));

        case TokenType::Identifier:
            advance();
            return parseIdentifier(token);

        case TokenType::LParen: {
            advance();
            auto inner = parseComparison();
            if (!inner) {
                return inner;
            }
            if (peek().type != TokenType::RParen) {
                return syntaxError("Missing ')'");
            }
            advance();
            return inner;
        }

        case TokenType::End:
            return syntaxError("Unexpected end of formula");

        default:
            return syntaxError(fmt::format("Unexpected token '{}'", token.text));
    }
}

core::Result<ExprPtr> FormulaParser::parseIdentifier(const Token& token) {
    if (peek().type == TokenType::LParen) {
        return parseFunctionCall(token);
    }

    if (peek().type == TokenType::Colon) {
        advance();
        const Token& last = peek();
        if (last.type != TokenType::Identifier) {
            return core::makeError(core::ErrorCode::InvalidRef,
                                   fmt::format("Malformed range starting at '{}'", token.text));
        }
        advance();
        auto first_ref = parseReferenceToken(token.text);
        auto last_ref = parseReferenceToken(last.text);
        if (!first_ref || !last_ref) {
            return core::makeError(core::ErrorCode::InvalidRef,
                                   fmt::format("Invalid range '{}:{}'", token.text, last.text));
        }
        return FormulaExpr::range(core::CellRange(*first_ref, *last_ref));
    }

    if (auto ref = parseReferenceToken(token.text)) {
        return FormulaExpr::reference(*ref);
    }
    if (utils::CommonUtils::equalsIgnoreCase(token.text, "TRUE")) {
        return FormulaExpr::literal(core::CellValue::boolean(true));
    }
    if (utils::CommonUtils::equalsIgnoreCase(token.text, "FALSE")) {
        return FormulaExpr::literal(core::CellValue::boolean(false));
    }
    return core::makeError(core::ErrorCode::InvalidRef,
                           fmt::format("Invalid reference '{}'", token.text));
}

core::Result<ExprPtr> FormulaParser::parseFunctionCall(const Token& name) {
    advance();  // '('
    std::vector<ExprPtr> args;

    if (peek().type == TokenType::RParen) {
        advance();
        return FormulaExpr::call(name.text, std::move(args));
    }

    while (true) {
        auto arg = parseComparison();
        if (!arg) {
            return arg;
        }
        args.push_back(std::move(arg).value());

        if (peek().type == TokenType::Comma) {
            advance();
            continue;
        }
        if (peek().type == TokenType::RParen) {
            advance();
            break;
        }
        return syntaxError(fmt::format("Expected ',' or ')' in call to {}", name.text));
    }
    return FormulaExpr::call(name.text, std::move(args));
}

}} // namespace gridcalc::formula
