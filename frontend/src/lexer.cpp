#include "../include/stratum/frontend/lexer.h"

#include <cctype>
#include <string>
#include <unordered_map>
#include <utility>

namespace stratum::frontend {
namespace {

[[nodiscard]] auto isIdentifierStart(char c) -> bool {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) != 0 || c == '_' || uc >= 0x80;
}

[[nodiscard]] auto isIdentifierBody(char c) -> bool {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_' || uc >= 0x80;
}

[[nodiscard]] auto isDigit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto isHexDigit(char c) -> bool {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto keywordTable() -> const std::unordered_map<std::string, TokenKind>& {
    static const std::unordered_map<std::string, TokenKind> table = {
        {"break", TokenKind::KwBreak},         {"case", TokenKind::KwCase},
        {"chan", TokenKind::KwChan},           {"const", TokenKind::KwConst},
        {"continue", TokenKind::KwContinue},   {"default", TokenKind::KwDefault},
        {"defer", TokenKind::KwDefer},         {"else", TokenKind::KwElse},
        {"fallthrough", TokenKind::KwFallthrough},
        {"for", TokenKind::KwFor},             {"func", TokenKind::KwFunc},
        {"go", TokenKind::KwGo},               {"goto", TokenKind::KwGoto},
        {"if", TokenKind::KwIf},               {"import", TokenKind::KwImport},
        {"interface", TokenKind::KwInterface}, {"map", TokenKind::KwMap},
        {"package", TokenKind::KwPackage},     {"range", TokenKind::KwRange},
        {"return", TokenKind::KwReturn},       {"select", TokenKind::KwSelect},
        {"struct", TokenKind::KwStruct},       {"switch", TokenKind::KwSwitch},
        {"type", TokenKind::KwType},           {"var", TokenKind::KwVar},
    };
    return table;
}

[[nodiscard]] auto classifyIdentifier(const std::string& lexeme) -> TokenKind {
    if (const auto it = keywordTable().find(lexeme); it != keywordTable().end()) {
        return it->second;
    }
    return TokenKind::Identifier;
}

// A newline after one of these tokens terminates the statement.
[[nodiscard]] auto endsStatement(TokenKind kind) -> bool {
    switch (kind) {
        case TokenKind::Identifier:
        case TokenKind::IntegerLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::ImaginaryLiteral:
        case TokenKind::RuneLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::KwBreak:
        case TokenKind::KwContinue:
        case TokenKind::KwFallthrough:
        case TokenKind::KwReturn:
        case TokenKind::PlusPlus:
        case TokenKind::MinusMinus:
        case TokenKind::RParen:
        case TokenKind::RBracket:
        case TokenKind::RBrace:
            return true;
        default:
            return false;
    }
}

}  // namespace

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    tokens.reserve(source_.size() / 4 + 8);

    while (true) {
        const SourceLocation lineEnd{line_, column_};
        const bool crossedNewline = skipTrivia();
        if ((crossedNewline || isAtEnd()) && !tokens.empty() && endsStatement(tokens.back().kind)) {
            pushToken(tokens, TokenKind::Semicolon, "\n", lineEnd);
        }
        if (isAtEnd()) {
            break;
        }

        const SourceLocation location{line_, column_};
        const size_t startIndex = current_;
        const char c = advance();

        if (isIdentifierStart(c)) {
            lexIdentifier(tokens, location, startIndex);
            continue;
        }

        if (isDigit(c) || (c == '.' && isDigit(peek()))) {
            lexNumber(tokens, location, startIndex);
            continue;
        }

        switch (c) {
            case '"':
            case '\'':
                lexQuoted(tokens, location, startIndex, c);
                break;
            case '`':
                lexRawString(tokens, location, startIndex);
                break;
            default:
                lexOperator(tokens, location, c);
                break;
        }
    }

    tokens.push_back(Token{TokenKind::EndOfFile, "", line_, column_});
    return tokens;
}

[[nodiscard]] auto Lexer::peek() const -> char {
    if (isAtEnd()) {
        return '\0';
    }
    return source_[current_];
}

[[nodiscard]] auto Lexer::peekNext() const -> char {
    if (current_ + 1 >= source_.size()) {
        return '\0';
    }
    return source_[current_ + 1];
}

auto Lexer::advance() -> char {
    const char c = source_[current_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

[[nodiscard]] auto Lexer::match(char expected) -> bool {
    if (isAtEnd() || source_[current_] != expected) {
        return false;
    }
    advance();
    return true;
}

[[nodiscard]] auto Lexer::isAtEnd() const -> bool { return current_ >= source_.size(); }

auto Lexer::skipTrivia() -> bool {
    bool crossedNewline = false;
    bool consumed = true;
    while (consumed && !isAtEnd()) {
        consumed = false;
        switch (peek()) {
            case '\n':
                crossedNewline = true;
                advance();
                consumed = true;
                break;
            case ' ':
            case '\t':
            case '\r':
                advance();
                consumed = true;
                break;
            case '/':
                if (peekNext() == '/') {
                    while (!isAtEnd() && peek() != '\n') {
                        advance();
                    }
                    consumed = true;
                } else if (peekNext() == '*') {
                    advance();  // '/'
                    advance();  // '*'
                    while (!isAtEnd()) {
                        if (peek() == '*' && peekNext() == '/') {
                            advance();
                            advance();
                            break;
                        }
                        if (advance() == '\n') {
                            crossedNewline = true;
                        }
                    }
                    consumed = true;
                }
                break;
            default:
                break;
        }
    }
    return crossedNewline;
}

void Lexer::lexIdentifier(std::vector<Token>& tokens, SourceLocation location, size_t startIndex) {
    while (isIdentifierBody(peek())) {
        advance();
    }
    auto lexeme = slice(startIndex);
    const TokenKind kind = classifyIdentifier(lexeme);
    pushToken(tokens, kind, std::move(lexeme), location);
}

void Lexer::lexNumber(std::vector<Token>& tokens, SourceLocation location, size_t startIndex) {
    const auto consumeWhile = [this](auto predicate) {
        while (!isAtEnd()) {
            const char next = peek();
            if (predicate(next) || next == '_') {
                advance();
            } else {
                break;
            }
        }
    };

    bool isFloat = source_[startIndex] == '.';
    const char first = source_[startIndex];

    if (first == '0' && (peek() == 'x' || peek() == 'X')) {
        advance();
        consumeWhile(isHexDigit);
        if (peek() == '.') {
            isFloat = true;
            advance();
            consumeWhile(isHexDigit);
        }
        if (peek() == 'p' || peek() == 'P') {
            isFloat = true;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            consumeWhile(isDigit);
        }
    } else if (first == '0' && (peek() == 'b' || peek() == 'B' || peek() == 'o' || peek() == 'O')) {
        advance();
        consumeWhile(isDigit);
    } else {
        consumeWhile(isDigit);
        if (!isFloat && peek() == '.' && peekNext() != '.') {
            isFloat = true;
            advance();  // consume '.'
            consumeWhile(isDigit);
        }

        if (peek() == 'e' || peek() == 'E') {
            isFloat = true;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }

            const size_t exponentDigitsStart = current_;
            consumeWhile(isDigit);

            if (exponentDigitsStart == current_) {
                pushToken(tokens, TokenKind::Error, "Invalid exponent", location);
                return;
            }
        }
    }

    TokenKind kind = isFloat ? TokenKind::FloatLiteral : TokenKind::IntegerLiteral;
    if (peek() == 'i') {
        advance();
        kind = TokenKind::ImaginaryLiteral;
    }

    pushToken(tokens, kind, slice(startIndex), location);
}

void Lexer::lexQuoted(std::vector<Token>& tokens, SourceLocation location, size_t startIndex, char quote) {
    bool terminated = false;

    while (!isAtEnd() && peek() != '\n') {
        const char c = advance();
        if (c == quote) {
            terminated = true;
            break;
        }
        if (c == '\\' && !isAtEnd() && peek() != '\n') {
            advance();
        }
    }

    if (!terminated) {
        pushToken(tokens, TokenKind::Error,
                  quote == '"' ? "Unterminated string literal" : "Unterminated rune literal", location);
        return;
    }

    const TokenKind kind = quote == '"' ? TokenKind::StringLiteral : TokenKind::RuneLiteral;
    pushToken(tokens, kind, slice(startIndex), location);
}

void Lexer::lexRawString(std::vector<Token>& tokens, SourceLocation location, size_t startIndex) {
    while (!isAtEnd()) {
        if (advance() == '`') {
            pushToken(tokens, TokenKind::StringLiteral, slice(startIndex), location);
            return;
        }
    }
    pushToken(tokens, TokenKind::Error, "Unterminated raw string literal", location);
}

void Lexer::lexOperator(std::vector<Token>& tokens, SourceLocation location, char c) {
    switch (c) {
        case '(':
            pushToken(tokens, TokenKind::LParen, "(", location);
            break;
        case ')':
            pushToken(tokens, TokenKind::RParen, ")", location);
            break;
        case '{':
            pushToken(tokens, TokenKind::LBrace, "{", location);
            break;
        case '}':
            pushToken(tokens, TokenKind::RBrace, "}", location);
            break;
        case '[':
            pushToken(tokens, TokenKind::LBracket, "[", location);
            break;
        case ']':
            pushToken(tokens, TokenKind::RBracket, "]", location);
            break;
        case ',':
            pushToken(tokens, TokenKind::Comma, ",", location);
            break;
        case ';':
            pushToken(tokens, TokenKind::Semicolon, ";", location);
            break;
        case ':':
            if (match('=')) {
                pushToken(tokens, TokenKind::ColonEqual, ":=", location);
            } else {
                pushToken(tokens, TokenKind::Colon, ":", location);
            }
            break;
        case '.':
            if (peek() == '.' && peekNext() == '.') {
                advance();
                advance();
                pushToken(tokens, TokenKind::Ellipsis, "...", location);
            } else {
                pushToken(tokens, TokenKind::Dot, ".", location);
            }
            break;
        case '+':
            if (match('+')) {
                pushToken(tokens, TokenKind::PlusPlus, "++", location);
            } else if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "+=", location);
            } else {
                pushToken(tokens, TokenKind::Plus, "+", location);
            }
            break;
        case '-':
            if (match('-')) {
                pushToken(tokens, TokenKind::MinusMinus, "--", location);
            } else if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "-=", location);
            } else {
                pushToken(tokens, TokenKind::Minus, "-", location);
            }
            break;
        case '*':
            if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "*=", location);
            } else {
                pushToken(tokens, TokenKind::Star, "*", location);
            }
            break;
        case '/':
            if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "/=", location);
            } else {
                pushToken(tokens, TokenKind::Slash, "/", location);
            }
            break;
        case '%':
            if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "%=", location);
            } else {
                pushToken(tokens, TokenKind::Percent, "%", location);
            }
            break;
        case '&':
            if (match('&')) {
                pushToken(tokens, TokenKind::AmpersandAmpersand, "&&", location);
            } else if (match('^')) {
                if (match('=')) {
                    pushToken(tokens, TokenKind::AssignOp, "&^=", location);
                } else {
                    pushToken(tokens, TokenKind::AmpersandCaret, "&^", location);
                }
            } else if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "&=", location);
            } else {
                pushToken(tokens, TokenKind::Ampersand, "&", location);
            }
            break;
        case '|':
            if (match('|')) {
                pushToken(tokens, TokenKind::PipePipe, "||", location);
            } else if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "|=", location);
            } else {
                pushToken(tokens, TokenKind::Pipe, "|", location);
            }
            break;
        case '^':
            if (match('=')) {
                pushToken(tokens, TokenKind::AssignOp, "^=", location);
            } else {
                pushToken(tokens, TokenKind::Caret, "^", location);
            }
            break;
        case '~':
            pushToken(tokens, TokenKind::Tilde, "~", location);
            break;
        case '!':
            if (match('=')) {
                pushToken(tokens, TokenKind::BangEqual, "!=", location);
            } else {
                pushToken(tokens, TokenKind::Bang, "!", location);
            }
            break;
        case '=':
            if (match('=')) {
                pushToken(tokens, TokenKind::EqualEqual, "==", location);
            } else {
                pushToken(tokens, TokenKind::Equal, "=", location);
            }
            break;
        case '<':
            if (match('-')) {
                pushToken(tokens, TokenKind::Arrow, "<-", location);
            } else if (match('<')) {
                if (match('=')) {
                    pushToken(tokens, TokenKind::AssignOp, "<<=", location);
                } else {
                    pushToken(tokens, TokenKind::LessLess, "<<", location);
                }
            } else if (match('=')) {
                pushToken(tokens, TokenKind::LessEqual, "<=", location);
            } else {
                pushToken(tokens, TokenKind::Less, "<", location);
            }
            break;
        case '>':
            if (match('>')) {
                if (match('=')) {
                    pushToken(tokens, TokenKind::AssignOp, ">>=", location);
                } else {
                    pushToken(tokens, TokenKind::GreaterGreater, ">>", location);
                }
            } else if (match('=')) {
                pushToken(tokens, TokenKind::GreaterEqual, ">=", location);
            } else {
                pushToken(tokens, TokenKind::Greater, ">", location);
            }
            break;
        default:
            pushToken(tokens, TokenKind::Error, std::string{c}, location);
            break;
    }
}

void Lexer::pushToken(std::vector<Token>& tokens, TokenKind kind, std::string lexeme, SourceLocation location) {
    tokens.push_back(Token{kind, std::move(lexeme), location.line, location.column});
}

[[nodiscard]] auto Lexer::slice(size_t startIndex) const -> std::string {
    return source_.substr(startIndex, current_ - startIndex);
}

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
        case TokenKind::Identifier: return "Identifier";
        case TokenKind::IntegerLiteral: return "IntegerLiteral";
        case TokenKind::FloatLiteral: return "FloatLiteral";
        case TokenKind::ImaginaryLiteral: return "ImaginaryLiteral";
        case TokenKind::RuneLiteral: return "RuneLiteral";
        case TokenKind::StringLiteral: return "StringLiteral";
        case TokenKind::KwBreak: return "KwBreak";
        case TokenKind::KwCase: return "KwCase";
        case TokenKind::KwChan: return "KwChan";
        case TokenKind::KwConst: return "KwConst";
        case TokenKind::KwContinue: return "KwContinue";
        case TokenKind::KwDefault: return "KwDefault";
        case TokenKind::KwDefer: return "KwDefer";
        case TokenKind::KwElse: return "KwElse";
        case TokenKind::KwFallthrough: return "KwFallthrough";
        case TokenKind::KwFor: return "KwFor";
        case TokenKind::KwFunc: return "KwFunc";
        case TokenKind::KwGo: return "KwGo";
        case TokenKind::KwGoto: return "KwGoto";
        case TokenKind::KwIf: return "KwIf";
        case TokenKind::KwImport: return "KwImport";
        case TokenKind::KwInterface: return "KwInterface";
        case TokenKind::KwMap: return "KwMap";
        case TokenKind::KwPackage: return "KwPackage";
        case TokenKind::KwRange: return "KwRange";
        case TokenKind::KwReturn: return "KwReturn";
        case TokenKind::KwSelect: return "KwSelect";
        case TokenKind::KwStruct: return "KwStruct";
        case TokenKind::KwSwitch: return "KwSwitch";
        case TokenKind::KwType: return "KwType";
        case TokenKind::KwVar: return "KwVar";
        case TokenKind::LParen: return "LParen";
        case TokenKind::RParen: return "RParen";
        case TokenKind::LBrace: return "LBrace";
        case TokenKind::RBrace: return "RBrace";
        case TokenKind::LBracket: return "LBracket";
        case TokenKind::RBracket: return "RBracket";
        case TokenKind::Comma: return "Comma";
        case TokenKind::Semicolon: return "Semicolon";
        case TokenKind::Colon: return "Colon";
        case TokenKind::ColonEqual: return "ColonEqual";
        case TokenKind::Dot: return "Dot";
        case TokenKind::Ellipsis: return "Ellipsis";
        case TokenKind::Arrow: return "Arrow";
        case TokenKind::Plus: return "Plus";
        case TokenKind::PlusPlus: return "PlusPlus";
        case TokenKind::Minus: return "Minus";
        case TokenKind::MinusMinus: return "MinusMinus";
        case TokenKind::Star: return "Star";
        case TokenKind::Slash: return "Slash";
        case TokenKind::Percent: return "Percent";
        case TokenKind::Ampersand: return "Ampersand";
        case TokenKind::AmpersandAmpersand: return "AmpersandAmpersand";
        case TokenKind::AmpersandCaret: return "AmpersandCaret";
        case TokenKind::Pipe: return "Pipe";
        case TokenKind::PipePipe: return "PipePipe";
        case TokenKind::Caret: return "Caret";
        case TokenKind::Tilde: return "Tilde";
        case TokenKind::Bang: return "Bang";
        case TokenKind::BangEqual: return "BangEqual";
        case TokenKind::Equal: return "Equal";
        case TokenKind::EqualEqual: return "EqualEqual";
        case TokenKind::Less: return "Less";
        case TokenKind::LessEqual: return "LessEqual";
        case TokenKind::LessLess: return "LessLess";
        case TokenKind::Greater: return "Greater";
        case TokenKind::GreaterEqual: return "GreaterEqual";
        case TokenKind::GreaterGreater: return "GreaterGreater";
        case TokenKind::AssignOp: return "AssignOp";
        case TokenKind::Error: return "Error";
        case TokenKind::EndOfFile: return "EndOfFile";
    }
    return "Unknown";
}

}  // namespace stratum::frontend
