#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stratum::frontend {

enum class TokenKind : std::uint8_t {
    // literals / identifiers
    Identifier,
    IntegerLiteral,
    FloatLiteral,
    ImaginaryLiteral,
    RuneLiteral,
    StringLiteral,

    // keywords
    KwBreak,
    KwCase,
    KwChan,
    KwConst,
    KwContinue,
    KwDefault,
    KwDefer,
    KwElse,
    KwFallthrough,
    KwFor,
    KwFunc,
    KwGo,
    KwGoto,
    KwIf,
    KwImport,
    KwInterface,
    KwMap,
    KwPackage,
    KwRange,
    KwReturn,
    KwSelect,
    KwStruct,
    KwSwitch,
    KwType,
    KwVar,

    // punctuation / operators
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Comma,
    Semicolon,
    Colon,
    ColonEqual,
    Dot,
    Ellipsis,
    Arrow,
    Plus,
    PlusPlus,
    Minus,
    MinusMinus,
    Star,
    Slash,
    Percent,
    Ampersand,
    AmpersandAmpersand,
    AmpersandCaret,
    Pipe,
    PipePipe,
    Caret,
    Tilde,
    Bang,
    BangEqual,
    Equal,
    EqualEqual,
    Less,
    LessEqual,
    LessLess,
    Greater,
    GreaterEqual,
    GreaterGreater,
    AssignOp,

    // diagnostics
    Error,
    EndOfFile,
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    size_t line;
    size_t column;
};

// Tokenizes Go source. Semicolons are inserted at line ends following the
// language rule, with "\n" as their lexeme.
class Lexer {
   public:
    explicit Lexer(std::string source);
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

   private:
    struct SourceLocation {
        size_t line;
        size_t column;
    };

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peekNext() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto match(char expected) -> bool;
    [[nodiscard]] auto isAtEnd() const -> bool;
    [[nodiscard]] auto skipTrivia() -> bool;
    void lexIdentifier(std::vector<Token>& tokens, SourceLocation location, size_t startIndex);
    void lexNumber(std::vector<Token>& tokens, SourceLocation location, size_t startIndex);
    void lexQuoted(std::vector<Token>& tokens, SourceLocation location, size_t startIndex, char quote);
    void lexRawString(std::vector<Token>& tokens, SourceLocation location, size_t startIndex);
    void lexOperator(std::vector<Token>& tokens, SourceLocation location, char c);
    void pushToken(std::vector<Token>& tokens, TokenKind kind, std::string lexeme, SourceLocation location);
    [[nodiscard]] auto slice(size_t startIndex) const -> std::string;

    std::string source_;
    size_t current_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
};

[[nodiscard]] auto token_kind_name(TokenKind kind) -> const char*;

}  // namespace stratum::frontend
