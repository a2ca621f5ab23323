#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stratum/frontend/lexer.h"
#include "stratum/frontend/syntax.h"

namespace stratum::frontend {

// Extracts the top-level declarations of one Go source file. Function bodies
// are skipped; type expressions and constant values are rendered as text.
class Scanner {
   public:
    Scanner(std::string path, std::string source);
    [[nodiscard]] auto scanFile() -> ScanResult;

   private:
    auto advance() -> const Token&;
    [[nodiscard]] auto peek() const -> const Token&;
    [[nodiscard]] auto peekAt(size_t offset) const -> const Token&;
    [[nodiscard]] auto previous() const -> const Token&;
    [[nodiscard]] auto isAtEnd() const -> bool;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    [[nodiscard]] auto match(TokenKind kind) -> bool;
    [[nodiscard]] auto consume(TokenKind kind, const char* message) -> const Token*;

    [[nodiscard]] auto parsePackageClause() -> Identifier;
    void parseDeclaration(std::vector<SyntaxNode>& nodes);
    void parseGroup(std::vector<SyntaxNode>& nodes, SyntaxNode::Kind kind);
    [[nodiscard]] auto parseSpec(SyntaxNode::Kind kind) -> std::optional<SyntaxNode>;
    [[nodiscard]] auto parseImportSpec() -> std::optional<SyntaxNode>;
    [[nodiscard]] auto parseTypeSpec() -> std::optional<SyntaxNode>;
    [[nodiscard]] auto parseValueSpec(SyntaxNode::Kind kind) -> std::optional<SyntaxNode>;
    [[nodiscard]] auto parseFuncDecl() -> std::optional<SyntaxNode>;

    [[nodiscard]] auto parseType() -> std::string;
    [[nodiscard]] auto parseTypeName() -> std::string;
    [[nodiscard]] auto parseStructFields() -> std::vector<FieldGroup>;
    [[nodiscard]] auto parseInterfaceElements() -> std::vector<InterfaceElement>;
    [[nodiscard]] auto parseParameters() -> std::vector<FieldGroup>;
    [[nodiscard]] auto parseResults() -> std::vector<FieldGroup>;
    [[nodiscard]] auto parseTypeArguments() -> std::string;
    [[nodiscard]] auto looksLikeTypeParameters() const -> bool;
    [[nodiscard]] auto matchingClose(size_t openIndex) const -> size_t;
    [[nodiscard]] auto startsType(size_t index) const -> bool;

    [[nodiscard]] auto parseExpression() -> std::string;
    [[nodiscard]] auto parseBinaryExpression(int minPrecedence) -> std::string;
    [[nodiscard]] auto parseUnaryExpression() -> std::string;
    [[nodiscard]] auto parsePrimaryExpression() -> std::string;
    [[nodiscard]] static auto binaryPrecedence(TokenKind kind) -> int;

    void skipBalanced(TokenKind open, TokenKind close);
    void skipPostfix();
    void skipElement();
    void synchronize();
    void reportError(const Token& token, std::string message);
    [[nodiscard]] auto makeIdentifier(const Token& token) const -> Identifier;
    [[nodiscard]] static auto locationOf(const Token& token) -> SourceLocation;

    std::string path_;
    std::vector<Token> tokens_;
    size_t current_ = 0;
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace stratum::frontend
