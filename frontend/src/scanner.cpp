#include "../include/stratum/frontend/scanner.h"

#include <string>
#include <utility>

namespace stratum::frontend {
namespace {

constexpr const char* kComplexExpression = "complex_expr";
constexpr const char* kUnknownType = "unknown";

[[nodiscard]] auto isTopLevelKeyword(TokenKind kind) -> bool {
    switch (kind) {
        case TokenKind::KwImport:
        case TokenKind::KwType:
        case TokenKind::KwVar:
        case TokenKind::KwConst:
        case TokenKind::KwFunc:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] auto isOpening(TokenKind kind) -> bool {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

[[nodiscard]] auto isClosing(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

[[nodiscard]] auto isLiteral(TokenKind kind) -> bool {
    switch (kind) {
        case TokenKind::IntegerLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::ImaginaryLiteral:
        case TokenKind::RuneLiteral:
        case TokenKind::StringLiteral:
            return true;
        default:
            return false;
    }
}

// One entry of a parameter list before name/type grouping is resolved.
struct ParameterEntry {
    std::string first;
    std::optional<Identifier> name;
    std::optional<std::string> type;
};

}  // namespace

Scanner::Scanner(std::string path, std::string source) : path_(std::move(path)) {
    Lexer lexer(std::move(source));
    tokens_ = lexer.tokenize();
}

auto Scanner::scanFile() -> ScanResult {
    ScanResult result{};

    for (const auto& token : tokens_) {
        if (token.kind == TokenKind::Error) {
            reportError(token, token.lexeme.empty() ? "Lexer error" : token.lexeme);
        }
    }

    SourceFile file;
    file.path = path_;
    file.package = parsePackageClause();

    while (!isAtEnd()) {
        if (match(TokenKind::Semicolon)) {
            continue;
        }
        const size_t start = current_;
        parseDeclaration(file.nodes);
        if (current_ == start) {
            advance();
        }
    }

    result.file = std::move(file);
    result.diagnostics = diagnostics_;
    result.success = diagnostics_.empty();
    return result;
}

auto Scanner::advance() -> const Token& {
    if (!isAtEnd()) {
        ++current_;
    }
    return previous();
}

auto Scanner::peek() const -> const Token& { return tokens_[current_]; }

auto Scanner::peekAt(size_t offset) const -> const Token& {
    const size_t index = current_ + offset;
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

auto Scanner::previous() const -> const Token& { return tokens_[current_ == 0 ? 0 : current_ - 1]; }

auto Scanner::isAtEnd() const -> bool { return peek().kind == TokenKind::EndOfFile; }

auto Scanner::check(TokenKind kind) const -> bool { return peek().kind == kind; }

auto Scanner::match(TokenKind kind) -> bool {
    if (!check(kind)) {
        return false;
    }
    advance();
    return true;
}

auto Scanner::consume(TokenKind kind, const char* message) -> const Token* {
    if (check(kind)) {
        return &advance();
    }
    reportError(peek(), message);
    return nullptr;
}

auto Scanner::parsePackageClause() -> Identifier {
    Identifier name;
    if (consume(TokenKind::KwPackage, "Expected 'package' clause") == nullptr) {
        return name;
    }
    const Token* ident = consume(TokenKind::Identifier, "Expected package name");
    if (ident != nullptr) {
        name = makeIdentifier(*ident);
    }
    if (!isAtEnd()) {
        const Token* terminator = consume(TokenKind::Semicolon, "Expected ';' after package clause");
        (void)terminator;
    }
    return name;
}

void Scanner::parseDeclaration(std::vector<SyntaxNode>& nodes) {
    switch (peek().kind) {
        case TokenKind::KwImport:
            advance();
            parseGroup(nodes, SyntaxNode::Kind::Import);
            break;
        case TokenKind::KwType:
            advance();
            parseGroup(nodes, SyntaxNode::Kind::Type);
            break;
        case TokenKind::KwVar:
            advance();
            parseGroup(nodes, SyntaxNode::Kind::Var);
            break;
        case TokenKind::KwConst:
            advance();
            parseGroup(nodes, SyntaxNode::Kind::Const);
            break;
        case TokenKind::KwFunc:
            advance();
            if (auto node = parseFuncDecl()) {
                nodes.push_back(std::move(*node));
            }
            break;
        default:
            reportError(peek(), "Expected import/type/var/const/func declaration");
            synchronize();
            return;
    }

    if (!isAtEnd() && !match(TokenKind::Semicolon)) {
        reportError(peek(), "Expected ';' after declaration");
        synchronize();
    }
}

void Scanner::parseGroup(std::vector<SyntaxNode>& nodes, SyntaxNode::Kind kind) {
    if (!match(TokenKind::LParen)) {
        if (auto node = parseSpec(kind)) {
            nodes.push_back(std::move(*node));
        }
        return;
    }

    while (!check(TokenKind::RParen) && !isAtEnd()) {
        if (match(TokenKind::Semicolon)) {
            continue;
        }
        const size_t start = current_;
        if (auto node = parseSpec(kind)) {
            nodes.push_back(std::move(*node));
        }
        if (!check(TokenKind::RParen) && !match(TokenKind::Semicolon)) {
            reportError(peek(), "Expected ';' or ')' in declaration group");
            skipElement();
            (void)match(TokenKind::Semicolon);
        }
        if (current_ == start) {
            advance();
        }
    }

    const Token* rparen = consume(TokenKind::RParen, "Expected ')' to close declaration group");
    (void)rparen;
}

auto Scanner::parseSpec(SyntaxNode::Kind kind) -> std::optional<SyntaxNode> {
    switch (kind) {
        case SyntaxNode::Kind::Import:
            return parseImportSpec();
        case SyntaxNode::Kind::Type:
            return parseTypeSpec();
        case SyntaxNode::Kind::Var:
        case SyntaxNode::Kind::Const:
            return parseValueSpec(kind);
        case SyntaxNode::Kind::Func:
            break;
    }
    return std::nullopt;
}

auto Scanner::parseImportSpec() -> std::optional<SyntaxNode> {
    SyntaxNode node;
    node.kind = SyntaxNode::Kind::Import;
    node.location = locationOf(peek());

    if (check(TokenKind::Identifier) || check(TokenKind::Dot)) {
        node.import_spec.alias = makeIdentifier(advance());
    }

    const Token* path = consume(TokenKind::StringLiteral, "Expected import path");
    if (path == nullptr) {
        skipElement();
        return std::nullopt;
    }
    node.import_spec.path = path->lexeme;
    node.import_spec.location = locationOf(*path);
    return node;
}

auto Scanner::parseTypeSpec() -> std::optional<SyntaxNode> {
    const Token* name = consume(TokenKind::Identifier, "Expected type name");
    if (name == nullptr) {
        skipElement();
        return std::nullopt;
    }

    SyntaxNode node;
    node.kind = SyntaxNode::Kind::Type;
    node.location = locationOf(*name);
    TypeSpec& spec = node.type_spec;
    spec.name = makeIdentifier(*name);

    if (check(TokenKind::LBracket) && looksLikeTypeParameters()) {
        skipBalanced(TokenKind::LBracket, TokenKind::RBracket);
    }
    (void)match(TokenKind::Equal);

    if (match(TokenKind::KwStruct)) {
        spec.shape = TypeSpec::Shape::Struct;
        spec.fields = parseStructFields();
        spec.underlying = "struct{}";
    } else if (match(TokenKind::KwInterface)) {
        spec.shape = TypeSpec::Shape::Interface;
        spec.elements = parseInterfaceElements();
        spec.underlying = "interface{}";
    } else {
        spec.shape = TypeSpec::Shape::Other;
        spec.underlying = parseType();
    }
    return node;
}

auto Scanner::parseValueSpec(SyntaxNode::Kind kind) -> std::optional<SyntaxNode> {
    const Token* first = consume(TokenKind::Identifier, "Expected identifier in value declaration");
    if (first == nullptr) {
        skipElement();
        return std::nullopt;
    }

    SyntaxNode node;
    node.kind = kind;
    node.location = locationOf(*first);
    ValueSpec& spec = node.value_spec;
    spec.names.push_back(makeIdentifier(*first));
    while (match(TokenKind::Comma)) {
        const Token* name = consume(TokenKind::Identifier, "Expected identifier after ','");
        if (name != nullptr) {
            spec.names.push_back(makeIdentifier(*name));
        }
    }

    if (!check(TokenKind::Equal) && !check(TokenKind::Semicolon) && !check(TokenKind::RParen) && !isAtEnd()) {
        spec.type = parseType();
    }

    if (match(TokenKind::Equal)) {
        spec.values.push_back(parseExpression());
        while (match(TokenKind::Comma)) {
            spec.values.push_back(parseExpression());
        }
    }
    return node;
}

auto Scanner::parseFuncDecl() -> std::optional<SyntaxNode> {
    SyntaxNode node;
    node.kind = SyntaxNode::Kind::Func;
    node.location = locationOf(previous());
    FuncDecl& decl = node.func_decl;

    if (check(TokenKind::LParen)) {
        const auto receiver = parseParameters();
        if (!receiver.empty()) {
            decl.receiver = receiver.front().type;
        }
    }

    const Token* name = consume(TokenKind::Identifier, "Expected function name");
    if (name == nullptr) {
        skipElement();
        return std::nullopt;
    }
    decl.name = makeIdentifier(*name);

    if (check(TokenKind::LBracket)) {
        skipBalanced(TokenKind::LBracket, TokenKind::RBracket);
    }

    decl.parameters = parseParameters();
    decl.results = parseResults();

    if (check(TokenKind::LBrace)) {
        skipBalanced(TokenKind::LBrace, TokenKind::RBrace);
        decl.has_body = true;
    }
    return node;
}

auto Scanner::parseType() -> std::string {
    switch (peek().kind) {
        case TokenKind::Identifier:
            return parseTypeName();
        case TokenKind::Star:
            advance();
            return "*" + parseType();
        case TokenKind::LBracket: {
            advance();
            if (match(TokenKind::RBracket)) {
                return "[]" + parseType();
            }
            std::string length;
            if (match(TokenKind::Ellipsis)) {
                length = "...";
            } else {
                length = parseExpression();
            }
            const Token* rbracket = consume(TokenKind::RBracket, "Expected ']' after array length");
            (void)rbracket;
            return "[" + length + "]" + parseType();
        }
        case TokenKind::KwMap: {
            advance();
            const Token* lbracket = consume(TokenKind::LBracket, "Expected '[' after 'map'");
            (void)lbracket;
            std::string key = parseType();
            const Token* rbracket = consume(TokenKind::RBracket, "Expected ']' after map key type");
            (void)rbracket;
            return "map[" + key + "]" + parseType();
        }
        case TokenKind::KwChan:
            advance();
            if (match(TokenKind::Arrow)) {
                return "chan<- " + parseType();
            }
            return "chan " + parseType();
        case TokenKind::Arrow: {
            advance();
            const Token* chan = consume(TokenKind::KwChan, "Expected 'chan' after '<-'");
            (void)chan;
            return "<-chan " + parseType();
        }
        case TokenKind::KwFunc: {
            advance();
            auto parameters = parseParameters();
            auto results = parseResults();
            return format_func_type(parameters, results);
        }
        case TokenKind::KwInterface:
            advance();
            if (check(TokenKind::LBrace)) {
                skipBalanced(TokenKind::LBrace, TokenKind::RBrace);
            }
            return "interface{}";
        case TokenKind::KwStruct:
            advance();
            if (check(TokenKind::LBrace)) {
                skipBalanced(TokenKind::LBrace, TokenKind::RBrace);
            }
            return "struct{}";
        case TokenKind::LParen: {
            advance();
            std::string inner = parseType();
            const Token* rparen = consume(TokenKind::RParen, "Expected ')' after type");
            (void)rparen;
            return inner;
        }
        case TokenKind::Ellipsis:
            advance();
            return "..." + parseType();
        default:
            break;
    }

    reportError(peek(), "Expected type");
    return kUnknownType;
}

auto Scanner::parseTypeName() -> std::string {
    std::string name = advance().lexeme;
    if (check(TokenKind::Dot) && peekAt(1).kind == TokenKind::Identifier) {
        advance();
        name += ".";
        name += advance().lexeme;
    }

    // `T[A]` instantiates a generic type; `a [5]int` names an array-typed parameter.
    if (check(TokenKind::LBracket) && peekAt(1).kind != TokenKind::RBracket &&
        !startsType(matchingClose(current_) + 1)) {
        name += parseTypeArguments();
    }
    return name;
}

auto Scanner::parseTypeArguments() -> std::string {
    std::string rendered = "[";
    advance();  // '['
    bool first = true;
    while (!check(TokenKind::RBracket) && !isAtEnd()) {
        if (!first) {
            if (!match(TokenKind::Comma)) {
                break;
            }
            if (check(TokenKind::RBracket)) {
                break;
            }
            rendered += ", ";
        }
        rendered += parseType();
        first = false;
    }
    const Token* rbracket = consume(TokenKind::RBracket, "Expected ']' after type arguments");
    (void)rbracket;
    rendered += "]";
    return rendered;
}

auto Scanner::parseStructFields() -> std::vector<FieldGroup> {
    std::vector<FieldGroup> fields;
    if (consume(TokenKind::LBrace, "Expected '{' to start struct body") == nullptr) {
        return fields;
    }

    while (!check(TokenKind::RBrace) && !isAtEnd()) {
        if (match(TokenKind::Semicolon)) {
            continue;
        }

        const size_t fieldStart = current_;
        FieldGroup field;
        bool embedded = !check(TokenKind::Identifier);
        if (!embedded) {
            switch (peekAt(1).kind) {
                case TokenKind::Dot:
                case TokenKind::Semicolon:
                case TokenKind::RBrace:
                case TokenKind::StringLiteral:
                    embedded = true;
                    break;
                case TokenKind::LBracket: {
                    const size_t close = matchingClose(current_ + 1);
                    const TokenKind after = close + 1 < tokens_.size() ? tokens_[close + 1].kind : TokenKind::EndOfFile;
                    embedded = after == TokenKind::Semicolon || after == TokenKind::RBrace ||
                               after == TokenKind::StringLiteral;
                    break;
                }
                default:
                    break;
            }
        }

        if (!embedded) {
            field.names.push_back(makeIdentifier(advance()));
            while (match(TokenKind::Comma)) {
                const Token* name = consume(TokenKind::Identifier, "Expected field name after ','");
                if (name != nullptr) {
                    field.names.push_back(makeIdentifier(*name));
                }
            }
        }
        field.type = parseType();
        (void)match(TokenKind::StringLiteral);  // tag
        fields.push_back(std::move(field));

        if (!check(TokenKind::RBrace) && !match(TokenKind::Semicolon)) {
            reportError(peek(), "Expected ';' after field declaration");
            skipElement();
        }
        if (current_ == fieldStart) {
            advance();
        }
    }

    const Token* rbrace = consume(TokenKind::RBrace, "Expected '}' after struct body");
    (void)rbrace;
    return fields;
}

auto Scanner::parseInterfaceElements() -> std::vector<InterfaceElement> {
    std::vector<InterfaceElement> elements;
    if (consume(TokenKind::LBrace, "Expected '{' to start interface body") == nullptr) {
        return elements;
    }

    while (!check(TokenKind::RBrace) && !isAtEnd()) {
        if (match(TokenKind::Semicolon)) {
            continue;
        }

        const size_t elementStart = current_;
        InterfaceElement element;
        if (check(TokenKind::Identifier) && peekAt(1).kind == TokenKind::LParen) {
            element.kind = InterfaceElement::Kind::Method;
            element.name = makeIdentifier(advance());
            element.parameters = parseParameters();
            element.results = parseResults();
        } else {
            // Unions and approximation elements only constrain type sets.
            element.kind = InterfaceElement::Kind::Embedded;
            const bool approximate = match(TokenKind::Tilde);
            element.embedded_type = parseType();
            bool isUnion = approximate;
            while (match(TokenKind::Pipe)) {
                (void)match(TokenKind::Tilde);
                (void)parseType();
                isUnion = true;
            }
            if (isUnion) {
                element.embedded_type = kUnknownType;
            }
        }
        elements.push_back(std::move(element));

        if (!check(TokenKind::RBrace) && !match(TokenKind::Semicolon)) {
            reportError(peek(), "Expected ';' after interface element");
            skipElement();
        }
        if (current_ == elementStart) {
            advance();
        }
    }

    (void)consume(TokenKind::RBrace, "Expected '}' after interface body");
    return elements;
}

auto Scanner::parseParameters() -> std::vector<FieldGroup> {
    std::vector<FieldGroup> groups;
    if (consume(TokenKind::LParen, "Expected '(' to start parameter list") == nullptr) {
        return groups;
    }

    std::vector<ParameterEntry> entries;
    while (!check(TokenKind::RParen) && !isAtEnd()) {
        ParameterEntry entry;
        const Token& head = peek();
        const bool headIsName = head.kind == TokenKind::Identifier;
        entry.first = parseType();
        if (!check(TokenKind::Comma) && !check(TokenKind::RParen)) {
            if (headIsName) {
                entry.name = makeIdentifier(head);
            }
            entry.type = parseType();
        } else if (headIsName) {
            entry.name = makeIdentifier(head);
        }
        entries.push_back(std::move(entry));

        if (!match(TokenKind::Comma)) {
            break;
        }
    }
    const Token* rparen = consume(TokenKind::RParen, "Expected ')' to close parameter list");
    (void)rparen;

    bool named = false;
    for (const auto& entry : entries) {
        named = named || entry.type.has_value();
    }

    if (!named) {
        for (auto& entry : entries) {
            groups.push_back(FieldGroup{.names = {}, .type = std::move(entry.first)});
        }
        return groups;
    }

    // `a, b int, c string`: bare names take the type of the next typed entry.
    FieldGroup pending;
    for (auto& entry : entries) {
        if (entry.name.has_value()) {
            pending.names.push_back(*entry.name);
        }
        if (entry.type.has_value()) {
            pending.type = std::move(*entry.type);
            groups.push_back(std::move(pending));
            pending = FieldGroup{};
        }
    }
    if (!pending.names.empty()) {
        reportError(previous(), "Missing type for parameter '" + pending.names.back().value + "'");
    }
    return groups;
}

auto Scanner::parseResults() -> std::vector<FieldGroup> {
    if (check(TokenKind::LParen)) {
        return parseParameters();
    }
    if (startsType(current_)) {
        std::vector<FieldGroup> results;
        results.push_back(FieldGroup{.names = {}, .type = parseType()});
        return results;
    }
    return {};
}

auto Scanner::looksLikeTypeParameters() const -> bool {
    if (peekAt(1).kind != TokenKind::Identifier) {
        return false;
    }
    const TokenKind next = peekAt(2).kind;
    return next != TokenKind::RBracket && next != TokenKind::Dot;
}

auto Scanner::matchingClose(size_t openIndex) const -> size_t {
    const TokenKind open = tokens_[openIndex].kind;
    TokenKind close = TokenKind::RBracket;
    if (open == TokenKind::LParen) {
        close = TokenKind::RParen;
    } else if (open == TokenKind::LBrace) {
        close = TokenKind::RBrace;
    }

    size_t depth = 0;
    for (size_t i = openIndex; i < tokens_.size(); ++i) {
        if (tokens_[i].kind == open) {
            ++depth;
        } else if (tokens_[i].kind == close) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return tokens_.size() - 1;
}

auto Scanner::startsType(size_t index) const -> bool {
    if (index >= tokens_.size()) {
        return false;
    }
    switch (tokens_[index].kind) {
        case TokenKind::Identifier:
        case TokenKind::Star:
        case TokenKind::LBracket:
        case TokenKind::LParen:
        case TokenKind::KwMap:
        case TokenKind::KwChan:
        case TokenKind::KwFunc:
        case TokenKind::KwInterface:
        case TokenKind::KwStruct:
        case TokenKind::Arrow:
            return true;
        default:
            return false;
    }
}

auto Scanner::parseExpression() -> std::string { return parseBinaryExpression(1); }

auto Scanner::parseBinaryExpression(int minPrecedence) -> std::string {
    std::string left = parseUnaryExpression();

    while (true) {
        const int precedence = binaryPrecedence(peek().kind);
        if (precedence < minPrecedence) {
            break;
        }

        const Token op = advance();
        std::string right = parseBinaryExpression(precedence + 1);
        left = left + " " + op.lexeme + " " + right;
    }

    return left;
}

auto Scanner::parseUnaryExpression() -> std::string {
    switch (peek().kind) {
        case TokenKind::Plus:
        case TokenKind::Minus:
        case TokenKind::Bang:
        case TokenKind::Caret:
        case TokenKind::Ampersand:
        case TokenKind::Arrow: {
            const Token op = advance();
            return op.lexeme + parseUnaryExpression();
        }
        case TokenKind::Star:
            advance();
            (void)parseUnaryExpression();
            return kComplexExpression;
        default:
            return parsePrimaryExpression();
    }
}

auto Scanner::parsePrimaryExpression() -> std::string {
    const TokenKind kind = peek().kind;

    if (isLiteral(kind) || kind == TokenKind::Identifier) {
        const Token token = advance();
        const bool composite = kind == TokenKind::Identifier && check(TokenKind::LBrace);
        if (check(TokenKind::Dot) || check(TokenKind::LParen) || check(TokenKind::LBracket) || composite) {
            skipPostfix();
            return kComplexExpression;
        }
        return token.lexeme;
    }

    switch (kind) {
        case TokenKind::LParen:
            skipBalanced(TokenKind::LParen, TokenKind::RParen);
            skipPostfix();
            return kComplexExpression;
        case TokenKind::KwFunc:
            advance();
            (void)parseParameters();
            (void)parseResults();
            skipPostfix();
            return kComplexExpression;
        case TokenKind::LBracket:
        case TokenKind::KwMap:
        case TokenKind::KwChan:
        case TokenKind::KwStruct:
        case TokenKind::KwInterface:
            (void)parseType();
            skipPostfix();
            return kComplexExpression;
        default:
            break;
    }

    reportError(peek(), "Expected expression");
    if (!isAtEnd() && !check(TokenKind::Semicolon) && !isClosing(kind)) {
        advance();
    }
    return kComplexExpression;
}

auto Scanner::binaryPrecedence(TokenKind kind) -> int {
    switch (kind) {
        case TokenKind::PipePipe:
            return 1;
        case TokenKind::AmpersandAmpersand:
            return 2;
        case TokenKind::EqualEqual:
        case TokenKind::BangEqual:
        case TokenKind::Less:
        case TokenKind::LessEqual:
        case TokenKind::Greater:
        case TokenKind::GreaterEqual:
            return 3;
        case TokenKind::Plus:
        case TokenKind::Minus:
        case TokenKind::Pipe:
        case TokenKind::Caret:
            return 4;
        case TokenKind::Star:
        case TokenKind::Slash:
        case TokenKind::Percent:
        case TokenKind::LessLess:
        case TokenKind::GreaterGreater:
        case TokenKind::Ampersand:
        case TokenKind::AmpersandCaret:
            return 5;
        default:
            return -1;
    }
}

void Scanner::skipBalanced(TokenKind open, TokenKind close) {
    if (!match(open)) {
        return;
    }
    size_t depth = 1;
    while (depth > 0 && !isAtEnd()) {
        const TokenKind kind = advance().kind;
        if (kind == open) {
            ++depth;
        } else if (kind == close) {
            --depth;
        }
    }
    if (depth > 0) {
        reportError(peek(), std::string{"Unbalanced '"} + token_kind_name(open) + "'");
    }
}

void Scanner::skipPostfix() {
    while (!isAtEnd()) {
        if (match(TokenKind::Dot)) {
            if (check(TokenKind::LParen)) {
                skipBalanced(TokenKind::LParen, TokenKind::RParen);
            } else {
                (void)match(TokenKind::Identifier);
            }
        } else if (check(TokenKind::LParen)) {
            skipBalanced(TokenKind::LParen, TokenKind::RParen);
        } else if (check(TokenKind::LBracket)) {
            skipBalanced(TokenKind::LBracket, TokenKind::RBracket);
        } else if (check(TokenKind::LBrace)) {
            skipBalanced(TokenKind::LBrace, TokenKind::RBrace);
        } else {
            break;
        }
    }
}

void Scanner::skipElement() {
    size_t depth = 0;
    while (!isAtEnd()) {
        const TokenKind kind = peek().kind;
        if (depth == 0 && (kind == TokenKind::Semicolon || isClosing(kind))) {
            return;
        }
        if (isOpening(kind)) {
            ++depth;
        } else if (isClosing(kind)) {
            --depth;
        }
        advance();
    }
}

void Scanner::synchronize() {
    size_t depth = 0;
    while (!isAtEnd()) {
        const TokenKind kind = peek().kind;
        if (depth == 0 && current_ > 0 && previous().kind == TokenKind::Semicolon && isTopLevelKeyword(kind)) {
            return;
        }
        if (isOpening(kind)) {
            ++depth;
        } else if (isClosing(kind) && depth > 0) {
            --depth;
        }
        advance();
    }
}

void Scanner::reportError(const Token& token, std::string message) {
    diagnostics_.push_back(Diagnostic{
        .location = locationOf(token),
        .message = std::move(message),
    });
}

auto Scanner::makeIdentifier(const Token& token) const -> Identifier {
    return Identifier{
        .value = token.lexeme,
        .location = locationOf(token),
    };
}

auto Scanner::locationOf(const Token& token) -> SourceLocation { return SourceLocation{token.line, token.column}; }

}  // namespace stratum::frontend
