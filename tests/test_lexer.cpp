#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "../frontend/include/stratum/frontend/lexer.h"

using stratum::frontend::Lexer;
using stratum::frontend::Token;
using stratum::frontend::TokenKind;

namespace {

auto kindsOf(const std::vector<Token>& tokens) -> std::vector<TokenKind> {
    std::vector<TokenKind> kinds;
    kinds.reserve(tokens.size());
    for (const auto& token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

void expectKinds(const std::string& source, const std::vector<TokenKind>& expected) {
    Lexer lexer(source);
    EXPECT_EQ(kindsOf(lexer.tokenize()), expected) << "Token kinds mismatch";
}

}  // namespace

TEST(LexerTest, SemicolonInsertion) {
    const std::string source = R"(package demo

func f() int {
	return 1
}
)";

    expectKinds(source,
                {
                    TokenKind::KwPackage, TokenKind::Identifier,     TokenKind::Semicolon, TokenKind::KwFunc,
                    TokenKind::Identifier, TokenKind::LParen,        TokenKind::RParen,    TokenKind::Identifier,
                    TokenKind::LBrace,    TokenKind::KwReturn,       TokenKind::IntegerLiteral, TokenKind::Semicolon,
                    TokenKind::RBrace,    TokenKind::Semicolon,      TokenKind::EndOfFile,
                });
}

TEST(LexerTest, NumericLiterals) {
    const std::string source = "x := 0x1F + 1_000 + 3.14 + 1e9 + 2i + 'a'\n";

    expectKinds(source,
                {
                    TokenKind::Identifier,   TokenKind::ColonEqual,       TokenKind::IntegerLiteral, TokenKind::Plus,
                    TokenKind::IntegerLiteral, TokenKind::Plus,           TokenKind::FloatLiteral,   TokenKind::Plus,
                    TokenKind::FloatLiteral, TokenKind::Plus,             TokenKind::ImaginaryLiteral, TokenKind::Plus,
                    TokenKind::RuneLiteral,  TokenKind::Semicolon,        TokenKind::EndOfFile,
                });
}

TEST(LexerTest, StringsAndComments) {
    const std::string source = "import \"fmt\" // trailing\nvar s = `raw\nstring` /* multi\nline */\n";

    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    std::vector<TokenKind> expectedKinds = {
        TokenKind::KwImport,   TokenKind::StringLiteral, TokenKind::Semicolon, TokenKind::KwVar,
        TokenKind::Identifier, TokenKind::Equal,         TokenKind::StringLiteral, TokenKind::Semicolon,
        TokenKind::EndOfFile,
    };

    ASSERT_EQ(kindsOf(tokens), expectedKinds) << "Kinds mismatch with comments/strings";

    EXPECT_EQ(tokens[1].lexeme, "\"fmt\"");
    const auto rawIt = std::find_if(tokens.begin() + 2, tokens.end(), [](const Token& token) {
        return token.kind == TokenKind::StringLiteral;
    });
    ASSERT_NE(rawIt, tokens.end());
    EXPECT_EQ(rawIt->lexeme, "`raw\nstring`");
    EXPECT_EQ(rawIt->line, 2);
    EXPECT_EQ(rawIt->column, 9);
}

TEST(LexerTest, OperatorsAndErrors) {
    const std::string source = "ch <- v &^ m\n$";

    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    expectKinds(source,
                {
                    TokenKind::Identifier, TokenKind::Arrow,     TokenKind::Identifier, TokenKind::AmpersandCaret,
                    TokenKind::Identifier, TokenKind::Semicolon, TokenKind::Error,      TokenKind::EndOfFile,
                });
    ASSERT_EQ(tokens.size(), 8);
    EXPECT_EQ(tokens[6].lexeme, "$");
    EXPECT_EQ(tokens[6].line, 2);
    EXPECT_EQ(tokens[6].column, 1);
}

