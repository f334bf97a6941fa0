//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for the Magolor language.
///
/// @details The parser pulls tokens from a Lexer on demand and builds the AST
/// defined in AST.hpp.  Statements use recursive descent.  Expressions use
/// Pratt-style precedence climbing driven by the table in Grammar.hpp.
///
/// ## Lookahead
///
/// A fixed window holds the current token, the next one (peek), and the one
/// after (peek-peek).  Only the rule for statements that start with a type
/// name reads peek-peek, to tell `int f(` from `int x =`.
///
/// ## Cursor Convention
///
/// Every parse function is entered with the current token on the first token
/// of its construct and returns with the current token on the construct's
/// last token.  parseProgram() and block parsing advance one token after
/// each statement, so every iteration makes progress and parsing always
/// terminates.
///
/// ## Nesting Limits
///
/// Expressions and statements are parsed recursively.  Nesting beyond
/// kMaxExprDepth or kMaxStmtDepth is reported once, the rest of the
/// offending construct is skipped, and parsing resumes after it.
///
/// ## Error Handling
///
/// Syntax errors never throw.  A rule that fails records a message and
/// returns nullptr; its caller propagates the failure.  Messages are kept in
/// order in errors() and are also reported to the DiagnosticEngine with the
/// offending location.
///
/// ## Grammar Overview
///
/// ```
/// program    = statement* EOF
/// statement  = if | return | break | continue | while | loop | for
///            | function | var-decl | block | expr-stmt
/// if         = "if" "(" expr ")" body ("else" "if" "(" expr ")" body)* ("else" body)?
/// body       = block | statement
/// function   = ("fn" | TYPE | TYPE "fn") IDENT "(" params? ")" block
/// params     = TYPE IDENT ("," TYPE IDENT)*
/// var-decl   = TYPE IDENT "=" expr ";"?
/// while      = "while" "(" expr ")" block
/// loop       = "loop" block
/// for        = "for" "(" IDENT "in" expr ")" block
/// ```
///
/// @invariant The window always holds three tokens (Eof once input ends).
/// @invariant Lexer and DiagnosticEngine outlive the parser.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/Grammar.hpp"
#include "frontend/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace magolor::frontend
{

/// @brief Diagnostic code for Illegal tokens surfaced by the parser.
inline constexpr const char *kLexicalErrorCode = "M1001";

/// @brief Diagnostic code for syntax errors.
inline constexpr const char *kSyntaxErrorCode = "M2001";

/// @brief Diagnostic code for input left over after a standalone expression.
inline constexpr const char *kTrailingInputCode = "M2002";

/// @brief Deepest expression nesting the parser accepts.
/// @details Counts recursive operands and left-nested operator chains alike,
///          so it bounds the depth of every expression tree.
inline constexpr unsigned kMaxExprDepth = 256;

/// @brief Deepest statement nesting (blocks, branch bodies, loop bodies).
inline constexpr unsigned kMaxStmtDepth = 256;

class Parser
{
  public:
    /// @brief Create a parser and fill the three-token window.
    /// @param lexer Token source; borrowed.
    /// @param diag Sink receiving every recorded error; borrowed.
    Parser(Lexer &lexer, magolor::support::DiagnosticEngine &diag);

    /// @brief Parse statements until end of input.
    /// @return The program; partial when errors() is non-empty.
    Program parseProgram();

    /// @brief Parse one expression starting at the current token.
    /// @param minPrec Operators binding no tighter than this end the expression.
    /// @return The expression, or nullptr after recording an error.
    ExprPtr parseExpression(Precedence minPrec = Precedence::Lowest);

    /// @brief Require that input ends after the construct just parsed.
    /// @details Skips one optional `;`; any other token is recorded as an
    ///          M2002 error.
    /// @return True when only end of input remains.
    bool expectEnd();

    /// @brief Error messages in the order they were recorded.
    [[nodiscard]] const std::vector<std::string> &errors() const
    {
        return errors_;
    }

    [[nodiscard]] bool hasError() const
    {
        return !errors_.empty();
    }

    /// @brief Token the parser is positioned on.
    [[nodiscard]] const Token &current() const
    {
        return window_[0];
    }

  private:
    //=== Token window (Parser_Tokens.cpp) ===//

    [[nodiscard]] const Token &peek() const
    {
        return window_[1];
    }

    [[nodiscard]] const Token &peekPeek() const
    {
        return window_[2];
    }

    void nextToken();
    [[nodiscard]] bool curIs(TokenKind kind) const;
    [[nodiscard]] bool peekIs(TokenKind kind) const;

    /// @brief Advance when the peek token has @p kind; record an error otherwise.
    bool expectPeek(TokenKind kind);

    void errorAt(SourceLoc loc, std::string message, const char *code = kSyntaxErrorCode);

    /// @brief Skip to the last token of a construct cut short by a depth limit.
    /// @details Stops after the `}` matching a `{` opened while skipping, or
    ///          before `;`, an unmatched `}`, or end of input.
    void skipNestedConstruct();

    //=== Expressions (Parser_Expr.cpp) ===//

    ExprPtr parsePrefix();
    ExprPtr parseInfix(ExprPtr left, BinaryOp op);
    ExprPtr parseIntLiteral();
    ExprPtr parseFloatLiteral();
    ExprPtr parseGrouped();
    ExprPtr parseUnary(UnaryOp op);
    ExprPtr parseTypeOf();
    ExprPtr reportNoPrefix();

    //=== Statements (Parser_Stmt.cpp) ===//

    StmtPtr parseStatement();
    StmtPtr parseExprStatement();
    StmtPtr parseReturn();
    StmtPtr parseBreak();
    StmtPtr parseContinue();
    StmtPtr parseIf();
    StmtPtr parseWhile();
    StmtPtr parseLoop();
    StmtPtr parseFor();

    /// @brief Parse `{ statement* }`; the current token must be `{`.
    BlockPtr parseBlock();

    /// @brief Parse an if/else branch: a block or one wrapped statement.
    BlockPtr parseBranchBody();

    //=== Declarations (Parser_Decl.cpp) ===//

    StmtPtr parseTypedStatement();
    StmtPtr parseVarDecl();

    /// @brief Parse `IDENT ( params ) { body }`.
    /// @details Entered on the token before the name (`fn` or a type).
    StmtPtr parseFunction(SourceLoc loc, Token returnType);

    bool parseParams(std::vector<Param> &params);
    bool parseParam(std::vector<Param> &params);

    Lexer &lexer_;
    magolor::support::DiagnosticEngine &diag_;

    /// current, peek, peek-peek
    std::array<Token, 3> window_;

    std::vector<std::string> errors_;

    unsigned exprDepth_{0};
    unsigned stmtDepth_{0};

    /// Set by skipNestedConstruct(); silences follow-on errors for the statement.
    bool nestingOverflow_{false};
};

} // namespace magolor::frontend
