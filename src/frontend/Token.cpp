//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.cpp
/// @brief Display names for Magolor token kinds.
///
//===----------------------------------------------------------------------===//

#include "frontend/Token.hpp"

namespace magolor::frontend
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Illegal:
            return "ILLEGAL";
        case TokenKind::Eof:
            return "EOF";
        case TokenKind::Identifier:
            return "IDENT";
        case TokenKind::IntLiteral:
            return "INT";
        case TokenKind::FloatLiteral:
            return "FLOAT";
        case TokenKind::StringLiteral:
            return "STRING";
        case TokenKind::BoolLiteral:
            return "BOOL";
        case TokenKind::NilLiteral:
            return "NIL";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
        case TokenKind::LBrace:
            return "{";
        case TokenKind::RBrace:
            return "}";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Semicolon:
            return ";";
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Percent:
            return "%";
        case TokenKind::Assign:
            return "=";
        case TokenKind::EqualEqual:
            return "==";
        case TokenKind::NotEqual:
            return "!=";
        case TokenKind::Less:
            return "<";
        case TokenKind::Greater:
            return ">";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::Bang:
            return "!";
        case TokenKind::AmpAmp:
            return "&&";
        case TokenKind::PipePipe:
            return "||";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwElse:
            return "else";
        case TokenKind::KwWhile:
            return "while";
        case TokenKind::KwFor:
            return "for";
        case TokenKind::KwLoop:
            return "loop";
        case TokenKind::KwIn:
            return "in";
        case TokenKind::KwFunc:
            return "fn";
        case TokenKind::KwReturn:
            return "return";
        case TokenKind::Type:
            return "TYPE";
        case TokenKind::KwVoid:
            return "void";
        case TokenKind::KwTypeof:
            return "typeof";
        case TokenKind::KwBreak:
            return "break";
        case TokenKind::KwContinue:
            return "continue";
    }
    return "?";
}

} // namespace magolor::frontend
