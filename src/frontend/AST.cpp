//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Operator spellings shared by the renderers and the evaluator.
///
//===----------------------------------------------------------------------===//

#include "frontend/AST.hpp"

namespace magolor::frontend
{

const char *unaryOpSpelling(UnaryOp op)
{
    switch (op)
    {
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Plus:
            return "+";
        case UnaryOp::Not:
            return "!";
    }
    return "?";
}

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

} // namespace magolor::frontend
