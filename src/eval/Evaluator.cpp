//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Evaluator.cpp
/// @brief Implementation of the Magolor expression evaluator.
///
/// @details Integer arithmetic wraps on overflow, except `INT64_MIN / -1`
/// which is reported as an error.  `&&` and `||` short-circuit and accept
/// bools or ints (zero is false); their result is always a bool.
///
//===----------------------------------------------------------------------===//

#include "eval/Evaluator.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace magolor::eval
{

using frontend::BinaryOp;
using frontend::ExprKind;
using frontend::UnaryOp;
using magolor::support::Diag;
using magolor::support::Expected;
using magolor::support::makeError;
using magolor::support::SourceLoc;

namespace
{
Diag evalError(SourceLoc loc, std::string message)
{
    return makeError(loc, std::move(message), kEvalErrorCode);
}

std::string describe(const Value &l, BinaryOp op, const Value &r)
{
    return std::string(typeName(l.type())) + " " + frontend::binaryOpSpelling(op) + " " +
           typeName(r.type());
}

Diag unknownOperator(SourceLoc loc, const Value &l, BinaryOp op, const Value &r)
{
    return evalError(loc, "unknown operator: " + describe(l, op, r));
}

bool isTruthCarrier(const Value &v)
{
    return v.isBool() || v.isInt();
}

bool truth(const Value &v)
{
    return v.isBool() ? v.asBool() : v.asInt() != 0;
}

int64_t wrapAdd(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

int64_t wrapSub(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

int64_t wrapMul(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

Expected<Value> intInfix(SourceLoc loc, BinaryOp op, const Value &lv, const Value &rv)
{
    const int64_t l = lv.asInt();
    const int64_t r = rv.asInt();
    switch (op)
    {
        case BinaryOp::Add:
            return Value::makeInt(wrapAdd(l, r));
        case BinaryOp::Sub:
            return Value::makeInt(wrapSub(l, r));
        case BinaryOp::Mul:
            return Value::makeInt(wrapMul(l, r));
        case BinaryOp::Div:
            if (r == 0)
                return evalError(loc, "division by zero");
            if (l == std::numeric_limits<int64_t>::min() && r == -1)
                return evalError(loc, "integer overflow");
            return Value::makeInt(l / r);
        case BinaryOp::Mod:
            if (r == 0)
                return evalError(loc, "division by zero");
            if (r == -1)
                return Value::makeInt(0);
            return Value::makeInt(l % r);
        case BinaryOp::Eq:
            return Value::makeBool(l == r);
        case BinaryOp::Ne:
            return Value::makeBool(l != r);
        case BinaryOp::Lt:
            return Value::makeBool(l < r);
        case BinaryOp::Gt:
            return Value::makeBool(l > r);
        case BinaryOp::Le:
            return Value::makeBool(l <= r);
        case BinaryOp::Ge:
            return Value::makeBool(l >= r);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    return unknownOperator(loc, lv, op, rv);
}

Expected<Value> floatInfix(SourceLoc loc, BinaryOp op, const Value &lv, const Value &rv)
{
    const double l = lv.toDouble();
    const double r = rv.toDouble();
    switch (op)
    {
        case BinaryOp::Add:
            return Value::makeFloat(l + r);
        case BinaryOp::Sub:
            return Value::makeFloat(l - r);
        case BinaryOp::Mul:
            return Value::makeFloat(l * r);
        case BinaryOp::Div:
            if (r == 0.0)
                return evalError(loc, "division by zero");
            return Value::makeFloat(l / r);
        case BinaryOp::Mod:
            if (r == 0.0)
                return evalError(loc, "division by zero");
            return Value::makeFloat(std::fmod(l, r));
        case BinaryOp::Eq:
            return Value::makeBool(l == r);
        case BinaryOp::Ne:
            return Value::makeBool(l != r);
        case BinaryOp::Lt:
            return Value::makeBool(l < r);
        case BinaryOp::Gt:
            return Value::makeBool(l > r);
        case BinaryOp::Le:
            return Value::makeBool(l <= r);
        case BinaryOp::Ge:
            return Value::makeBool(l >= r);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    return unknownOperator(loc, lv, op, rv);
}

/// Strings, bools, and null support only the operators listed in the header.
Expected<Value> otherInfix(SourceLoc loc, BinaryOp op, const Value &l, const Value &r)
{
    if (l.isString() && r.isString())
    {
        if (op == BinaryOp::Add)
            return Value::makeString(l.asString() + r.asString());
        if (op == BinaryOp::Eq)
            return Value::makeBool(l.asString() == r.asString());
        if (op == BinaryOp::Ne)
            return Value::makeBool(l.asString() != r.asString());
        return unknownOperator(loc, l, op, r);
    }
    if (l.isBool() && r.isBool())
    {
        if (op == BinaryOp::Eq)
            return Value::makeBool(l.asBool() == r.asBool());
        if (op == BinaryOp::Ne)
            return Value::makeBool(l.asBool() != r.asBool());
        return unknownOperator(loc, l, op, r);
    }
    if (l.isNull() || r.isNull())
    {
        if (op == BinaryOp::Eq)
            return Value::makeBool(l.isNull() && r.isNull());
        if (op == BinaryOp::Ne)
            return Value::makeBool(!(l.isNull() && r.isNull()));
        return unknownOperator(loc, l, op, r);
    }
    return evalError(loc, "type mismatch: " + describe(l, op, r));
}
} // namespace

Expected<Value> Evaluator::eval(const frontend::Expr &expr, const Environment &env)
{
    if (++depth_ > frontend::kMaxTreeDepth)
    {
        --depth_;
        return evalError(expr.loc, "expression nesting too deep (limit: 1024)");
    }
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard() { --d; }
    } evalGuard_{depth_};

    switch (expr.kind)
    {
        case ExprKind::Identifier:
        {
            const auto &e = static_cast<const frontend::IdentifierExpr &>(expr);
            if (auto value = env.get(e.name))
                return std::move(*value);
            return evalError(e.loc, "identifier not found: " + e.name);
        }
        case ExprKind::IntLiteral:
            return Value::makeInt(static_cast<const frontend::IntLiteralExpr &>(expr).value);
        case ExprKind::FloatLiteral:
            return Value::makeFloat(static_cast<const frontend::FloatLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return Value::makeString(static_cast<const frontend::StringLiteralExpr &>(expr).value);
        case ExprKind::BoolLiteral:
            return Value::makeBool(static_cast<const frontend::BoolLiteralExpr &>(expr).value);
        case ExprKind::NilLiteral:
        case ExprKind::VoidLiteral:
            return Value::makeNull();
        case ExprKind::Prefix:
            return evalPrefix(static_cast<const frontend::PrefixExpr &>(expr), env);
        case ExprKind::Infix:
            return evalInfix(static_cast<const frontend::InfixExpr &>(expr), env);
        case ExprKind::TypeOf:
        {
            auto operand = eval(*static_cast<const frontend::TypeOfExpr &>(expr).operand, env);
            if (!operand)
                return operand.error();
            return Value::makeString(typeName(operand.value().type()));
        }
    }
    return evalError(expr.loc, "cannot evaluate expression");
}

Expected<Value> Evaluator::evalPrefix(const frontend::PrefixExpr &expr, const Environment &env)
{
    auto operand = eval(*expr.operand, env);
    if (!operand)
        return operand.error();
    const Value &v = operand.value();

    switch (expr.op)
    {
        case UnaryOp::Neg:
            if (v.isInt())
                return Value::makeInt(wrapSub(0, v.asInt()));
            if (v.isFloat())
                return Value::makeFloat(-v.asFloat());
            break;
        case UnaryOp::Plus:
            if (v.isNumeric())
                return v;
            break;
        case UnaryOp::Not:
            if (isTruthCarrier(v))
                return Value::makeBool(!truth(v));
            break;
    }
    return evalError(expr.loc,
                     std::string("unknown operator: ") + frontend::unaryOpSpelling(expr.op) +
                         typeName(v.type()));
}

Expected<Value> Evaluator::evalInfix(const frontend::InfixExpr &expr, const Environment &env)
{
    if (expr.op == BinaryOp::And || expr.op == BinaryOp::Or)
        return evalLogical(expr, env);

    auto left = eval(*expr.left, env);
    if (!left)
        return left.error();
    auto right = eval(*expr.right, env);
    if (!right)
        return right.error();

    const Value &l = left.value();
    const Value &r = right.value();
    if (l.isInt() && r.isInt())
        return intInfix(expr.loc, expr.op, l, r);
    if (l.isNumeric() && r.isNumeric())
        return floatInfix(expr.loc, expr.op, l, r);
    return otherInfix(expr.loc, expr.op, l, r);
}

Expected<Value> Evaluator::evalLogical(const frontend::InfixExpr &expr, const Environment &env)
{
    auto left = eval(*expr.left, env);
    if (!left)
        return left.error();

    const Value &l = left.value();
    if (isTruthCarrier(l))
    {
        const bool lt = truth(l);
        if (expr.op == BinaryOp::And && !lt)
            return Value::makeBool(false);
        if (expr.op == BinaryOp::Or && lt)
            return Value::makeBool(true);
    }

    auto right = eval(*expr.right, env);
    if (!right)
        return right.error();
    const Value &r = right.value();
    if (!isTruthCarrier(l) || !isTruthCarrier(r))
        return unknownOperator(expr.loc, l, expr.op, r);
    return Value::makeBool(truth(r));
}

} // namespace magolor::eval
