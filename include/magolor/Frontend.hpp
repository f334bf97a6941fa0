//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/magolor/Frontend.hpp
// Purpose: Stable public entry point for embedding the Magolor front end.
// Key invariants: Re-exports only the supported lexer, parser, AST, rendering,
//                 and evaluation surface; parser internals stay under src/.
// Ownership/Lifetime: Types keep the semantics of their src/ definitions.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/Environment.hpp"
#include "eval/Evaluator.hpp"
#include "eval/Types.hpp"
#include "eval/Value.hpp"
#include "frontend/AST.hpp"
#include "frontend/AstPrinter.hpp"
#include "frontend/AstRender.hpp"
#include "frontend/Frontend.hpp"
#include "frontend/Grammar.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Options.hpp"
#include "frontend/Parser.hpp"
#include "frontend/Token.hpp"
#include "magolor/version.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
