//===- Passes.h - Closure conversion analysis micropasses -------*- C++ -*-===//
//
// This file declares the analysis steps of closure conversion. They run in
// the order declared here over one ScopeTree; each returns false and fills in
// `error` when it fails.
//
//===----------------------------------------------------------------------===//

#ifndef CCONV_ANALYSIS_PASSES_H
#define CCONV_ANALYSIS_PASSES_H

#include "cconv/Analysis/ScopeTree.h"

namespace cconv {

/// Mirror the lexical nesting of the method body into `tree`, which must be
/// empty. Declares every parameter, local and nested function.
bool buildScopeTree(ScopeTree& tree, LoweringError& error);

/// Record direct captures and closure-to-closure references, then close the
/// capture sets transitively.
bool analyzeCaptures(ScopeTree& tree, LoweringError& error);

/// Propagate capture sets along closure references until no set grows.
/// `maxVisits` bounds the number of closure visits; 0 selects n*n + n for n
/// closures.
bool propagateTransitiveCaptures(ScopeTree& tree, LoweringError& error,
                                 size_t maxVisits = 0);

/// Create one environment per scope that declares a captured variable and
/// decide whether it is a Struct or a Class.
bool allocateEnvironments(ScopeTree& tree, LoweringError& error);

/// Pick the containing environment of every closure and mark the parent
/// links needed to reach every other Class environment it captures.
bool linearizeEnvironments(ScopeTree& tree, LoweringError& error);

/// Remove environments that only forward the receiver, until nothing
/// changes. Returns the number of environments removed.
unsigned optimizeEnvironments(ScopeTree& tree);

} // namespace cconv

#endif // CCONV_ANALYSIS_PASSES_H
