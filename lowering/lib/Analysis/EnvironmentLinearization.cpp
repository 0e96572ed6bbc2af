//===- EnvironmentLinearization.cpp - Host closures and chain ---*- C++ -*-===//
//
// This file assigns every closure its containing environment and builds the
// parent chain from that environment to every other reference-typed
// environment the closure reads.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/Passes.h"

#include "tree/symbols.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"

#include <string>

namespace cconv {

namespace {

/// The Class environment of the nearest scope, starting at the defining
/// scope, that the closure reads from.
std::optional<EnvironmentId> findContainingEnvironment(const ScopeTree& tree,
                                                       const Closure& closure) {
  std::optional<ScopeId> current = closure.definingScope;
  while (current) {
    const Scope& scope = tree.getScope(*current);
    if (scope.environment) {
      const Environment& env = tree.getEnvironment(*scope.environment);
      if (!env.isStruct() &&
          closure.capturedEnvironments.contains(*scope.environment)) {
        return scope.environment;
      }
    }
    current = scope.parent;
  }
  return std::nullopt;
}

} // namespace

bool linearizeEnvironments(ScopeTree& tree, LoweringError& error) {
  // Closure ids are in pre-order, so the closure owning a frame is linearized
  // before any closure nested in it; getRuntimeParent relies on that.
  for (ClosureId id = 0; id < tree.numClosures(); ++id) {
    Closure& closure = tree.getClosure(id);
    closure.containingEnvironment = findContainingEnvironment(tree, closure);
    if (!closure.containingEnvironment) {
      continue;
    }

    EnvironmentId containing = *closure.containingEnvironment;
    tree.getEnvironment(containing).closures.push_back(id);

    llvm::SmallVector<EnvironmentId, 4> targets;
    for (EnvironmentId envId : closure.capturedEnvironments) {
      if (envId != containing && !tree.getEnvironment(envId).isStruct()) {
        targets.push_back(envId);
      }
    }

    EnvironmentId current = containing;
    while (!targets.empty()) {
      tree.getEnvironment(current).capturesParent = true;
      auto parent = tree.getRuntimeParent(current);
      if (!parent) {
        return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                          "closure '" + closure.function->name +
                              "' cannot reach environment #" +
                              std::to_string(targets.front()) +
                              " through its parent chain",
                          tree.getScope(closure.bodyScope).block->loc);
      }
      current = *parent;
      llvm::erase_value(targets, current);
    }

    auto receiverEnv = tree.getReceiverEnvironment();
    if (closure.capturesThis && receiverEnv &&
        !tree.getEnvironment(*receiverEnv).isStruct()) {
      tree.getEnvironment(*receiverEnv).capturesParent = true;
    }
  }
  return true;
}

} // namespace cconv
