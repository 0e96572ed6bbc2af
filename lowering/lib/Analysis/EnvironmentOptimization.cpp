//===- EnvironmentOptimization.cpp - Drop receiver-only envs ----*- C++ -*-===//
//
// This file removes environments whose only hoisted variable is the
// receiver. Closures that used them read the receiver of the enclosing type
// directly instead.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/Passes.h"

namespace cconv {

namespace {

void removeEnvironment(ScopeTree& tree, EnvironmentId envId) {
  Environment& env = tree.getEnvironment(envId);
  env.removed = true;
  env.closures.clear();
  tree.getScope(env.scope).environment.reset();
  for (ClosureId id = 0; id < tree.numClosures(); ++id) {
    tree.getClosure(id).capturedEnvironments.remove(envId);
  }
}

/// A Struct environment can go once no reader is hosted on an environment:
/// every reader is then a method of the enclosing type and has the receiver.
bool canRemoveStruct(const ScopeTree& tree, EnvironmentId envId) {
  for (ClosureId id = 0; id < tree.numClosures(); ++id) {
    const Closure& closure = tree.getClosure(id);
    if (closure.capturedEnvironments.contains(envId) &&
        closure.containingEnvironment) {
      return false;
    }
  }
  return true;
}

} // namespace

unsigned optimizeEnvironments(ScopeTree& tree) {
  unsigned removed = 0;
  bool changed = true;
  while (changed) {
    changed = false;
    for (EnvironmentId envId = 0; envId < tree.numEnvironments(); ++envId) {
      Environment& env = tree.getEnvironment(envId);
      if (env.removed || !env.holdsOnlyReceiver()) {
        continue;
      }

      if (env.isStruct()) {
        if (!canRemoveStruct(tree, envId)) {
          continue;
        }
      } else {
        // Environments that pointed here now get the receiver from
        // getRuntimeParent, which skips removed environments.
        for (ClosureId id : env.closures) {
          tree.getClosure(id).containingEnvironment.reset();
        }
      }

      removeEnvironment(tree, envId);
      ++removed;
      changed = true;
    }
  }
  return removed;
}

} // namespace cconv
