//===- EnvironmentAllocation.cpp - Hoist captured variables -----*- C++ -*-===//
//
// This file groups captured variables by declaring scope. Every scope that
// declares a captured variable owns one environment holding all of them.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/Passes.h"

#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"

namespace cconv {

bool allocateEnvironments(ScopeTree& tree, LoweringError& error) {
  if (tree.numEnvironments() != 0) {
    return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                      "environments are already allocated");
  }

  // Every closure that reads a variable, directly or through another closure.
  llvm::DenseMap<const VariableSymbol*, llvm::SmallVector<ClosureId, 2>>
      readers;
  for (ClosureId id = 0; id < tree.numClosures(); ++id) {
    for (const VariableSymbol* variable :
         tree.getClosure(id).capturedVariables) {
      readers[variable].push_back(id);
    }
  }

  for (ScopeId scopeId : tree.getScopesInPreorder()) {
    llvm::SmallVector<const VariableSymbol*, 4> hoisted;
    for (const VariableSymbol* variable :
         tree.getScope(scopeId).declaredVariables) {
      if (readers.count(variable) != 0) {
        hoisted.push_back(variable);
      }
    }
    if (hoisted.empty()) {
      continue;
    }

    EnvironmentId envId = tree.addEnvironment(scopeId, EnvironmentKind::Struct);
    Environment& env = tree.getEnvironment(envId);
    for (const VariableSymbol* variable : hoisted) {
      env.variables.insert(variable);
      for (ClosureId reader : readers[variable]) {
        Closure& closure = tree.getClosure(reader);
        closure.capturedEnvironments.insert(envId);
        if (!closure.canTakeRefParameters()) {
          env.kind = EnvironmentKind::Class;
        }
      }
    }
  }
  return true;
}

} // namespace cconv
