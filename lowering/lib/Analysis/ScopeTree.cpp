//===- ScopeTree.cpp - Scope, closure and environment graph -----*- C++ -*-===//
//
// This file implements the arena and the queries shared by the closure
// conversion micropasses.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/ScopeTree.h"

#include "tree/node.hpp"
#include "tree/symbols.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

namespace cconv {

llvm::StringRef stringifyScopeKind(ScopeKind kind) {
  switch (kind) {
  case ScopeKind::MethodBody:
    return "method-body";
  case ScopeKind::Block:
    return "block";
  case ScopeKind::LambdaBody:
    return "lambda-body";
  case ScopeKind::LocalFunctionBody:
    return "local-function-body";
  }
  llvm_unreachable("Unknown ScopeKind");
}

llvm::StringRef stringifyEnvironmentKind(EnvironmentKind kind) {
  switch (kind) {
  case EnvironmentKind::Struct:
    return "struct";
  case EnvironmentKind::Class:
    return "class";
  }
  llvm_unreachable("Unknown EnvironmentKind");
}

//===----------------------------------------------------------------------===//
// Closure / Environment
//===----------------------------------------------------------------------===//

bool Closure::isLambda() const { return function->isLambda(); }

bool Closure::canTakeRefParameters() const {
  return !function->isLambda() && !isConvertedToDelegate &&
         !function->isAsync && !function->isIterator;
}

bool Environment::holdsOnlyReceiver() const {
  return variables.size() == 1 && variables.front()->isThis();
}

//===----------------------------------------------------------------------===//
// ScopeTree
//===----------------------------------------------------------------------===//

ScopeTree::ScopeTree(const NMethodBody& method) : method(method) {}

const VariableSymbol* ScopeTree::getReceiver() const { return method.receiver; }

ScopeId ScopeTree::addScope(ScopeKind kind, std::optional<ScopeId> parent,
                            const NBlock* block) {
  const auto id = static_cast<ScopeId>(scopes.size());
  Scope scope;
  scope.kind = kind;
  scope.parent = parent;
  scope.block = block;
  if (parent) {
    scope.depth = scopes[*parent].depth + 1;
    scopes[*parent].children.push_back(id);
  }
  scopes.push_back(std::move(scope));
  if (block != nullptr) {
    scopeOf[block] = id;
  }
  return id;
}

ClosureId ScopeTree::addClosure(const FunctionSymbol* function,
                                ScopeId definingScope) {
  const auto id = static_cast<ClosureId>(closures.size());
  Closure closure;
  closure.function = function;
  closure.definingScope = definingScope;
  closure.isConvertedToDelegate = function->isConvertedToDelegate;
  closures.push_back(std::move(closure));
  closureOf[function] = id;
  scopes[definingScope].closures.push_back(id);
  return id;
}

EnvironmentId ScopeTree::addEnvironment(ScopeId scope, EnvironmentKind kind) {
  const auto id = static_cast<EnvironmentId>(environments.size());
  Environment env;
  env.scope = scope;
  env.kind = kind;
  environments.push_back(std::move(env));
  scopes[scope].environment = id;
  return id;
}

bool ScopeTree::declareVariable(ScopeId scope, const VariableSymbol* variable) {
  if (!declaringScopes.try_emplace(variable, scope).second) {
    return false;
  }
  scopes[scope].declaredVariables.insert(variable);
  return true;
}

std::optional<ScopeId>
ScopeTree::lookupDeclaringScope(const VariableSymbol* variable) const {
  auto it = declaringScopes.find(variable);
  if (it == declaringScopes.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ClosureId>
ScopeTree::lookupClosure(const FunctionSymbol* function) const {
  auto it = closureOf.find(function);
  if (it == closureOf.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ScopeId> ScopeTree::lookupScope(const NBlock* block) const {
  auto it = scopeOf.find(block);
  if (it == scopeOf.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ScopeTree::isAncestorOrSelf(ScopeId ancestor, ScopeId scope) const {
  std::optional<ScopeId> current = scope;
  while (current) {
    if (*current == ancestor) {
      return true;
    }
    if (scopes[*current].depth <= scopes[ancestor].depth) {
      return false;
    }
    current = scopes[*current].parent;
  }
  return false;
}

bool ScopeTree::isDeclaredInside(const VariableSymbol* variable,
                                 ClosureId closure) const {
  auto declScope = lookupDeclaringScope(variable);
  return declScope && isAncestorOrSelf(closures[closure].bodyScope, *declScope);
}

std::optional<ClosureId> ScopeTree::getFunctionFrame(ScopeId scope) const {
  std::optional<ScopeId> current = scope;
  while (current) {
    if (scopes[*current].ownerClosure) {
      return scopes[*current].ownerClosure;
    }
    current = scopes[*current].parent;
  }
  return std::nullopt;
}

std::optional<EnvironmentId>
ScopeTree::getRuntimeParent(EnvironmentId env) const {
  // The body scope of a closure starts a new frame; its own environment is
  // created in that frame, so it is checked before crossing into the caller.
  ScopeId current = environments[env].scope;
  while (true) {
    const Scope& scope = scopes[current];
    if (scope.ownerClosure) {
      return closures[*scope.ownerClosure].containingEnvironment;
    }
    if (!scope.parent) {
      return std::nullopt;
    }
    current = *scope.parent;
    const Scope& parent = scopes[current];
    if (parent.environment) {
      const Environment& candidate = environments[*parent.environment];
      if (!candidate.removed && !candidate.isStruct()) {
        return *parent.environment;
      }
    }
  }
}

std::optional<EnvironmentId> ScopeTree::getReceiverEnvironment() const {
  if (method.receiver == nullptr) {
    return std::nullopt;
  }
  return lookupEnvironment(method.receiver);
}

std::optional<EnvironmentId>
ScopeTree::lookupEnvironment(const VariableSymbol* variable) const {
  auto declScope = lookupDeclaringScope(variable);
  if (!declScope) {
    return std::nullopt;
  }
  auto envId = scopes[*declScope].environment;
  if (!envId) {
    return std::nullopt;
  }
  const Environment& env = environments[*envId];
  if (env.removed || !env.variables.contains(variable)) {
    return std::nullopt;
  }
  return envId;
}

std::vector<ScopeId> ScopeTree::getScopesInPreorder() const {
  std::vector<ScopeId> order;
  if (scopes.empty()) {
    return order;
  }
  llvm::SmallVector<ScopeId, 16> stack;
  stack.push_back(getRoot());
  while (!stack.empty()) {
    ScopeId id = stack.pop_back_val();
    order.push_back(id);
    const auto& children = scopes[id].children;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(*it);
    }
  }
  return order;
}

void ScopeTree::print(llvm::raw_ostream& os) const {
  os << "scope tree for '" << method.method->qualifiedName() << "'\n";
  for (ScopeId id : getScopesInPreorder()) {
    const Scope& scope = scopes[id];
    os.indent(scope.depth * 2) << "scope #" << id << " "
                               << stringifyScopeKind(scope.kind);
    if (!scope.declaredVariables.empty()) {
      os << " vars(";
      llvm::interleaveComma(scope.declaredVariables, os,
                            [&](const VariableSymbol* v) { os << v->name; });
      os << ")";
    }
    if (scope.environment) {
      const Environment& env = environments[*scope.environment];
      os << " env #" << *scope.environment << " "
         << stringifyEnvironmentKind(env.kind);
      if (env.capturesParent) {
        os << " captures-parent";
      }
    }
    os << "\n";
    for (ClosureId cid : scope.closures) {
      const Closure& closure = closures[cid];
      os.indent(scope.depth * 2 + 2)
          << "closure #" << cid << " '" << closure.function->name << "'";
      os << " captures(";
      llvm::interleaveComma(closure.capturedVariables, os,
                            [&](const VariableSymbol* v) { os << v->name; });
      os << ")";
      if (closure.containingEnvironment) {
        os << " in env #" << *closure.containingEnvironment;
      }
      if (!closure.canTakeRefParameters()) {
        os << " by-value";
      }
      os << "\n";
    }
  }
}

} // namespace cconv
