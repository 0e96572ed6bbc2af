//===- EnvironmentVerifier.cpp - Check synthesized declarations -*- C++ -*-===//
//
// This file checks the synthesized declarations against the environment
// graph. A failure here is a defect in an earlier step, never a property of
// the input program.
//
//===----------------------------------------------------------------------===//

#include "cconv/Transforms/Synthesis.h"

#include "llvm/ADT/DenseMap.h"

#include <string>

namespace cconv {

namespace {

bool fail(LoweringError& error, const std::string& message) {
  return error.fail(LoweringErrorKind::InvalidEnvironmentGraph, message);
}

} // namespace

bool verifyEnvironmentGraph(const ScopeTree& tree,
                            const SynthesizedDeclarations& declarations,
                            LoweringError& error) {
  size_t liveEnvironments = 0;
  for (EnvironmentId envId = 0; envId < tree.numEnvironments(); ++envId) {
    const Environment& env = tree.getEnvironment(envId);
    if (env.removed) {
      continue;
    }
    ++liveEnvironments;
    const SynthesizedType* type = declarations.lookupType(envId);
    if (type == nullptr) {
      return fail(error, "environment #" + std::to_string(envId) +
                             " has no synthesized type");
    }
    if (env.capturesParent && type->parentField == nullptr) {
      return fail(error, "'" + type->name + "' captures its parent but has "
                                            "no parent field");
    }
    for (const VariableSymbol* variable : env.variables) {
      auto declScope = tree.lookupDeclaringScope(variable);
      if (!declScope || *declScope != env.scope) {
        return fail(error, "'" + variable->name + "' is hoisted into '" +
                               type->name +
                               "' but declared in another scope");
      }
    }
  }
  if (liveEnvironments != declarations.types.size()) {
    return fail(error, "synthesized types do not match live environments");
  }

  llvm::DenseMap<const VariableSymbol*, const SynthesizedType*> owner;
  for (const auto& type : declarations.types) {
    for (const auto& entry : type->fieldOf) {
      auto inserted = owner.try_emplace(entry.first, type.get());
      if (!inserted.second) {
        return fail(error, "'" + entry.first->name + "' is hoisted into both '" +
                               inserted.first->second->name + "' and '" +
                               type->name + "'");
      }
    }
  }
  if (!checkStructFields(declarations, error)) {
    return false;
  }

  if (declarations.methods.size() != tree.numClosures()) {
    return fail(error, "synthesized methods do not match nested functions");
  }
  for (const auto& method : declarations.methods) {
    const Closure& closure = tree.getClosure(method->closure);
    if (!method->environmentParameters.empty() &&
        !closure.canTakeRefParameters()) {
      return fail(error, "'" + method->symbol->name +
                             "' takes environments by reference but is not "
                             "eligible for it");
    }
    if (method->host != nullptr) {
      const Environment& env = tree.getEnvironment(method->host->environment);
      if (env.removed || env.isStruct()) {
        return fail(error, "'" + method->symbol->name +
                               "' is hosted on '" + method->host->name +
                               "', which is not a live class environment");
      }
    }
    for (const auto& param : method->environmentParameters) {
      if (!param.second->isByRef) {
        return fail(error, "environment parameter '" + param.second->name +
                               "' of '" + method->symbol->name +
                               "' is not by reference");
      }
    }
  }
  return true;
}

} // namespace cconv
