//===- CaptureAnalysis.cpp - Compute closure capture sets -------*- C++ -*-===//
//
// This file records which variables every nested function reads or writes
// across its own boundary, and closes the sets over calls and value
// conversions between nested functions.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/Passes.h"

#include "tree/node.hpp"
#include "tree/visitor.hpp"

#include "llvm/ADT/SetVector.h"
#include "llvm/ADT/SmallVector.h"

#include <optional>
#include <string>
#include <vector>

namespace cconv {

namespace {

//===----------------------------------------------------------------------===//
// CaptureCollector
//===----------------------------------------------------------------------===//

/// Walks the tree once. A reference is recorded on the innermost closure
/// only; the edge from every closure to the closures nested directly inside
/// it carries the capture outwards during propagation.
class CaptureCollector : public RecursiveVisitor {
public:
  CaptureCollector(ScopeTree& tree, LoweringError& error)
      : tree(tree), error(error) {}

  bool collect() {
    scopeStack.push_back(tree.getRoot());
    visitStatements(*tree.getMethod().body);
    scopeStack.pop_back();
    return !error.isSet();
  }

  void visit(const NVariableRef& node) override {
    recordReference(node.symbol, node.loc);
  }

  void visit(const NThisRef& node) override {
    const VariableSymbol* receiver = tree.getReceiver();
    if (receiver == nullptr) {
      fail("receiver referenced in a static method", node.loc);
      return;
    }
    recordReference(receiver, node.loc);
  }

  void visit(const NBlock& node) override {
    auto scope = tree.lookupScope(&node);
    if (!scope) {
      fail("block without a scope", node.loc);
      return;
    }
    scopeStack.push_back(*scope);
    visitStatements(node);
    scopeStack.pop_back();
  }

  void visit(const NLambda& node) override {
    enterFunction(node.function, node.loc);
  }

  void visit(const NLocalFunctionStatement& node) override {
    enterFunction(node.function, node.loc);
  }

  void visit(const NFunctionRef& node) override {
    auto callee = lookupCallee(node.function, node.loc);
    if (!callee) {
      return;
    }
    tree.getClosure(*callee).isConvertedToDelegate = true;
    addDependency(*callee);
  }

  void visit(const NCall& node) override {
    if (node.isLocalFunctionCall()) {
      auto callee = lookupCallee(node.function, node.loc);
      if (!callee) {
        return;
      }
      addDependency(*callee);
    }
    RecursiveVisitor::visit(node);
  }

private:
  ScopeTree& tree;
  LoweringError& error;
  llvm::SmallVector<ScopeId, 8> scopeStack;
  llvm::SmallVector<ClosureId, 4> closureStack;

  void fail(const std::string& message, SourceLocation loc) {
    if (!error.isSet()) {
      error.fail(LoweringErrorKind::MalformedInput, message, loc);
    }
  }

  void visitStatements(const NBlock& block) {
    for (const auto& stmt : block.statements) {
      if (error.isSet()) {
        return;
      }
      stmt->accept(*this);
    }
  }

  void enterFunction(const FunctionSymbol* function, SourceLocation loc) {
    auto closureId = tree.lookupClosure(function);
    if (!closureId) {
      fail("nested function without a scope", loc);
      return;
    }
    if (!closureStack.empty()) {
      tree.getClosure(closureStack.back()).dependencies.insert(*closureId);
    }

    const Closure& closure = tree.getClosure(*closureId);
    const NBlock* body = tree.getScope(closure.bodyScope).block;
    closureStack.push_back(*closureId);
    scopeStack.push_back(closure.bodyScope);
    visitStatements(*body);
    scopeStack.pop_back();
    closureStack.pop_back();
  }

  std::optional<ClosureId> lookupCallee(const FunctionSymbol* function,
                                        SourceLocation loc) {
    auto callee = tree.lookupClosure(function);
    if (!callee) {
      fail("reference to unknown local function '" +
               (function != nullptr ? function->name : std::string("<null>")) +
               "'",
           loc);
    }
    return callee;
  }

  void addDependency(ClosureId callee) {
    if (!closureStack.empty()) {
      tree.getClosure(closureStack.back()).dependencies.insert(callee);
    }
  }

  void recordReference(const VariableSymbol* variable, SourceLocation loc) {
    if (variable == nullptr) {
      fail("variable reference without a symbol", loc);
      return;
    }
    auto declScope = tree.lookupDeclaringScope(variable);
    if (!declScope) {
      fail("reference to undeclared variable '" + variable->name + "'", loc);
      return;
    }
    if (!tree.isAncestorOrSelf(*declScope, scopeStack.back())) {
      fail("variable '" + variable->name +
               "' is referenced outside the scope that declares it",
           loc);
      return;
    }
    if (closureStack.empty()) {
      return;
    }

    ClosureId current = closureStack.back();
    if (tree.isDeclaredInside(variable, current)) {
      return;
    }
    Closure& closure = tree.getClosure(current);
    closure.directCaptures.insert(variable);
    closure.capturedVariables.insert(variable);
  }
};

} // namespace

bool propagateTransitiveCaptures(ScopeTree& tree, LoweringError& error,
                                 size_t maxVisits) {
  const size_t n = tree.numClosures();
  if (maxVisits == 0) {
    maxVisits = n * n + n;
  }

  // Reverse edges: callers[B] lists every closure that depends on B.
  std::vector<llvm::SmallVector<ClosureId, 2>> callers(n);
  for (ClosureId id = 0; id < n; ++id) {
    for (ClosureId dep : tree.getClosure(id).dependencies) {
      callers[dep].push_back(id);
    }
  }

  llvm::SetVector<ClosureId> worklist;
  for (ClosureId id = 0; id < n; ++id) {
    if (!tree.getClosure(id).capturedVariables.empty()) {
      worklist.insert(id);
    }
  }

  // Processed in rounds: a round visits every closure whose set grew in the
  // previous one, so n rounds suffice for n closures.
  size_t visits = 0;
  while (!worklist.empty()) {
    llvm::SetVector<ClosureId> next;
    for (ClosureId calleeId : worklist) {
      if (++visits > maxVisits) {
        return error.fail(LoweringErrorKind::NonConvergentCaptures,
                          "capture sets did not converge after " +
                              std::to_string(maxVisits) + " visits");
      }
      for (ClosureId callerId : callers[calleeId]) {
        if (callerId == calleeId) {
          continue;
        }
        const Closure& callee = tree.getClosure(calleeId);
        Closure& caller = tree.getClosure(callerId);
        bool changed = false;
        for (const VariableSymbol* variable : callee.capturedVariables) {
          if (tree.isDeclaredInside(variable, callerId)) {
            continue;
          }
          changed |= caller.capturedVariables.insert(variable);
        }
        if (changed) {
          next.insert(callerId);
        }
      }
    }
    worklist = std::move(next);
  }
  return true;
}

bool analyzeCaptures(ScopeTree& tree, LoweringError& error) {
  CaptureCollector collector(tree, error);
  if (!collector.collect()) {
    return false;
  }
  if (!propagateTransitiveCaptures(tree, error)) {
    return false;
  }

  const VariableSymbol* receiver = tree.getReceiver();
  for (ClosureId id = 0; id < tree.numClosures(); ++id) {
    Closure& closure = tree.getClosure(id);
    closure.capturesThis =
        receiver != nullptr && closure.capturedVariables.contains(receiver);
  }
  return true;
}

} // namespace cconv
