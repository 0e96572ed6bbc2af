//===- ScopeTreeBuilder.cpp - Mirror lexical nesting ------------*- C++ -*-===//
//
// This file builds the scope tree of one method body: one scope per block and
// per nested function body, with every declaration attached to the scope that
// lexically owns it.
//
//===----------------------------------------------------------------------===//

#include "cconv/Analysis/Passes.h"

#include "tree/node.hpp"
#include "tree/visitor.hpp"

#include "llvm/ADT/SmallVector.h"

namespace cconv {

namespace {

//===----------------------------------------------------------------------===//
// ScopeTreeBuilder
//===----------------------------------------------------------------------===//

class ScopeTreeBuilder : public RecursiveVisitor {
public:
  ScopeTreeBuilder(ScopeTree& tree, LoweringError& error)
      : tree(tree), error(error) {}

  bool build() {
    const NMethodBody& method = tree.getMethod();
    if (method.method == nullptr || method.body == nullptr) {
      return error.fail(LoweringErrorKind::MalformedInput,
                        "method body without a method symbol or a block");
    }

    ScopeId root = tree.addScope(ScopeKind::MethodBody, std::nullopt,
                                 method.body.get());
    if (method.receiver != nullptr) {
      declare(root, method.receiver, method.body->loc);
    }
    for (const VariableSymbol* param : method.method->parameters) {
      declare(root, param, method.body->loc);
    }

    scopeStack.push_back(root);
    visitStatements(*method.body);
    scopeStack.pop_back();
    return !error.isSet();
  }

  void visit(const NBlock& node) override {
    ScopeId scope = tree.addScope(ScopeKind::Block, scopeStack.back(), &node);
    scopeStack.push_back(scope);
    visitStatements(node);
    scopeStack.pop_back();
  }

  void visit(const NVariableDeclaration& node) override {
    if (node.symbol == nullptr) {
      error.fail(LoweringErrorKind::MalformedInput,
                 "variable declaration without a symbol", node.loc);
      return;
    }
    RecursiveVisitor::visit(node);
    declare(scopeStack.back(), node.symbol, node.loc);
  }

  void visit(const NLambda& node) override {
    buildFunction(node.function, *node.body, ScopeKind::LambdaBody, node.loc);
  }

  void visit(const NLocalFunctionStatement& node) override {
    buildFunction(node.function, *node.body, ScopeKind::LocalFunctionBody,
                  node.loc);
  }

private:
  ScopeTree& tree;
  LoweringError& error;
  llvm::SmallVector<ScopeId, 8> scopeStack;

  void declare(ScopeId scope, const VariableSymbol* variable,
               SourceLocation loc) {
    if (variable == nullptr) {
      error.fail(LoweringErrorKind::MalformedInput, "null parameter symbol",
                 loc);
      return;
    }
    if (!tree.declareVariable(scope, variable)) {
      error.fail(LoweringErrorKind::MalformedInput,
                 "variable '" + variable->name + "' is declared twice", loc);
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

  /// The function body block is the body scope itself; it does not get an
  /// extra Block scope.
  void buildFunction(const FunctionSymbol* function, const NBlock& body,
                     ScopeKind kind, SourceLocation loc) {
    if (error.isSet()) {
      return;
    }
    if (function == nullptr) {
      error.fail(LoweringErrorKind::MalformedInput,
                 "nested function without a symbol", loc);
      return;
    }
    if (tree.lookupClosure(function)) {
      error.fail(LoweringErrorKind::MalformedInput,
                 "nested function '" + function->name + "' is declared twice",
                 loc);
      return;
    }

    ClosureId closure = tree.addClosure(function, scopeStack.back());
    ScopeId bodyScope = tree.addScope(kind, scopeStack.back(), &body);
    tree.getScope(bodyScope).ownerClosure = closure;
    tree.getClosure(closure).bodyScope = bodyScope;

    for (const VariableSymbol* param : function->parameters) {
      declare(bodyScope, param, loc);
    }

    scopeStack.push_back(bodyScope);
    visitStatements(body);
    scopeStack.pop_back();
  }
};

} // namespace

bool buildScopeTree(ScopeTree& tree, LoweringError& error) {
  if (tree.numScopes() != 0) {
    return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                      "scope tree is already built");
  }
  ScopeTreeBuilder builder(tree, error);
  return builder.build();
}

} // namespace cconv
