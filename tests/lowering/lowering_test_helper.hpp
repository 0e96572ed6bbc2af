#ifndef CCONV_LOWERING_TEST_HELPER_HPP
#define CCONV_LOWERING_TEST_HELPER_HPP

// Include gtest first to avoid conflicts with LLVM headers
#include <gtest/gtest.h>

#include "tree_test_helper.hpp"

#include "cconv/Analysis/Passes.h"
#include "cconv/Analysis/ScopeTree.h"
#include "cconv/Transforms/Synthesis.h"

#include "llvm/Support/raw_ostream.h"

#include <initializer_list>
#include <memory>
#include <string>

namespace cconv {

/// Analysis steps in pipeline order; runUntil stops after the named one.
enum class Stage {
  BuildScopes,
  AnalyzeCaptures,
  AllocateEnvironments,
  LinearizeEnvironments,
  OptimizeEnvironments,
  SynthesizeDeclarations,
};

/// Fixture for the closure conversion micropasses. Every test builds one
/// method `Program.Run` (instance unless made static) out of symbols owned
/// by `symbols`.
class LoweringTest : public ::testing::Test {
protected:
  SymbolTable symbols;
  MethodSymbol* method = nullptr;
  VariableSymbol* receiver = nullptr;

  std::unique_ptr<NMethodBody> body;
  std::unique_ptr<ScopeTree> tree;
  LoweringError error;
  SymbolTable synthesized;
  SynthesizedDeclarations declarations;

  void SetUp() override {
    method = symbols.createMethod("Run", "Program", "void");
    receiver = symbols.createThis("Program");
  }

  void makeStatic() {
    method->isStatic = true;
    receiver = nullptr;
  }

  VariableSymbol* local(const std::string& name,
                        const std::string& type = "int") {
    return symbols.createLocal(name, type);
  }

  VariableSymbol* methodParameter(const std::string& name,
                                  const std::string& type = "int") {
    VariableSymbol* param = symbols.createParameter(name, type);
    method->parameters.push_back(param);
    return param;
  }

  FunctionSymbol* lambdaFunction(const std::string& name,
                                 const std::string& returnType = "int") {
    return symbols.createFunction(FunctionKind::Lambda, name, returnType);
  }

  FunctionSymbol* localFunctionSymbol(const std::string& name,
                                      const std::string& returnType = "void") {
    return symbols.createFunction(FunctionKind::LocalFunction, name,
                                  returnType);
  }

  VariableSymbol* functionParameter(FunctionSymbol* function,
                                    const std::string& name,
                                    const std::string& type = "int") {
    VariableSymbol* param = symbols.createParameter(name, type);
    function->parameters.push_back(param);
    return param;
  }

  /// Install the method body and reset the analysis state.
  void setBody(std::unique_ptr<NBlock> root) {
    body = std::make_unique<NMethodBody>(method, receiver, std::move(root));
    tree = std::make_unique<ScopeTree>(*body);
    error = LoweringError();
  }

  /// Run the micropasses in order up to and including `last`.
  bool runUntil(Stage last) {
    if (!buildScopeTree(*tree, error)) {
      return false;
    }
    if (last == Stage::BuildScopes) {
      return true;
    }
    if (!analyzeCaptures(*tree, error)) {
      return false;
    }
    if (last == Stage::AnalyzeCaptures) {
      return true;
    }
    if (!allocateEnvironments(*tree, error)) {
      return false;
    }
    if (last == Stage::AllocateEnvironments) {
      return true;
    }
    if (!linearizeEnvironments(*tree, error)) {
      return false;
    }
    if (last == Stage::LinearizeEnvironments) {
      return true;
    }
    optimizeEnvironments(*tree);
    if (last == Stage::OptimizeEnvironments) {
      return true;
    }
    return synthesizeDeclarations(*tree, synthesized, declarations, error);
  }

  /// Run every step and return the rewritten method body.
  std::unique_ptr<NMethodBody> lower() {
    if (!runUntil(Stage::SynthesizeDeclarations)) {
      return nullptr;
    }
    if (!verifyEnvironmentGraph(*tree, declarations, error)) {
      return nullptr;
    }
    return rewriteMethodBody(*tree, synthesized, declarations, error);
  }

  const Closure& closureOf(const FunctionSymbol* function) const {
    auto id = tree->lookupClosure(function);
    EXPECT_TRUE(id.has_value()) << "no closure for '" << function->name << "'";
    return tree->getClosure(id.value_or(0));
  }

  ClosureId closureIdOf(const FunctionSymbol* function) const {
    auto id = tree->lookupClosure(function);
    EXPECT_TRUE(id.has_value()) << "no closure for '" << function->name << "'";
    return id.value_or(0);
  }

  ScopeId scopeOf(const NBlock* block) const {
    auto id = tree->lookupScope(block);
    EXPECT_TRUE(id.has_value()) << "block without a scope";
    return id.value_or(0);
  }

  /// The live environment hoisting `variable`.
  const Environment* environmentOf(const VariableSymbol* variable) const {
    auto id = tree->lookupEnvironment(variable);
    EXPECT_TRUE(id.has_value()) << "'" << variable->name << "' is not hoisted";
    return id ? &tree->getEnvironment(*id) : nullptr;
  }

  EnvironmentId environmentIdOf(const VariableSymbol* variable) const {
    auto id = tree->lookupEnvironment(variable);
    EXPECT_TRUE(id.has_value()) << "'" << variable->name << "' is not hoisted";
    return id.value_or(0);
  }

  const SynthesizedMethod* loweredOf(const FunctionSymbol* function) const {
    return declarations.getMethod(closureIdOf(function));
  }

  static bool captures(const Closure& closure,
                       std::initializer_list<const VariableSymbol*> expected) {
    if (closure.capturedVariables.size() != expected.size()) {
      return false;
    }
    for (const VariableSymbol* variable : expected) {
      if (!closure.capturedVariables.contains(variable)) {
        return false;
      }
    }
    return true;
  }

  std::string printGraph() const {
    std::string result;
    llvm::raw_string_ostream os(result);
    tree->print(os);
    os.flush();
    return result;
  }
};

} // namespace cconv

#endif // CCONV_LOWERING_TEST_HELPER_HPP
