//===- environment_allocation_test.cpp - Environment allocation -*- C++ -*-===//

#include "lowering/lowering_test_helper.hpp"

using namespace cconv;

namespace {

class EnvironmentAllocationTest : public LoweringTest {};

} // namespace

// ============== Hoisting Tests ==============

TEST_F(EnvironmentAllocationTest, NoCapturesNoEnvironments) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x, lit("1")), decl(f, lambda(fn, block(ret(lit("2")))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(tree->numEnvironments(), 0);
  EXPECT_FALSE(tree->getScope(tree->getRoot()).environment.has_value());
}

TEST_F(EnvironmentAllocationTest, OnlyCapturedVariablesAreHoisted) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* y = local("y");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x, lit("1")), decl(y, lit("2")),
                decl(f, lambda(fn, block(ret(ref(x)))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  ASSERT_EQ(tree->numEnvironments(), 1);
  const Environment& env = tree->getEnvironment(0);
  EXPECT_EQ(env.scope, tree->getRoot());
  EXPECT_EQ(env.variables.size(), 1);
  EXPECT_TRUE(env.variables.contains(x));
  EXPECT_FALSE(tree->lookupEnvironment(y).has_value());
  EXPECT_EQ(tree->getScope(tree->getRoot()).environment, 0);
}

TEST_F(EnvironmentAllocationTest, VariablesKeepDeclarationOrder) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* a = local("a");
  VariableSymbol* b = local("b");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(b, lit("1")), decl(a, lit("2")),
                decl(f, lambda(fn, block(ret(binop(ref(a), "+", ref(b))))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  const Environment& env = tree->getEnvironment(0);
  ASSERT_EQ(env.variables.size(), 2);
  EXPECT_EQ(env.variables[0], b);
  EXPECT_EQ(env.variables[1], a);
}

TEST_F(EnvironmentAllocationTest, OneEnvironmentPerDeclaringScope) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* y = local("y");
  VariableSymbol* f = local("f", "Func<int>");
  auto inner = block(decl(y, lit("2")),
                     decl(f, lambda(fn, block(ret(binop(ref(x), "+",
                                                        ref(y)))))));
  const NBlock* innerPtr = inner.get();
  setBody(block(decl(x, lit("1")), std::move(inner)));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  ASSERT_EQ(tree->numEnvironments(), 2);
  EXPECT_EQ(tree->getEnvironment(0).scope, tree->getRoot());
  EXPECT_EQ(tree->getEnvironment(1).scope, scopeOf(innerPtr));
  EXPECT_EQ(environmentIdOf(x), 0);
  EXPECT_EQ(environmentIdOf(y), 1);

  const Closure& closure = closureOf(fn);
  ASSERT_EQ(closure.capturedEnvironments.size(), 2);
  EXPECT_TRUE(closure.capturedEnvironments.contains(0));
  EXPECT_TRUE(closure.capturedEnvironments.contains(1));
}

TEST_F(EnvironmentAllocationTest, ReceiverIsHoisted) {
  FunctionSymbol* fn = lambdaFunction("f", "Program");
  VariableSymbol* f = local("f", "Func<Program>");
  setBody(block(decl(f, lambda(fn, block(ret(self()))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  ASSERT_EQ(tree->numEnvironments(), 1);
  const Environment& env = tree->getEnvironment(0);
  EXPECT_TRUE(env.variables.contains(receiver));
  EXPECT_TRUE(env.holdsOnlyReceiver());
  EXPECT_EQ(tree->getReceiverEnvironment(), 0);
}

// ============== Kind Selection Tests ==============

TEST_F(EnvironmentAllocationTest, LambdaCaptureMakesClass) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x, lit("1")), decl(f, lambda(fn, block(ret(ref(x)))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(x)->kind, EnvironmentKind::Class);
}

TEST_F(EnvironmentAllocationTest, DirectlyCalledLocalFunctionMakesStruct) {
  FunctionSymbol* g = localFunctionSymbol("g");
  VariableSymbol* x = local("x");
  setBody(block(decl(x, lit("0")),
                localFunction(g, block(assign(ref(x), lit("1")))),
                stmt(call(g))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(x)->kind, EnvironmentKind::Struct);
}

TEST_F(EnvironmentAllocationTest, ConvertedLocalFunctionMakesClass) {
  FunctionSymbol* g = localFunctionSymbol("g", "int");
  VariableSymbol* x = local("x");
  VariableSymbol* h = local("h", "Func<int>");
  setBody(block(decl(x, lit("0")), localFunction(g, block(ret(ref(x)))),
                decl(h, functionRef(g))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(x)->kind, EnvironmentKind::Class);
}

TEST_F(EnvironmentAllocationTest, IteratorLocalFunctionMakesClass) {
  FunctionSymbol* g = localFunctionSymbol("g", "IEnumerable<int>");
  g->isIterator = true;
  VariableSymbol* x = local("x");
  setBody(block(decl(x, lit("0")), localFunction(g, block(ret(ref(x)))),
                stmt(call(g))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(x)->kind, EnvironmentKind::Class);
}

TEST_F(EnvironmentAllocationTest, IndirectLambdaReaderMakesClass) {
  FunctionSymbol* g = localFunctionSymbol("g", "int");
  FunctionSymbol* fn = lambdaFunction("l");
  VariableSymbol* x = local("x");
  VariableSymbol* l = local("l", "Func<int>");
  setBody(block(decl(x, lit("0")), localFunction(g, block(ret(ref(x)))),
                decl(l, lambda(fn, block(ret(call(g)))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(x)->kind, EnvironmentKind::Class);
  EXPECT_TRUE(closureOf(g).capturedEnvironments.contains(environmentIdOf(x)));
  EXPECT_TRUE(closureOf(fn).capturedEnvironments.contains(environmentIdOf(x)));
}

TEST_F(EnvironmentAllocationTest, KindIsDecidedPerScope) {
  FunctionSymbol* g = localFunctionSymbol("g");
  FunctionSymbol* fn = lambdaFunction("l");
  VariableSymbol* a = local("a");
  VariableSymbol* b = local("b");
  VariableSymbol* l = local("l", "Func<int>");
  setBody(block(decl(a, lit("1")),
                decl(l, lambda(fn, block(ret(ref(a))))),
                block(decl(b, lit("2")),
                      localFunction(g, block(assign(ref(b), lit("3")))),
                      stmt(call(g)))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_EQ(environmentOf(a)->kind, EnvironmentKind::Class);
  EXPECT_EQ(environmentOf(b)->kind, EnvironmentKind::Struct);
}

TEST_F(EnvironmentAllocationTest, AllocatingTwiceIsRejected) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x, lit("1")), decl(f, lambda(fn, block(ret(ref(x)))))));
  ASSERT_TRUE(runUntil(Stage::AllocateEnvironments));

  EXPECT_FALSE(allocateEnvironments(*tree, error));
  EXPECT_EQ(error.kind, LoweringErrorKind::InvalidEnvironmentGraph);
}
