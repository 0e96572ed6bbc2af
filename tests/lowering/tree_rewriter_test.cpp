//===- tree_rewriter_test.cpp - Closure-free tree tests ---------*- C++ -*-===//
//
// Tests for the rewritten method body and the bodies of the synthesized
// methods.
//
//===----------------------------------------------------------------------===//

#include "lowering/lowering_test_helper.hpp"

using namespace cconv;

namespace {

class TreeRewriterTest : public LoweringTest {
protected:
  std::string printLowered(const FunctionSymbol* function) const {
    const SynthesizedMethod* lowered = loweredOf(function);
    EXPECT_NE(lowered, nullptr);
    if (lowered == nullptr || lowered->body == nullptr) {
      return "";
    }
    return printTree(*lowered->body);
  }

  static size_t count(const std::string& haystack, const std::string& needle) {
    size_t result = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
      ++result;
    }
    return result;
  }
};

} // namespace

// ============== Class Environment Tests ==============

TEST_F(TreeRewriterTest, CapturedLocalMovesIntoEnvironment) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x, lit("1")), decl(f, lambda(fn, block(ret(ref(x)))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string expected = "NMethodBody 'Program.Run'\n"
                               "`-NBlock\n"
                               "  |-NVariableDeclaration '__env0' : Run$Env0\n"
                               "  | `-NNewEnvironment Run$Env0\n"
                               "  |-NExpressionStatement\n"
                               "  | `-NAssignment\n"
                               "  |   |-NFieldAccess 'Run$Env0.x'\n"
                               "  |   | `-NVariableRef '__env0'\n"
                               "  |   `-NLiteral 1 : int\n"
                               "  `-NVariableDeclaration 'f' : Func<int>\n"
                               "    `-NDelegateCreation 'Run$Env0.Run$f$0'\n"
                               "      `-NVariableRef '__env0'\n";
  EXPECT_EQ(printTree(*result), expected);

  const std::string lambdaBody = "NBlock\n"
                                 "`-NReturnStatement\n"
                                 "  `-NFieldAccess 'Run$Env0.x'\n"
                                 "    `-NThisRef : Run$Env0\n";
  EXPECT_EQ(printLowered(fn), lambdaBody);
}

TEST_F(TreeRewriterTest, UninitializedHoistedDeclarationIsDropped) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(x), decl(f, lambda(fn, block(ret(ref(x)))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  ASSERT_EQ(result->body->statements.size(), 2);
  auto* envDecl = getStatement<NVariableDeclaration>(*result->body, 0);
  ASSERT_NE(envDecl, nullptr);
  EXPECT_EQ(envDecl->symbol->name, "__env0");
  EXPECT_TRUE(envDecl->symbol->isSynthesized);
  auto* fDecl = getStatement<NVariableDeclaration>(*result->body, 1);
  ASSERT_NE(fDecl, nullptr);
  EXPECT_EQ(fDecl->symbol, f);
}

TEST_F(TreeRewriterTest, CapturedParameterIsCopiedIntoEnvironment) {
  VariableSymbol* p = methodParameter("p");
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(decl(f, lambda(fn, block(ret(ref(p)))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  auto* copy = getStatement<NExpressionStatement>(*result->body, 1);
  ASSERT_NE(copy, nullptr);
  auto* assignment = dynamic_cast<NAssignment*>(copy->expression.get());
  ASSERT_NE(assignment, nullptr);
  auto* target = dynamic_cast<NFieldAccess*>(assignment->target.get());
  ASSERT_NE(target, nullptr);
  EXPECT_EQ(target->field->name, "p");
  auto* value = dynamic_cast<NVariableRef*>(assignment->value.get());
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->symbol, p);
}

TEST_F(TreeRewriterTest, NestedLambdaReachesOuterFieldInOneHop) {
  VariableSymbol* x = methodParameter("x");
  FunctionSymbol* outer = lambdaFunction("a", "Func<int>");
  FunctionSymbol* inner = lambdaFunction("b");
  VariableSymbol* y = local("y");
  VariableSymbol* a = local("a", "Func<Func<int>>");
  VariableSymbol* b = local("b", "Func<int>");
  setBody(block(decl(
      a, lambda(outer,
                block(decl(y, lit("2")),
                      decl(b, lambda(inner, block(ret(binop(ref(x), "+",
                                                            ref(y)))))),
                      ret(ref(b)))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string innerBody = "NBlock\n"
                                "`-NReturnStatement\n"
                                "  `-NBinaryOperator '+'\n"
                                "    |-NFieldAccess 'Run$Env0.x'\n"
                                "    | `-NFieldAccess 'Run$Env1.__parent'\n"
                                "    |   `-NThisRef : Run$Env1\n"
                                "    `-NFieldAccess 'Run$Env1.y'\n"
                                "      `-NThisRef : Run$Env1\n";
  EXPECT_EQ(printLowered(inner), innerBody);

  const std::string outerBody = printLowered(outer);
  EXPECT_NE(outerBody.find("NVariableDeclaration '__env1' : Run$Env1"),
            std::string::npos);
  EXPECT_NE(outerBody.find("NFieldAccess 'Run$Env1.__parent'"),
            std::string::npos);
  EXPECT_NE(outerBody.find("NThisRef : Run$Env0"), std::string::npos);
  EXPECT_NE(outerBody.find("NDelegateCreation 'Run$Env1.Run$b$1'"),
            std::string::npos);

  const std::string root = printTree(*result);
  EXPECT_EQ(count(root, "NNewEnvironment"), 1);
  EXPECT_NE(root.find("NDelegateCreation 'Run$Env0.Run$a$0'"),
            std::string::npos);
}

TEST_F(TreeRewriterTest, LoopBodyAllocatesEnvironmentPerIteration) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* i = local("i");
  VariableSymbol* f = local("f", "Func<int>");
  setBody(block(whileStmt(lit("true", "bool"),
                          block(decl(i, lit("0")),
                                decl(f, lambda(fn, block(ret(ref(i)))))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  ASSERT_EQ(result->body->statements.size(), 1);
  auto* loop = getStatement<NWhileStatement>(*result->body, 0);
  ASSERT_NE(loop, nullptr);
  auto* envDecl = getStatement<NVariableDeclaration>(*loop->body, 0);
  ASSERT_NE(envDecl, nullptr);
  EXPECT_NE(dynamic_cast<NNewEnvironment*>(envDecl->initializer.get()),
            nullptr);
}

// ============== Receiver Tests ==============

TEST_F(TreeRewriterTest, ReceiverOnlyLambdaUsesEnclosingReceiver) {
  FunctionSymbol* fn = lambdaFunction("f", "Program");
  VariableSymbol* f = local("f", "Func<Program>");
  setBody(block(block(block(decl(f, lambda(fn, block(ret(self()))))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string root = printTree(*result);
  EXPECT_EQ(root.find("NNewEnvironment"), std::string::npos);
  EXPECT_NE(root.find("NDelegateCreation 'Program.Run$f$0'\n"),
            std::string::npos);
  EXPECT_NE(root.find("NThisRef : Program"), std::string::npos);
  EXPECT_EQ(printLowered(fn), "NBlock\n"
                              "`-NReturnStatement\n"
                              "  `-NThisRef : Program\n");
}

TEST_F(TreeRewriterTest, ReceiverInClassEnvironmentIsReachedThroughParent) {
  FunctionSymbol* fn = lambdaFunction("f", "Program");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<Program>");
  setBody(block(decl(x, lit("1")),
                decl(f, lambda(fn, block(stmt(ref(x)), ret(self()))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string root = printTree(*result);
  EXPECT_NE(root.find("NFieldAccess 'Run$Env0.__this'"), std::string::npos);
  EXPECT_NE(printLowered(fn).find("  `-NFieldAccess 'Run$Env0.__this'\n"
                                  "    `-NThisRef : Run$Env0\n"),
            std::string::npos);
}

TEST_F(TreeRewriterTest, ChainEndsInReceiverAfterOptimization) {
  FunctionSymbol* fn = lambdaFunction("l");
  VariableSymbol* y = local("y");
  VariableSymbol* l = local("l", "Func<int>");
  setBody(block(block(decl(y, lit("1")),
                      decl(l, lambda(fn, block(stmt(self()),
                                               ret(ref(y))))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  auto* inner = getStatement<NBlock>(*result->body, 0);
  ASSERT_NE(inner, nullptr);
  ASSERT_EQ(inner->statements.size(), 4);
  auto* envDecl = getStatement<NVariableDeclaration>(*inner, 0);
  ASSERT_NE(envDecl, nullptr);
  EXPECT_EQ(envDecl->symbol->name, "__env1");
  EXPECT_EQ(envDecl->symbol->type, "Run$Env0");

  const std::string innerText = printTree(*inner);
  EXPECT_NE(innerText.find("| `-NAssignment\n"
                       "|   |-NFieldAccess 'Run$Env0.__this'\n"
                       "|   | `-NVariableRef '__env1'\n"
                       "|   `-NThisRef : Program\n"),
            std::string::npos);

  const std::string lambdaBody = printLowered(fn);
  EXPECT_NE(lambdaBody.find("NFieldAccess 'Run$Env0.__this'"),
            std::string::npos);
  EXPECT_NE(lambdaBody.find("NFieldAccess 'Run$Env0.y'"), std::string::npos);
}

// ============== Struct Environment Tests ==============

TEST_F(TreeRewriterTest, StructEnvironmentIsPassedByReference) {
  FunctionSymbol* g = localFunctionSymbol("g");
  VariableSymbol* x = local("x");
  setBody(block(decl(x, lit("0")),
                localFunction(g, block(assign(ref(x), binop(ref(x), "+",
                                                            lit("1"))))),
                stmt(call(g)), ret(ref(x))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  // The local function statement is gone.
  ASSERT_EQ(result->body->statements.size(), 4);
  auto* envDecl = getStatement<NVariableDeclaration>(*result->body, 0);
  ASSERT_NE(envDecl, nullptr);
  EXPECT_NE(dynamic_cast<NDefaultValue*>(envDecl->initializer.get()), nullptr);

  auto* callStmt = getStatement<NExpressionStatement>(*result->body, 2);
  ASSERT_NE(callStmt, nullptr);
  auto* loweredCall = dynamic_cast<NCall*>(callStmt->expression.get());
  ASSERT_NE(loweredCall, nullptr);
  EXPECT_FALSE(loweredCall->isLocalFunctionCall());
  EXPECT_EQ(loweredCall->method, loweredOf(g)->symbol);
  EXPECT_EQ(loweredCall->receiver.get(), nullptr);
  ASSERT_EQ(loweredCall->arguments.size(), 1);
  auto* envArg = dynamic_cast<NVariableRef*>(loweredCall->arguments[0].get());
  ASSERT_NE(envArg, nullptr);
  EXPECT_EQ(envArg->symbol, envDecl->symbol);

  const std::string root = printTree(*result);
  EXPECT_EQ(root.find("NLocalFunctionStatement"), std::string::npos);
  EXPECT_NE(root.find("NCall 'Program.Run$g$0' static"), std::string::npos);

  const std::string body = printLowered(g);
  EXPECT_EQ(count(body, "NVariableRef '__env0' ref"), 2);
  EXPECT_EQ(body.find("NNewEnvironment"), std::string::npos);
}

TEST_F(TreeRewriterTest, StructEnvironmentIsForwardedThroughCalls) {
  FunctionSymbol* f = localFunctionSymbol("f");
  FunctionSymbol* g = localFunctionSymbol("g");
  VariableSymbol* x = local("x");
  setBody(block(decl(x, lit("0")),
                localFunction(f, block(assign(ref(x), lit("1")))),
                localFunction(g, block(stmt(call(f)))), stmt(call(g))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const SynthesizedMethod* loweredG = loweredOf(g);
  ASSERT_EQ(loweredG->environmentParameters.size(), 1);
  const VariableSymbol* gParam = loweredG->environmentParameters[0].second;

  auto* forward = getStatement<NExpressionStatement>(*loweredG->body, 0);
  ASSERT_NE(forward, nullptr);
  auto* innerCall = dynamic_cast<NCall*>(forward->expression.get());
  ASSERT_NE(innerCall, nullptr);
  EXPECT_EQ(innerCall->method, loweredOf(f)->symbol);
  ASSERT_EQ(innerCall->arguments.size(), 1);
  auto* arg = dynamic_cast<NVariableRef*>(innerCall->arguments[0].get());
  ASSERT_NE(arg, nullptr);
  EXPECT_EQ(arg->symbol, gParam);
}

TEST_F(TreeRewriterTest, StructEnvironmentHoldsReceiver) {
  FunctionSymbol* g = localFunctionSymbol("g", "Program");
  VariableSymbol* x = local("x");
  setBody(block(decl(x, lit("1")),
                localFunction(g, block(stmt(ref(x)), ret(self()))),
                stmt(call(g))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string root = printTree(*result);
  EXPECT_NE(root.find("  |-NExpressionStatement\n"
                      "  | `-NAssignment\n"
                      "  |   |-NFieldAccess 'Run$Env0.__this'\n"
                      "  |   | `-NVariableRef '__env0'\n"
                      "  |   `-NThisRef : Program\n"),
            std::string::npos);
  EXPECT_EQ(printLowered(g), "NBlock\n"
                             "|-NExpressionStatement\n"
                             "| `-NFieldAccess 'Run$Env0.x'\n"
                             "|   `-NVariableRef '__env0' ref\n"
                             "`-NReturnStatement\n"
                             "  `-NFieldAccess 'Run$Env0.__this'\n"
                             "    `-NVariableRef '__env0' ref\n");
}

// ============== Local Function Tests ==============

TEST_F(TreeRewriterTest, MutuallyRecursiveFunctionsWithoutCaptures) {
  FunctionSymbol* f = localFunctionSymbol("f");
  FunctionSymbol* g = localFunctionSymbol("g");
  setBody(block(localFunction(f, block(stmt(call(g)))),
                localFunction(g, block(stmt(call(f)))), stmt(call(f))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  EXPECT_TRUE(declarations.types.empty());
  EXPECT_EQ(printTree(*result), "NMethodBody 'Program.Run'\n"
                                "`-NBlock\n"
                                "  `-NExpressionStatement\n"
                                "    `-NCall 'Program.Run$f$0' static\n");
  EXPECT_EQ(printLowered(f), "NBlock\n"
                             "`-NExpressionStatement\n"
                             "  `-NCall 'Program.Run$g$1' static\n");
  EXPECT_EQ(printLowered(g), "NBlock\n"
                             "`-NExpressionStatement\n"
                             "  `-NCall 'Program.Run$f$0' static\n");
}

TEST_F(TreeRewriterTest, ConvertedLocalFunctionBecomesDelegate) {
  FunctionSymbol* g = localFunctionSymbol("g", "int");
  VariableSymbol* x = local("x");
  VariableSymbol* h = local("h", "Func<int>");
  setBody(block(decl(x, lit("1")), localFunction(g, block(ret(ref(x)))),
                decl(h, functionRef(g)), stmt(call(g))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string root = printTree(*result);
  EXPECT_NE(root.find("  |-NVariableDeclaration 'h' : Func<int>\n"
                      "  | `-NDelegateCreation 'Run$Env0.Run$g$0'\n"
                      "  |   `-NVariableRef '__env0'\n"),
            std::string::npos);
  EXPECT_NE(root.find("  `-NExpressionStatement\n"
                      "    `-NCall 'Run$Env0.Run$g$0'\n"
                      "      `-receiver:\n"
                      "        `-NVariableRef '__env0'\n"),
            std::string::npos);
}

TEST_F(TreeRewriterTest, LambdaInsideHostedLocalFunction) {
  FunctionSymbol* g = localFunctionSymbol("g", "Func<int>");
  VariableSymbol* p = functionParameter(g, "p");
  FunctionSymbol* fn = lambdaFunction("l");
  VariableSymbol* x = local("x");
  VariableSymbol* l = local("l", "Func<int>");
  setBody(block(
      decl(x, lit("1")),
      localFunction(g, block(decl(l, lambda(fn, block(ret(binop(
                                                 ref(p), "+", ref(x)))))),
                             ret(ref(l)))),
      stmt(call(g, args(lit("2"))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const SynthesizedMethod* loweredG = loweredOf(g);
  EXPECT_FALSE(loweredG->isStatic());
  const VariableSymbol* pCopy = loweredG->parameterMap.lookup(p);
  ASSERT_NE(pCopy, nullptr);

  auto* copy = getStatement<NExpressionStatement>(*loweredG->body, 2);
  ASSERT_NE(copy, nullptr);
  auto* assignment = dynamic_cast<NAssignment*>(copy->expression.get());
  ASSERT_NE(assignment, nullptr);
  auto* value = dynamic_cast<NVariableRef*>(assignment->value.get());
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->symbol, pCopy);

  const std::string gBody = printLowered(g);
  EXPECT_NE(gBody.find("NFieldAccess 'Run$Env1.__parent'"), std::string::npos);
  EXPECT_NE(gBody.find("NThisRef : Run$Env0"), std::string::npos);

  const std::string lBody = printLowered(fn);
  EXPECT_NE(lBody.find("    |-NFieldAccess 'Run$Env1.p'\n"
                       "    | `-NThisRef : Run$Env1\n"
                       "    `-NFieldAccess 'Run$Env0.x'\n"
                       "      `-NFieldAccess 'Run$Env1.__parent'\n"
                       "        `-NThisRef : Run$Env1\n"),
            std::string::npos);

  EXPECT_NE(printTree(*result).find("NCall 'Run$Env0.Run$g$0'"),
            std::string::npos);
}

// ============== Generic Method Tests ==============

TEST_F(TreeRewriterTest, LocalsAreRedeclaredWithRenamedTypes) {
  method->typeParameters = {"T"};
  FunctionSymbol* fn = lambdaFunction("f", "T");
  VariableSymbol* items = local("items", "List<T>");
  VariableSymbol* tmp = local("tmp", "T");
  VariableSymbol* f = local("f", "Func<T>");
  setBody(block(decl(items),
                decl(f, lambda(fn, block(stmt(ref(items)), decl(tmp),
                                         ret(ref(tmp)))))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const SynthesizedMethod* lowered = loweredOf(fn);
  auto* tmpDecl = getStatement<NVariableDeclaration>(*lowered->body, 1);
  ASSERT_NE(tmpDecl, nullptr);
  EXPECT_NE(tmpDecl->symbol, tmp);
  EXPECT_EQ(tmpDecl->symbol->type, "$T");
  auto* retStmt = getStatement<NReturnStatement>(*lowered->body, 2);
  ASSERT_NE(retStmt, nullptr);
  auto* retValue = dynamic_cast<NVariableRef*>(retStmt->value.get());
  ASSERT_NE(retValue, nullptr);
  EXPECT_EQ(retValue->symbol, tmpDecl->symbol);

  EXPECT_NE(printTree(*result).find("NVariableDeclaration '__env0' : "
                                    "Run$Env0<T>"),
            std::string::npos);
  EXPECT_NE(printLowered(fn).find("NThisRef : Run$Env0<$T>"),
            std::string::npos);
}

TEST_F(TreeRewriterTest, ExpressionTypesAreRenamedInHostedMethods) {
  method->typeParameters = {"T"};
  FunctionSymbol* fn = lambdaFunction("f", "void");
  VariableSymbol* x = local("x", "T");
  VariableSymbol* f = local("f", "Action");
  auto body = block(assign(ref(x), lit("default", "T")),
                    assign(ref(x), std::make_unique<NDefaultValue>("T")));
  setBody(block(decl(x, lit("default", "T")),
                decl(f, lambda(fn, std::move(body)))));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const std::string hosted = printLowered(fn);
  EXPECT_NE(hosted.find("NLiteral default : $T\n"), std::string::npos);
  EXPECT_NE(hosted.find("NDefaultValue $T\n"), std::string::npos);
  EXPECT_EQ(hosted.find(" T\n"), std::string::npos);

  // The enclosing method keeps its own type parameters.
  EXPECT_NE(printTree(*result).find("NLiteral default : T\n"),
            std::string::npos);
}

// ============== Source Location Tests ==============

TEST_F(TreeRewriterTest, SourceLocationsAreKept) {
  FunctionSymbol* fn = lambdaFunction("f");
  VariableSymbol* x = local("x");
  VariableSymbol* f = local("f", "Func<int>");
  auto xDecl = decl(x, lit("1"));
  xDecl->setLocation(3, 5);
  auto fDecl = decl(f, lambda(fn, block(ret(ref(x)))));
  fDecl->setLocation(4, 5);
  fDecl->initializer->setLocation(4, 13);
  setBody(block(std::move(xDecl), std::move(fDecl)));
  auto result = lower();
  ASSERT_NE(result, nullptr) << error.message;

  const NStatement& hoisted = *result->body->statements[1];
  EXPECT_EQ(hoisted.loc.line, 3);
  EXPECT_EQ(hoisted.loc.column, 5);
  auto* delegateDecl = getStatement<NVariableDeclaration>(*result->body, 2);
  ASSERT_NE(delegateDecl, nullptr);
  EXPECT_EQ(delegateDecl->loc.line, 4);
  EXPECT_EQ(delegateDecl->initializer->loc.column, 13);
}
