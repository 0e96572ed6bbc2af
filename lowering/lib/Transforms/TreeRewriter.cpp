//===- TreeRewriter.cpp - Rewrite the closure-free tree ---------*- C++ -*-===//
//
// This file produces the rewritten method body and the bodies of the
// synthesized methods in one traversal of the input tree.
//
//===----------------------------------------------------------------------===//

#include "cconv/Transforms/Synthesis.h"

#include "tree/visitor.hpp"

#include "llvm/ADT/DenseMap.h"

#include <cstddef>
#include <optional>
#include <string>

namespace cconv {

namespace {

/// Per-method facts, fixed once the method's signature is known.
struct MethodFrame {
  /// nullopt for the method being compiled.
  std::optional<ClosureId> closure;
  /// Environment type the method is lowered onto; nullptr for the enclosing
  /// type.
  const SynthesizedType* host = nullptr;
  bool isStatic = false;
  llvm::SmallDenseMap<EnvironmentId, const VariableSymbol*, 2>
      environmentParameters;
  /// Input symbol -> symbol used in the rewritten body. Grows when a local is
  /// re-declared with renamed type parameters.
  llvm::DenseMap<const VariableSymbol*, const VariableSymbol*> symbolMap;
};

/// State threaded down the traversal. Every scope gets its own copy, so
/// leaving a scope restores the enclosing state.
struct FrameState {
  MethodFrame* method = nullptr;
  /// The Class environment most recently created in this frame, or the
  /// method's host; nullopt stands for the enclosing receiver.
  std::optional<EnvironmentId> framePointer;
  /// Environments created in this frame by the scopes being rewritten.
  llvm::SmallDenseMap<EnvironmentId, const VariableSymbol*, 4>
      environmentLocals;
};

//===----------------------------------------------------------------------===//
// TreeRewriter
//===----------------------------------------------------------------------===//

/// TreeRewriter - Builds the closure-free tree from the input tree.
///
/// ## Scopes
///
/// Entering a scope that owns an environment emits, at the top of the new
/// block:
/// - the environment local, `new` for a Class and zero-initialized for a
///   Struct;
/// - the parent field store, from the current frame pointer;
/// - copies of hoisted parameters (and of the receiver, for a Struct that
///   holds it) into their fields.
/// A Class environment then becomes the frame pointer of the nested scopes.
///
/// ## References
///
/// A hoisted variable becomes a field access on its environment. The
/// environment is reached, in order of preference, through the local created
/// in this frame, through the by-reference parameter for a Struct, or from
/// the method's own receiver along the parent fields.
///
/// ## Nested functions
///
/// Their bodies are rewritten with a fresh MethodFrame into the synthesized
/// method. Lambdas and method group conversions become delegate creations,
/// local function statements disappear and local calls become method calls
/// that pass Struct environments as extra arguments.
class TreeRewriter {
public:
  TreeRewriter(const ScopeTree& tree, SymbolTable& symbols,
               SynthesizedDeclarations& declarations, LoweringError& error)
      : tree(tree), symbols(symbols), declarations(declarations), error(error),
        method(tree.getMethod()) {}

  std::unique_ptr<NMethodBody> run();

  std::unique_ptr<NExpression> rewriteExpression(const NExpression& expr,
                                                 const FrameState& state);
  std::unique_ptr<NStatement> rewriteStatement(const NStatement& stmt,
                                               const FrameState& state);
  std::unique_ptr<NBlock> rewriteBlock(const NBlock& block,
                                       const FrameState& state);

  std::unique_ptr<NExpression> rewriteVariable(const VariableSymbol* variable,
                                               const FrameState& state);
  std::unique_ptr<NStatement>
  rewriteDeclaration(const NVariableDeclaration& node, const FrameState& state);
  std::unique_ptr<NExpression> rewriteEnclosingReceiver(const FrameState& state);
  std::unique_ptr<NExpression> rewriteDelegate(const FunctionSymbol* function,
                                               bool rewriteBody,
                                               const FrameState& state);
  std::unique_ptr<NExpression> rewriteLocalCall(const NCall& node,
                                                const FrameState& state);
  bool rewriteClosure(const FunctionSymbol* function);

  /// Spelling of `type` in the frame being rewritten: methods hosted on an
  /// environment type only see the renamed type parameters.
  [[nodiscard]] std::string getFrameType(const std::string& type,
                                         const FrameState& state) const {
    if (state.method->host == nullptr) {
      return type;
    }
    return renameTypeParameters(type, method.method->typeParameters);
  }

private:
  const ScopeTree& tree;
  SymbolTable& symbols;
  SynthesizedDeclarations& declarations;
  LoweringError& error;
  const NMethodBody& method;
  /// Innermost located node being rewritten.
  SourceLocation location;

  std::nullptr_t fail(const std::string& message) {
    if (!error.isSet()) {
      error.fail(LoweringErrorKind::InvalidEnvironmentGraph, message,
                 location);
    }
    return nullptr;
  }

  /// Track the location of `node` while it is rewritten.
  class LocationScope {
  public:
    LocationScope(TreeRewriter& rewriter, const Node& node)
        : rewriter(rewriter), saved(rewriter.location) {
      if (node.loc.isValid()) {
        rewriter.location = node.loc;
      }
    }
    ~LocationScope() { rewriter.location = saved; }
    LocationScope(const LocationScope&) = delete;
    LocationScope& operator=(const LocationScope&) = delete;

  private:
    TreeRewriter& rewriter;
    SourceLocation saved;
  };

  std::unique_ptr<NBlock> rewriteScope(const NBlock& block, ScopeId scopeId,
                                       const FrameState& outer);
  bool enterEnvironment(EnvironmentId envId, FrameState& state,
                        StatementList& out);

  std::unique_ptr<NExpression>
  getEnvironmentReference(EnvironmentId envId, const FrameState& state);
  std::unique_ptr<NExpression> getHostReference(const MethodFrame& frame) const;
  std::unique_ptr<NExpression> getCallReceiver(ClosureId closure,
                                               const FrameState& state);

  [[nodiscard]] llvm::ArrayRef<std::string>
  getTypeArguments(const MethodFrame& frame) const {
    if (frame.host != nullptr) {
      return frame.host->typeParameters;
    }
    return method.method->typeParameters;
  }

  [[nodiscard]] const VariableSymbol*
  lookupSymbol(const VariableSymbol* variable, const MethodFrame& frame) const {
    auto it = frame.symbolMap.find(variable);
    return it == frame.symbolMap.end() ? variable : it->second;
  }
};

std::unique_ptr<NStatement> makeAssignment(std::unique_ptr<NExpression> target,
                                           std::unique_ptr<NExpression> value) {
  return std::make_unique<NExpressionStatement>(
      std::make_unique<NAssignment>(std::move(target), std::move(value)));
}

//===----------------------------------------------------------------------===//
// NodeRewriter
//===----------------------------------------------------------------------===//

/// Dispatches one node to the TreeRewriter with the state of its position.
class NodeRewriter : public Visitor {
public:
  NodeRewriter(TreeRewriter& rewriter, const FrameState& state)
      : rewriter(rewriter), state(state) {}

  std::unique_ptr<NExpression> expression;
  std::unique_ptr<NStatement> statement;

  void visit(const NLiteral& node) override {
    expression = std::make_unique<NLiteral>(
        node.value, rewriter.getFrameType(node.type, state));
  }

  void visit(const NVariableRef& node) override {
    expression = rewriter.rewriteVariable(node.symbol, state);
  }

  void visit(const NThisRef& /*node*/) override {
    expression = rewriter.rewriteEnclosingReceiver(state);
  }

  void visit(const NAssignment& node) override {
    auto target = rewriter.rewriteExpression(*node.target, state);
    auto value = rewriter.rewriteExpression(*node.value, state);
    expression =
        std::make_unique<NAssignment>(std::move(target), std::move(value));
  }

  void visit(const NBinaryOperator& node) override {
    auto lhs = rewriter.rewriteExpression(*node.lhs, state);
    auto rhs = rewriter.rewriteExpression(*node.rhs, state);
    expression = std::make_unique<NBinaryOperator>(std::move(lhs), node.op,
                                                   std::move(rhs));
  }

  void visit(const NLambda& node) override {
    expression = rewriter.rewriteDelegate(node.function, true, state);
  }

  void visit(const NFunctionRef& node) override {
    expression = rewriter.rewriteDelegate(node.function, false, state);
  }

  void visit(const NCall& node) override {
    if (node.isLocalFunctionCall()) {
      expression = rewriter.rewriteLocalCall(node, state);
      return;
    }
    std::unique_ptr<NExpression> receiver;
    if (node.receiver != nullptr) {
      receiver = rewriter.rewriteExpression(*node.receiver, state);
    }
    expression = std::make_unique<NCall>(node.method, std::move(receiver),
                                         rewriteArguments(node.arguments));
  }

  void visit(const NInvoke& node) override {
    auto callee = rewriter.rewriteExpression(*node.callee, state);
    expression = std::make_unique<NInvoke>(std::move(callee),
                                           rewriteArguments(node.arguments));
  }

  void visit(const NFieldAccess& node) override {
    auto receiver = rewriter.rewriteExpression(*node.receiver, state);
    expression = std::make_unique<NFieldAccess>(std::move(receiver), node.field);
  }

  void visit(const NNewEnvironment& node) override {
    expression = std::make_unique<NNewEnvironment>(
        rewriter.getFrameType(node.type, state));
  }

  void visit(const NDefaultValue& node) override {
    expression =
        std::make_unique<NDefaultValue>(rewriter.getFrameType(node.type, state));
  }

  void visit(const NDelegateCreation& node) override {
    std::unique_ptr<NExpression> receiver;
    if (node.receiver != nullptr) {
      receiver = rewriter.rewriteExpression(*node.receiver, state);
    }
    expression =
        std::make_unique<NDelegateCreation>(std::move(receiver), node.method);
  }

  void visit(const NBlock& node) override {
    statement = rewriter.rewriteBlock(node, state);
  }

  void visit(const NVariableDeclaration& node) override {
    statement = rewriter.rewriteDeclaration(node, state);
  }

  void visit(const NExpressionStatement& node) override {
    statement = std::make_unique<NExpressionStatement>(
        rewriter.rewriteExpression(*node.expression, state));
  }

  void visit(const NReturnStatement& node) override {
    std::unique_ptr<NExpression> value;
    if (node.value != nullptr) {
      value = rewriter.rewriteExpression(*node.value, state);
    }
    statement = std::make_unique<NReturnStatement>(std::move(value));
  }

  void visit(const NIfStatement& node) override {
    auto condition = rewriter.rewriteExpression(*node.condition, state);
    auto thenBlock = rewriter.rewriteBlock(*node.thenBlock, state);
    std::unique_ptr<NBlock> elseBlock;
    if (node.elseBlock != nullptr) {
      elseBlock = rewriter.rewriteBlock(*node.elseBlock, state);
    }
    statement = std::make_unique<NIfStatement>(
        std::move(condition), std::move(thenBlock), std::move(elseBlock));
  }

  void visit(const NWhileStatement& node) override {
    auto condition = rewriter.rewriteExpression(*node.condition, state);
    auto body = rewriter.rewriteBlock(*node.body, state);
    statement =
        std::make_unique<NWhileStatement>(std::move(condition), std::move(body));
  }

  void visit(const NLocalFunctionStatement& node) override {
    // The body moves into the synthesized method; the statement is erased.
    rewriter.rewriteClosure(node.function);
  }

private:
  TreeRewriter& rewriter;
  const FrameState& state;

  ExpressionList rewriteArguments(const ExpressionList& arguments) {
    ExpressionList result;
    for (const auto& arg : arguments) {
      result.push_back(rewriter.rewriteExpression(*arg, state));
    }
    return result;
  }
};

//===----------------------------------------------------------------------===//
// TreeRewriter implementation
//===----------------------------------------------------------------------===//

std::unique_ptr<NMethodBody> TreeRewriter::run() {
  MethodFrame frame;
  frame.isStatic = method.method->isStatic;
  FrameState state;
  state.method = &frame;

  auto body = rewriteScope(*method.body, tree.getRoot(), state);
  if (error.isSet()) {
    return nullptr;
  }
  for (const auto& lowered : declarations.methods) {
    if (lowered->body == nullptr) {
      return fail("nested function '" +
                  tree.getClosure(lowered->closure).function->name +
                  "' was never rewritten");
    }
  }
  return std::make_unique<NMethodBody>(method.method, method.receiver,
                                       std::move(body));
}

std::unique_ptr<NExpression>
TreeRewriter::rewriteExpression(const NExpression& expr,
                                const FrameState& state) {
  LocationScope scope(*this, expr);
  NodeRewriter visitor(*this, state);
  expr.accept(visitor);
  if (visitor.expression != nullptr) {
    visitor.expression->loc = expr.loc;
  }
  return std::move(visitor.expression);
}

std::unique_ptr<NStatement>
TreeRewriter::rewriteStatement(const NStatement& stmt,
                               const FrameState& state) {
  LocationScope scope(*this, stmt);
  NodeRewriter visitor(*this, state);
  stmt.accept(visitor);
  if (visitor.statement != nullptr) {
    visitor.statement->loc = stmt.loc;
  }
  return std::move(visitor.statement);
}

std::unique_ptr<NBlock> TreeRewriter::rewriteBlock(const NBlock& block,
                                                   const FrameState& state) {
  auto scopeId = tree.lookupScope(&block);
  if (!scopeId) {
    return fail("block without a scope");
  }
  return rewriteScope(block, *scopeId, state);
}

std::unique_ptr<NBlock> TreeRewriter::rewriteScope(const NBlock& block,
                                                   ScopeId scopeId,
                                                   const FrameState& outer) {
  auto result = std::make_unique<NBlock>();
  result->loc = block.loc;

  FrameState state = outer;
  const Scope& scope = tree.getScope(scopeId);
  if (scope.environment &&
      !enterEnvironment(*scope.environment, state, result->statements)) {
    return nullptr;
  }

  for (const auto& stmt : block.statements) {
    auto rewritten = rewriteStatement(*stmt, state);
    if (error.isSet()) {
      return nullptr;
    }
    if (rewritten != nullptr) {
      result->statements.push_back(std::move(rewritten));
    }
  }
  return result;
}

bool TreeRewriter::enterEnvironment(EnvironmentId envId, FrameState& state,
                                    StatementList& out) {
  const Environment& env = tree.getEnvironment(envId);
  const SynthesizedType* type = declarations.lookupType(envId);
  if (type == nullptr) {
    fail("environment #" + std::to_string(envId) + " has no type");
    return false;
  }

  const std::string typeRef =
      type->getReference(getTypeArguments(*state.method));
  VariableSymbol* local =
      symbols.createLocal("__env" + std::to_string(envId), typeRef);
  local->isSynthesized = true;
  std::unique_ptr<NExpression> init;
  if (env.isStruct()) {
    init = std::make_unique<NDefaultValue>(typeRef);
  } else {
    init = std::make_unique<NNewEnvironment>(typeRef);
  }
  out.push_back(std::make_unique<NVariableDeclaration>(local, std::move(init)));

  auto fieldOfLocal = [local](const FieldSymbol* field) {
    return std::make_unique<NFieldAccess>(std::make_unique<NVariableRef>(local),
                                          field);
  };

  if (type->parentField != nullptr) {
    if (tree.getRuntimeParent(envId) != state.framePointer) {
      fail("parent of '" + type->name + "' is not the current frame pointer");
      return false;
    }
    std::unique_ptr<NExpression> parent;
    if (state.framePointer) {
      parent = getEnvironmentReference(*state.framePointer, state);
    } else {
      parent = rewriteEnclosingReceiver(state);
    }
    if (parent == nullptr) {
      return false;
    }
    out.push_back(makeAssignment(fieldOfLocal(type->parentField),
                                 std::move(parent)));
  }

  for (const VariableSymbol* variable : env.variables) {
    const FieldSymbol* field = type->fieldOf.lookup(variable);
    if (variable->isThis()) {
      if (field == nullptr) {
        continue;
      }
      auto receiver = rewriteEnclosingReceiver(state);
      if (receiver == nullptr) {
        return false;
      }
      out.push_back(makeAssignment(fieldOfLocal(field), std::move(receiver)));
    } else if (variable->kind == VariableKind::Parameter) {
      out.push_back(makeAssignment(
          fieldOfLocal(field),
          std::make_unique<NVariableRef>(
              lookupSymbol(variable, *state.method))));
    }
  }

  state.environmentLocals[envId] = local;
  if (!env.isStruct()) {
    state.framePointer = envId;
  }
  return true;
}

std::unique_ptr<NExpression>
TreeRewriter::getHostReference(const MethodFrame& frame) const {
  return std::make_unique<NThisRef>(
      frame.host->getReference(frame.host->typeParameters));
}

std::unique_ptr<NExpression>
TreeRewriter::getEnvironmentReference(EnvironmentId envId,
                                      const FrameState& state) {
  if (const VariableSymbol* local = state.environmentLocals.lookup(envId)) {
    return std::make_unique<NVariableRef>(local);
  }

  const MethodFrame& frame = *state.method;
  if (tree.getEnvironment(envId).isStruct()) {
    if (const VariableSymbol* param = frame.environmentParameters.lookup(envId)) {
      return std::make_unique<NVariableRef>(param);
    }
    return fail("struct environment #" + std::to_string(envId) +
                " is neither a local nor a parameter here");
  }

  if (frame.host == nullptr) {
    return fail("environment #" + std::to_string(envId) +
                " is not reachable from a method without an environment");
  }
  std::unique_ptr<NExpression> expr = getHostReference(frame);
  EnvironmentId current = frame.host->environment;
  while (current != envId) {
    const SynthesizedType* type = declarations.lookupType(current);
    auto parent = tree.getRuntimeParent(current);
    if (type->parentField == nullptr || !parent) {
      return fail("environment #" + std::to_string(envId) +
                  " is not on the parent chain of '" + frame.host->name + "'");
    }
    expr = std::make_unique<NFieldAccess>(std::move(expr), type->parentField);
    current = *parent;
  }
  return expr;
}

std::unique_ptr<NExpression>
TreeRewriter::rewriteEnclosingReceiver(const FrameState& state) {
  const MethodFrame& frame = *state.method;
  const VariableSymbol* receiver = tree.getReceiver();
  if (receiver == nullptr) {
    return fail("static method has no receiver");
  }
  if (!frame.closure || (frame.host == nullptr && !frame.isStatic)) {
    return std::make_unique<NThisRef>(method.method->containingType);
  }

  if (auto receiverEnv = tree.getReceiverEnvironment()) {
    const SynthesizedType* type = declarations.lookupType(*receiverEnv);
    const FieldSymbol* field =
        type->isStruct() ? type->fieldOf.lookup(receiver) : type->parentField;
    if (field == nullptr) {
      return fail("'" + type->name + "' does not hold the receiver");
    }
    auto envRef = getEnvironmentReference(*receiverEnv, state);
    if (envRef == nullptr) {
      return nullptr;
    }
    return std::make_unique<NFieldAccess>(std::move(envRef), field);
  }

  // No environment holds the receiver: the chain from the host ends in it.
  if (frame.host == nullptr) {
    return fail("static method '" +
                declarations.getMethod(*frame.closure)->symbol->name +
                "' reads the receiver");
  }
  std::unique_ptr<NExpression> expr = getHostReference(frame);
  EnvironmentId current = frame.host->environment;
  while (true) {
    const SynthesizedType* type = declarations.lookupType(current);
    if (type->parentField == nullptr) {
      return fail("receiver is not reachable from '" + frame.host->name + "'");
    }
    expr = std::make_unique<NFieldAccess>(std::move(expr), type->parentField);
    auto parent = tree.getRuntimeParent(current);
    if (!parent) {
      return expr;
    }
    current = *parent;
  }
}

std::unique_ptr<NExpression>
TreeRewriter::rewriteVariable(const VariableSymbol* variable,
                              const FrameState& state) {
  auto envId = tree.lookupEnvironment(variable);
  if (!envId) {
    return std::make_unique<NVariableRef>(
        lookupSymbol(variable, *state.method));
  }
  const FieldSymbol* field = declarations.lookupType(*envId)->fieldOf.lookup(
      variable);
  if (field == nullptr) {
    return fail("'" + variable->name + "' has no field");
  }
  auto envRef = getEnvironmentReference(*envId, state);
  if (envRef == nullptr) {
    return nullptr;
  }
  return std::make_unique<NFieldAccess>(std::move(envRef), field);
}

std::unique_ptr<NStatement>
TreeRewriter::rewriteDeclaration(const NVariableDeclaration& node,
                                 const FrameState& state) {
  std::unique_ptr<NExpression> init;
  if (node.initializer != nullptr) {
    init = rewriteExpression(*node.initializer, state);
    if (init == nullptr) {
      return nullptr;
    }
  }

  if (tree.lookupEnvironment(node.symbol)) {
    if (init == nullptr) {
      // The field is already zero-initialized.
      return nullptr;
    }
    auto target = rewriteVariable(node.symbol, state);
    if (target == nullptr) {
      return nullptr;
    }
    return makeAssignment(std::move(target), std::move(init));
  }

  MethodFrame& frame = *state.method;
  const VariableSymbol* symbol = node.symbol;
  if (frame.host != nullptr) {
    std::string type = getFrameType(symbol->type, state);
    if (type != symbol->type) {
      VariableSymbol* copy = symbols.createLocal(symbol->name, type);
      copy->isSynthesized = true;
      frame.symbolMap[symbol] = copy;
      symbol = copy;
    }
  }
  return std::make_unique<NVariableDeclaration>(symbol, std::move(init));
}

std::unique_ptr<NExpression>
TreeRewriter::getCallReceiver(ClosureId closure, const FrameState& state) {
  const SynthesizedMethod* lowered = declarations.getMethod(closure);
  if (lowered->host != nullptr) {
    return getEnvironmentReference(lowered->host->environment, state);
  }
  if (lowered->isStatic()) {
    return nullptr;
  }
  return rewriteEnclosingReceiver(state);
}

std::unique_ptr<NExpression>
TreeRewriter::rewriteDelegate(const FunctionSymbol* function, bool rewriteBody,
                              const FrameState& state) {
  if (rewriteBody && !rewriteClosure(function)) {
    return nullptr;
  }
  auto closure = tree.lookupClosure(function);
  if (!closure) {
    return fail("unknown nested function");
  }
  auto receiver = getCallReceiver(*closure, state);
  if (error.isSet()) {
    return nullptr;
  }
  return std::make_unique<NDelegateCreation>(
      std::move(receiver), declarations.getMethod(*closure)->symbol);
}

std::unique_ptr<NExpression>
TreeRewriter::rewriteLocalCall(const NCall& node, const FrameState& state) {
  auto closure = tree.lookupClosure(node.function);
  if (!closure) {
    return fail("call to unknown local function");
  }
  const SynthesizedMethod* lowered = declarations.getMethod(*closure);

  auto receiver = getCallReceiver(*closure, state);
  if (error.isSet()) {
    return nullptr;
  }
  ExpressionList arguments;
  for (const auto& arg : node.arguments) {
    arguments.push_back(rewriteExpression(*arg, state));
  }
  for (const auto& param : lowered->environmentParameters) {
    auto envRef = getEnvironmentReference(param.first, state);
    if (envRef == nullptr) {
      return nullptr;
    }
    arguments.push_back(std::move(envRef));
  }
  return std::make_unique<NCall>(lowered->symbol, std::move(receiver),
                                 std::move(arguments));
}

bool TreeRewriter::rewriteClosure(const FunctionSymbol* function) {
  auto closureId = tree.lookupClosure(function);
  if (!closureId) {
    fail("unknown nested function");
    return false;
  }
  SynthesizedMethod* lowered = declarations.getMethod(*closureId);
  if (lowered->body != nullptr) {
    fail("nested function '" + function->name + "' is rewritten twice");
    return false;
  }

  MethodFrame frame;
  frame.closure = *closureId;
  frame.host = lowered->host;
  frame.isStatic = lowered->isStatic();
  for (const auto& param : lowered->environmentParameters) {
    frame.environmentParameters[param.first] = param.second;
  }
  frame.symbolMap = lowered->parameterMap;

  FrameState state;
  state.method = &frame;
  if (frame.host != nullptr) {
    state.framePointer = frame.host->environment;
  }

  const Closure& closure = tree.getClosure(*closureId);
  const NBlock* body = tree.getScope(closure.bodyScope).block;
  lowered->body = rewriteScope(*body, closure.bodyScope, state);
  return !error.isSet();
}

} // namespace

std::unique_ptr<NMethodBody>
rewriteMethodBody(const ScopeTree& tree, SymbolTable& symbols,
                  SynthesizedDeclarations& declarations, LoweringError& error) {
  TreeRewriter rewriter(tree, symbols, declarations, error);
  return rewriter.run();
}

} // namespace cconv
