#ifndef CCONV_NODE_HPP
#define CCONV_NODE_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <tree/symbols.hpp>

class Visitor;
class NStatement;
class NExpression;
class NBlock;

// Source location information for error reporting
struct SourceLocation {
  int line = 0;
  int column = 0;
  SourceLocation() = default;
  SourceLocation(int l, int c) : line(l), column(c) {}
  [[nodiscard]] bool isValid() const { return line > 0; }
};

// Smart pointer type aliases for owning containers
using StatementList = std::vector<std::unique_ptr<NStatement>>;
using ExpressionList = std::vector<std::unique_ptr<NExpression>>;

// clang-format off
class Node {
public:
  SourceLocation loc;
  virtual ~Node() noexcept = default;
  virtual void accept(Visitor &visitor) const = 0;
  void setLocation(int line, int column) { loc = SourceLocation(line, column); }
};

class NExpression : public Node {};

class NStatement : public Node {};

class NBlock : public NStatement {
public:
  StatementList statements;
  NBlock() = default;
  explicit NBlock(StatementList statements)
      : statements(std::move(statements)) {}
  void accept(Visitor &visitor) const override;
};

// Constant of any type; the value is kept as its source spelling
class NLiteral : public NExpression {
public:
  std::string value;
  std::string type;
  NLiteral(std::string value, std::string type)
      : value(std::move(value)), type(std::move(type)) {}
  void accept(Visitor &visitor) const override;
};

class NVariableRef : public NExpression {
public:
  const VariableSymbol *symbol;
  explicit NVariableRef(const VariableSymbol *symbol) : symbol(symbol) {}
  void accept(Visitor &visitor) const override;
};

// Receiver of the method the node belongs to. Before closure conversion this
// is always the enclosing receiver; afterwards it is the receiver of the
// (possibly synthesized) method that contains the node.
class NThisRef : public NExpression {
public:
  std::string type;
  explicit NThisRef(std::string type) : type(std::move(type)) {}
  void accept(Visitor &visitor) const override;
};

// Target is an NVariableRef or an NFieldAccess
class NAssignment : public NExpression {
public:
  std::unique_ptr<NExpression> target;
  std::unique_ptr<NExpression> value;
  NAssignment(std::unique_ptr<NExpression> target,
              std::unique_ptr<NExpression> value)
      : target(std::move(target)), value(std::move(value)) {}
  void accept(Visitor &visitor) const override;
};

class NBinaryOperator : public NExpression {
public:
  std::string op;
  std::unique_ptr<NExpression> lhs;
  std::unique_ptr<NExpression> rhs;
  NBinaryOperator(std::unique_ptr<NExpression> lhs, std::string op,
                  std::unique_ptr<NExpression> rhs)
      : op(std::move(op)), lhs(std::move(lhs)), rhs(std::move(rhs)) {}
  void accept(Visitor &visitor) const override;
};

// Anonymous function; evaluates to a callable value
class NLambda : public NExpression {
public:
  const FunctionSymbol *function;
  std::unique_ptr<NBlock> body;
  NLambda(const FunctionSymbol *function, std::unique_ptr<NBlock> body)
      : function(function), body(std::move(body)) {}
  void accept(Visitor &visitor) const override;
};

// A local function used as a value (method group conversion)
class NFunctionRef : public NExpression {
public:
  const FunctionSymbol *function;
  explicit NFunctionRef(const FunctionSymbol *function) : function(function) {}
  void accept(Visitor &visitor) const override;
};

// Direct call. Exactly one of `function` (a local function, before closure
// conversion) and `method` is set. `receiver` is null for static calls and
// for local function calls.
class NCall : public NExpression {
public:
  const FunctionSymbol *function = nullptr;
  const MethodSymbol *method = nullptr;
  std::unique_ptr<NExpression> receiver;
  ExpressionList arguments;
  NCall(const FunctionSymbol *function, ExpressionList arguments)
      : function(function), arguments(std::move(arguments)) {}
  NCall(const MethodSymbol *method, std::unique_ptr<NExpression> receiver,
        ExpressionList arguments)
      : method(method), receiver(std::move(receiver)),
        arguments(std::move(arguments)) {}
  [[nodiscard]] bool isLocalFunctionCall() const { return function != nullptr; }
  void accept(Visitor &visitor) const override;
};

// Call through a callable value
class NInvoke : public NExpression {
public:
  std::unique_ptr<NExpression> callee;
  ExpressionList arguments;
  NInvoke(std::unique_ptr<NExpression> callee, ExpressionList arguments)
      : callee(std::move(callee)), arguments(std::move(arguments)) {}
  void accept(Visitor &visitor) const override;
};

class NFieldAccess : public NExpression {
public:
  std::unique_ptr<NExpression> receiver;
  const FieldSymbol *field;
  NFieldAccess(std::unique_ptr<NExpression> receiver, const FieldSymbol *field)
      : receiver(std::move(receiver)), field(field) {}
  void accept(Visitor &visitor) const override;
};

// Heap allocation of a reference-typed environment
class NNewEnvironment : public NExpression {
public:
  std::string type;
  explicit NNewEnvironment(std::string type) : type(std::move(type)) {}
  void accept(Visitor &visitor) const override;
};

// Zero-initialized value of the given type
class NDefaultValue : public NExpression {
public:
  std::string type;
  explicit NDefaultValue(std::string type) : type(std::move(type)) {}
  void accept(Visitor &visitor) const override;
};

// Callable value bound to a method; receiver is null for static methods
class NDelegateCreation : public NExpression {
public:
  std::unique_ptr<NExpression> receiver;
  const MethodSymbol *method;
  NDelegateCreation(std::unique_ptr<NExpression> receiver,
                    const MethodSymbol *method)
      : receiver(std::move(receiver)), method(method) {}
  void accept(Visitor &visitor) const override;
};

class NVariableDeclaration : public NStatement {
public:
  const VariableSymbol *symbol;
  std::unique_ptr<NExpression> initializer;  // nullptr when uninitialized
  NVariableDeclaration(const VariableSymbol *symbol,
                       std::unique_ptr<NExpression> initializer)
      : symbol(symbol), initializer(std::move(initializer)) {}
  void accept(Visitor &visitor) const override;
};

class NExpressionStatement : public NStatement {
public:
  std::unique_ptr<NExpression> expression;
  explicit NExpressionStatement(std::unique_ptr<NExpression> expression)
      : expression(std::move(expression)) {}
  void accept(Visitor &visitor) const override;
};

class NReturnStatement : public NStatement {
public:
  std::unique_ptr<NExpression> value;  // nullptr for a bare return
  explicit NReturnStatement(std::unique_ptr<NExpression> value)
      : value(std::move(value)) {}
  void accept(Visitor &visitor) const override;
};

class NIfStatement : public NStatement {
public:
  std::unique_ptr<NExpression> condition;
  std::unique_ptr<NBlock> thenBlock;
  std::unique_ptr<NBlock> elseBlock;  // nullptr when absent
  NIfStatement(std::unique_ptr<NExpression> condition,
               std::unique_ptr<NBlock> thenBlock,
               std::unique_ptr<NBlock> elseBlock)
      : condition(std::move(condition)), thenBlock(std::move(thenBlock)),
        elseBlock(std::move(elseBlock)) {}
  void accept(Visitor &visitor) const override;
};

// The body block is a fresh scope on every iteration
class NWhileStatement : public NStatement {
public:
  std::unique_ptr<NExpression> condition;
  std::unique_ptr<NBlock> body;
  NWhileStatement(std::unique_ptr<NExpression> condition,
                  std::unique_ptr<NBlock> body)
      : condition(std::move(condition)), body(std::move(body)) {}
  void accept(Visitor &visitor) const override;
};

class NLocalFunctionStatement : public NStatement {
public:
  const FunctionSymbol *function;
  std::unique_ptr<NBlock> body;
  NLocalFunctionStatement(const FunctionSymbol *function,
                          std::unique_ptr<NBlock> body)
      : function(function), body(std::move(body)) {}
  void accept(Visitor &visitor) const override;
};
// clang-format on

// One top-level method body as produced by the binder. `receiver` is null
// for static methods.
struct NMethodBody {
  const MethodSymbol* method;
  const VariableSymbol* receiver;
  std::unique_ptr<NBlock> body;
  NMethodBody(const MethodSymbol* method, const VariableSymbol* receiver,
              std::unique_ptr<NBlock> body)
      : method(method), receiver(receiver), body(std::move(body)) {}
};

#endif // CCONV_NODE_HPP
