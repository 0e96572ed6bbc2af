#ifndef CCONV_VISITOR_HPP
#define CCONV_VISITOR_HPP

// Forward declarations of all node types
class NLiteral;
class NVariableRef;
class NThisRef;
class NAssignment;
class NBinaryOperator;
class NLambda;
class NFunctionRef;
class NCall;
class NInvoke;
class NFieldAccess;
class NNewEnvironment;
class NDefaultValue;
class NDelegateCreation;
class NBlock;
class NVariableDeclaration;
class NExpressionStatement;
class NReturnStatement;
class NIfStatement;
class NWhileStatement;
class NLocalFunctionStatement;

/// Base class for implementing the Visitor design pattern on the typed tree.
///
/// The Visitor pattern allows operations to be defined on tree nodes without
/// modifying the node classes themselves. This is used for:
/// - **Scope tree construction** (ScopeTreeBuilder): mirrors lexical nesting
/// - **Capture analysis** (CaptureCollector): records captured variables
/// - **Tree rewriting** (NodeRewriter): produces the closure-free tree
/// - **Printing** (TreePrinter): produces a text outline of a tree
///
/// This base class does not traverse child nodes; each implementation calls
/// accept() on the children it cares about. Use RecursiveVisitor to get a
/// full traversal and override only the nodes of interest.
class Visitor {
public:
  virtual ~Visitor() noexcept = default;

  /// @name Expression Visitors
  /// @{
  virtual void visit(const NLiteral& node) = 0;
  virtual void visit(const NVariableRef& node) = 0;
  virtual void visit(const NThisRef& node) = 0;
  virtual void visit(const NAssignment& node) = 0;
  virtual void visit(const NBinaryOperator& node) = 0;
  virtual void visit(const NLambda& node) = 0;
  virtual void visit(const NFunctionRef& node) = 0;
  virtual void visit(const NCall& node) = 0;
  virtual void visit(const NInvoke& node) = 0;
  virtual void visit(const NFieldAccess& node) = 0;
  virtual void visit(const NNewEnvironment& node) = 0;
  virtual void visit(const NDefaultValue& node) = 0;
  virtual void visit(const NDelegateCreation& node) = 0;
  /// @}

  /// @name Statement Visitors
  /// @{
  virtual void visit(const NBlock& node) = 0;
  virtual void visit(const NVariableDeclaration& node) = 0;
  virtual void visit(const NExpressionStatement& node) = 0;
  virtual void visit(const NReturnStatement& node) = 0;
  virtual void visit(const NIfStatement& node) = 0;
  virtual void visit(const NWhileStatement& node) = 0;
  virtual void visit(const NLocalFunctionStatement& node) = 0;
  /// @}
};

/// Visitor that walks every child in source order. Subclasses override the
/// nodes they need and call the base implementation to keep descending.
class RecursiveVisitor : public Visitor {
public:
  void visit(const NLiteral& node) override;
  void visit(const NVariableRef& node) override;
  void visit(const NThisRef& node) override;
  void visit(const NAssignment& node) override;
  void visit(const NBinaryOperator& node) override;
  void visit(const NLambda& node) override;
  void visit(const NFunctionRef& node) override;
  void visit(const NCall& node) override;
  void visit(const NInvoke& node) override;
  void visit(const NFieldAccess& node) override;
  void visit(const NNewEnvironment& node) override;
  void visit(const NDefaultValue& node) override;
  void visit(const NDelegateCreation& node) override;
  void visit(const NBlock& node) override;
  void visit(const NVariableDeclaration& node) override;
  void visit(const NExpressionStatement& node) override;
  void visit(const NReturnStatement& node) override;
  void visit(const NIfStatement& node) override;
  void visit(const NWhileStatement& node) override;
  void visit(const NLocalFunctionStatement& node) override;
};

#endif // CCONV_VISITOR_HPP
