#ifndef CCONV_TREE_PRINTER_HPP
#define CCONV_TREE_PRINTER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "tree/visitor.hpp"

struct NMethodBody;

/// Prints a typed tree as an indented outline, one node per line.
class TreePrinter : public Visitor {
public:
  explicit TreePrinter(std::ostream& out) noexcept;

  void print(const NBlock& root);
  void print(const NMethodBody& method);

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

private:
  std::ostream& out;
  std::vector<bool> depthHasMore;

  void printPrefix() const;

  class DepthScope {
  public:
    DepthScope(TreePrinter& printer, bool hasMore) noexcept;
    ~DepthScope() noexcept;

  private:
    TreePrinter& printer;
  };
};

#endif // CCONV_TREE_PRINTER_HPP
