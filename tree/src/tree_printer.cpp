#include "tree/tree_printer.hpp"

#include "tree/node.hpp"

TreePrinter::TreePrinter(std::ostream& out) noexcept : out(out) {}

void TreePrinter::print(const NBlock& root) {
  depthHasMore.clear();
  root.accept(*this);
}

void TreePrinter::print(const NMethodBody& method) {
  depthHasMore.clear();
  out << "NMethodBody '" << method.method->qualifiedName() << "'"
      << (method.method->isStatic ? " static" : "") << "\n";
  DepthScope scope(*this, false);
  method.body->accept(*this);
}

void TreePrinter::printPrefix() const {
  for (size_t i = 0; i + 1 < depthHasMore.size(); ++i) {
    out << (depthHasMore[i] ? "| " : "  ");
  }
  if (!depthHasMore.empty()) {
    out << (depthHasMore.back() ? "|-" : "`-");
  }
}

TreePrinter::DepthScope::DepthScope(TreePrinter& printer, bool hasMore) noexcept
    : printer(printer) {
  printer.depthHasMore.push_back(hasMore);
}

TreePrinter::DepthScope::~DepthScope() noexcept {
  printer.depthHasMore.pop_back();
}

void TreePrinter::visit(const NLiteral& node) {
  printPrefix();
  out << "NLiteral " << node.value << " : " << node.type << "\n";
}

void TreePrinter::visit(const NVariableRef& node) {
  printPrefix();
  out << "NVariableRef '" << node.symbol->name << "'"
      << (node.symbol->isByRef ? " ref" : "") << "\n";
}

void TreePrinter::visit(const NThisRef& node) {
  printPrefix();
  out << "NThisRef : " << node.type << "\n";
}

void TreePrinter::visit(const NAssignment& node) {
  printPrefix();
  out << "NAssignment\n";

  {
    DepthScope scope(*this, true);
    node.target->accept(*this);
  }
  {
    DepthScope scope(*this, false);
    node.value->accept(*this);
  }
}

void TreePrinter::visit(const NBinaryOperator& node) {
  printPrefix();
  out << "NBinaryOperator '" << node.op << "'\n";

  {
    DepthScope scope(*this, true);
    node.lhs->accept(*this);
  }
  {
    DepthScope scope(*this, false);
    node.rhs->accept(*this);
  }
}

void TreePrinter::visit(const NLambda& node) {
  printPrefix();
  out << "NLambda '" << node.function->name << "'\n";

  DepthScope scope(*this, false);
  node.body->accept(*this);
}

void TreePrinter::visit(const NFunctionRef& node) {
  printPrefix();
  out << "NFunctionRef '" << node.function->name << "'\n";
}

void TreePrinter::visit(const NCall& node) {
  printPrefix();
  if (node.isLocalFunctionCall()) {
    out << "NCall local '" << node.function->name << "'\n";
  } else {
    out << "NCall '" << node.method->qualifiedName() << "'"
        << (node.method->isStatic ? " static" : "") << "\n";
  }

  const auto& args = node.arguments;
  if (node.receiver != nullptr) {
    DepthScope scope(*this, !args.empty());
    printPrefix();
    out << "receiver:\n";
    DepthScope inner(*this, false);
    node.receiver->accept(*this);
  }
  for (size_t i = 0; i < args.size(); ++i) {
    const bool isLast = (i == args.size() - 1);
    DepthScope scope(*this, !isLast);
    args[i]->accept(*this);
  }
}

void TreePrinter::visit(const NInvoke& node) {
  printPrefix();
  out << "NInvoke\n";

  const auto& args = node.arguments;
  {
    DepthScope scope(*this, !args.empty());
    node.callee->accept(*this);
  }
  for (size_t i = 0; i < args.size(); ++i) {
    const bool isLast = (i == args.size() - 1);
    DepthScope scope(*this, !isLast);
    args[i]->accept(*this);
  }
}

void TreePrinter::visit(const NFieldAccess& node) {
  printPrefix();
  out << "NFieldAccess '" << node.field->containingType << "."
      << node.field->name << "'\n";

  DepthScope scope(*this, false);
  node.receiver->accept(*this);
}

void TreePrinter::visit(const NNewEnvironment& node) {
  printPrefix();
  out << "NNewEnvironment " << node.type << "\n";
}

void TreePrinter::visit(const NDefaultValue& node) {
  printPrefix();
  out << "NDefaultValue " << node.type << "\n";
}

void TreePrinter::visit(const NDelegateCreation& node) {
  printPrefix();
  out << "NDelegateCreation '" << node.method->qualifiedName() << "'"
      << (node.method->isStatic ? " static" : "") << "\n";

  if (node.receiver != nullptr) {
    DepthScope scope(*this, false);
    node.receiver->accept(*this);
  }
}

void TreePrinter::visit(const NBlock& node) {
  printPrefix();
  out << "NBlock\n";

  const auto& stmts = node.statements;
  for (size_t i = 0; i < stmts.size(); ++i) {
    const bool isLast = (i == stmts.size() - 1);
    DepthScope scope(*this, !isLast);
    stmts[i]->accept(*this);
  }
}

void TreePrinter::visit(const NVariableDeclaration& node) {
  printPrefix();
  out << "NVariableDeclaration '" << node.symbol->name << "' : "
      << node.symbol->type << "\n";

  if (node.initializer != nullptr) {
    DepthScope scope(*this, false);
    node.initializer->accept(*this);
  }
}

void TreePrinter::visit(const NExpressionStatement& node) {
  printPrefix();
  out << "NExpressionStatement\n";

  DepthScope scope(*this, false);
  node.expression->accept(*this);
}

void TreePrinter::visit(const NReturnStatement& node) {
  printPrefix();
  out << "NReturnStatement\n";

  if (node.value != nullptr) {
    DepthScope scope(*this, false);
    node.value->accept(*this);
  }
}

void TreePrinter::visit(const NIfStatement& node) {
  printPrefix();
  out << "NIfStatement\n";

  const bool hasElse = node.elseBlock != nullptr;
  {
    DepthScope scope(*this, true);
    printPrefix();
    out << "condition:\n";
    {
      DepthScope inner(*this, false);
      node.condition->accept(*this);
    }
  }
  {
    DepthScope scope(*this, hasElse);
    printPrefix();
    out << "then:\n";
    {
      DepthScope inner(*this, false);
      node.thenBlock->accept(*this);
    }
  }
  if (hasElse) {
    DepthScope scope(*this, false);
    printPrefix();
    out << "else:\n";
    {
      DepthScope inner(*this, false);
      node.elseBlock->accept(*this);
    }
  }
}

void TreePrinter::visit(const NWhileStatement& node) {
  printPrefix();
  out << "NWhileStatement\n";

  {
    DepthScope scope(*this, true);
    node.condition->accept(*this);
  }
  {
    DepthScope scope(*this, false);
    node.body->accept(*this);
  }
}

void TreePrinter::visit(const NLocalFunctionStatement& node) {
  printPrefix();
  out << "NLocalFunctionStatement '" << node.function->name << "'\n";

  DepthScope scope(*this, false);
  node.body->accept(*this);
}
