#include <tree/node.hpp>
#include <tree/visitor.hpp>

void NBlock::accept(Visitor& visitor) const { visitor.visit(*this); }

void NLiteral::accept(Visitor& visitor) const { visitor.visit(*this); }

void NVariableRef::accept(Visitor& visitor) const { visitor.visit(*this); }

void NThisRef::accept(Visitor& visitor) const { visitor.visit(*this); }

void NAssignment::accept(Visitor& visitor) const { visitor.visit(*this); }

void NBinaryOperator::accept(Visitor& visitor) const { visitor.visit(*this); }

void NLambda::accept(Visitor& visitor) const { visitor.visit(*this); }

void NFunctionRef::accept(Visitor& visitor) const { visitor.visit(*this); }

void NCall::accept(Visitor& visitor) const { visitor.visit(*this); }

void NInvoke::accept(Visitor& visitor) const { visitor.visit(*this); }

void NFieldAccess::accept(Visitor& visitor) const { visitor.visit(*this); }

void NNewEnvironment::accept(Visitor& visitor) const { visitor.visit(*this); }

void NDefaultValue::accept(Visitor& visitor) const { visitor.visit(*this); }

void NDelegateCreation::accept(Visitor& visitor) const {
  visitor.visit(*this);
}

void NVariableDeclaration::accept(Visitor& visitor) const {
  visitor.visit(*this);
}

void NExpressionStatement::accept(Visitor& visitor) const {
  visitor.visit(*this);
}

void NReturnStatement::accept(Visitor& visitor) const { visitor.visit(*this); }

void NIfStatement::accept(Visitor& visitor) const { visitor.visit(*this); }

void NWhileStatement::accept(Visitor& visitor) const { visitor.visit(*this); }

void NLocalFunctionStatement::accept(Visitor& visitor) const {
  visitor.visit(*this);
}

// ============== RecursiveVisitor ==============

void RecursiveVisitor::visit(const NLiteral& /*node*/) {}

void RecursiveVisitor::visit(const NVariableRef& /*node*/) {}

void RecursiveVisitor::visit(const NThisRef& /*node*/) {}

void RecursiveVisitor::visit(const NAssignment& node) {
  node.target->accept(*this);
  node.value->accept(*this);
}

void RecursiveVisitor::visit(const NBinaryOperator& node) {
  node.lhs->accept(*this);
  node.rhs->accept(*this);
}

void RecursiveVisitor::visit(const NLambda& node) { node.body->accept(*this); }

void RecursiveVisitor::visit(const NFunctionRef& /*node*/) {}

void RecursiveVisitor::visit(const NCall& node) {
  if (node.receiver != nullptr) {
    node.receiver->accept(*this);
  }
  for (const auto& arg : node.arguments) {
    arg->accept(*this);
  }
}

void RecursiveVisitor::visit(const NInvoke& node) {
  node.callee->accept(*this);
  for (const auto& arg : node.arguments) {
    arg->accept(*this);
  }
}

void RecursiveVisitor::visit(const NFieldAccess& node) {
  node.receiver->accept(*this);
}

void RecursiveVisitor::visit(const NNewEnvironment& /*node*/) {}

void RecursiveVisitor::visit(const NDefaultValue& /*node*/) {}

void RecursiveVisitor::visit(const NDelegateCreation& node) {
  if (node.receiver != nullptr) {
    node.receiver->accept(*this);
  }
}

void RecursiveVisitor::visit(const NBlock& node) {
  for (const auto& stmt : node.statements) {
    stmt->accept(*this);
  }
}

void RecursiveVisitor::visit(const NVariableDeclaration& node) {
  if (node.initializer != nullptr) {
    node.initializer->accept(*this);
  }
}

void RecursiveVisitor::visit(const NExpressionStatement& node) {
  node.expression->accept(*this);
}

void RecursiveVisitor::visit(const NReturnStatement& node) {
  if (node.value != nullptr) {
    node.value->accept(*this);
  }
}

void RecursiveVisitor::visit(const NIfStatement& node) {
  node.condition->accept(*this);
  node.thenBlock->accept(*this);
  if (node.elseBlock != nullptr) {
    node.elseBlock->accept(*this);
  }
}

void RecursiveVisitor::visit(const NWhileStatement& node) {
  node.condition->accept(*this);
  node.body->accept(*this);
}

void RecursiveVisitor::visit(const NLocalFunctionStatement& node) {
  node.body->accept(*this);
}
