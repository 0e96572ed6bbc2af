//===- ClosureConversion.cpp - Closure conversion pipeline ------*- C++ -*-===//
//
// This file runs the closure conversion steps in order over one method body
// and reports failures through the error reporter.
//
//===----------------------------------------------------------------------===//

#include "cconv/Transforms/ClosureConversion.h"

#include "cconv/Analysis/Passes.h"

#include "tree/error_reporter.hpp"
#include "tree/visitor.hpp"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace cconv {

namespace {

class NestedFunctionFinder : public RecursiveVisitor {
public:
  bool found = false;

  void visit(const NLambda& /*node*/) override { found = true; }
  void visit(const NLocalFunctionStatement& /*node*/) override {
    found = true;
  }
};

} // namespace

bool containsNestedFunctions(const NMethodBody& method) {
  if (method.body == nullptr) {
    return false;
  }
  NestedFunctionFinder finder;
  method.body->accept(finder);
  return finder.found;
}

//===----------------------------------------------------------------------===//
// ClosureConverter
//===----------------------------------------------------------------------===//

ClosureConverter::ClosureConverter(ConversionOptions options)
    : options(options) {}

ClosureConverter::~ClosureConverter() noexcept = default;

void ClosureConverter::trace(const char* stage) const {
  if (options.traceStream == nullptr) {
    return;
  }
  llvm::raw_ostream& os = *options.traceStream;
  os << "// -----// After " << stage << " //----- //\n";
  tree->print(os);
}

bool ClosureConverter::runAnalysis(const NMethodBody& method,
                                   const char*& stage) {
  tree = std::make_unique<ScopeTree>(method);

  stage = "scope tree construction";
  if (!buildScopeTree(*tree, error)) {
    return false;
  }
  trace(stage);

  stage = "capture analysis";
  if (!analyzeCaptures(*tree, error)) {
    return false;
  }
  trace(stage);

  stage = "environment allocation";
  if (!allocateEnvironments(*tree, error)) {
    return false;
  }
  trace(stage);

  stage = "environment linearization";
  if (!linearizeEnvironments(*tree, error)) {
    return false;
  }
  trace(stage);

  if (options.optimizeEnvironments) {
    stage = "environment optimization";
    optimizeEnvironments(*tree);
    trace(stage);
  }
  return true;
}

std::unique_ptr<LoweringResult> ClosureConverter::run(const NMethodBody& method) {
  error = LoweringError();
  const char* stage = "closure conversion";

  if (!runAnalysis(method, stage)) {
    report(method, stage);
    return nullptr;
  }

  auto result = std::make_unique<LoweringResult>();
  stage = "code synthesis";
  if (!synthesizeDeclarations(*tree, result->symbols, result->declarations,
                              error)) {
    report(method, stage);
    return nullptr;
  }

  if (options.verifyInvariants) {
    stage = "environment verification";
    if (!verifyEnvironmentGraph(*tree, result->declarations, error)) {
      report(method, stage);
      return nullptr;
    }
  }

  stage = "tree rewriting";
  result->body =
      rewriteMethodBody(*tree, result->symbols, result->declarations, error);
  if (result->body == nullptr) {
    report(method, stage);
    return nullptr;
  }
  return result;
}

void ClosureConverter::report(const NMethodBody& method,
                              const char* stage) const {
  ErrorReporter* reporter = ErrorReporter::current();
  if (reporter == nullptr) {
    return;
  }
  CompilerError failure;
  if (error.kind == LoweringErrorKind::MalformedInput) {
    failure.kind = FailureKind::MalformedInput;
  } else {
    failure.kind = FailureKind::InternalError;
    failure.stage = stage;
  }
  failure.message = error.message;
  if (method.method != nullptr) {
    failure.method = method.method->qualifiedName();
  }
  failure.loc = error.loc;
  reporter->fatal(std::move(failure));
}

//===----------------------------------------------------------------------===//
// Batch lowering
//===----------------------------------------------------------------------===//

std::vector<MethodLowering>
lowerMethods(llvm::ArrayRef<const NMethodBody*> methods,
             const ConversionOptions& options,
             const CancellationFlag* cancellation) {
  std::vector<MethodLowering> results;
  results.reserve(methods.size());

  ClosureConverter converter(options);
  for (const NMethodBody* method : methods) {
    MethodLowering lowering;
    lowering.method = method;
    if (cancellation != nullptr && cancellation->isCancelled()) {
      lowering.status = LoweringStatus::Cancelled;
    } else if (!containsNestedFunctions(*method)) {
      lowering.status = LoweringStatus::Bypassed;
    } else {
      lowering.result = converter.run(*method);
      if (lowering.result != nullptr) {
        lowering.status = LoweringStatus::Lowered;
      } else {
        lowering.status = LoweringStatus::Failed;
        lowering.error = converter.getError();
      }
    }
    results.push_back(std::move(lowering));
  }
  return results;
}

} // namespace cconv
