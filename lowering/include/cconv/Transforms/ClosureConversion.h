//===- ClosureConversion.h - Closure conversion entry points ----*- C++ -*-===//
//
// This file declares the library interface of closure conversion: lowering
// one method body, or a batch of them with cooperative cancellation.
//
//===----------------------------------------------------------------------===//

#ifndef CCONV_TRANSFORMS_CLOSURECONVERSION_H
#define CCONV_TRANSFORMS_CLOSURECONVERSION_H

#include "cconv/Analysis/ScopeTree.h"
#include "cconv/Transforms/Synthesis.h"

#include "tree/node.hpp"
#include "tree/symbols.hpp"

#include "llvm/ADT/ArrayRef.h"

#include <atomic>
#include <memory>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace cconv {

struct ConversionOptions {
  /// Run the environment optimizer.
  bool optimizeEnvironments = true;
  /// Check the synthesized declarations before rewriting.
  bool verifyInvariants = true;
  /// When set, the analysis graph is printed after every micropass.
  llvm::raw_ostream* traceStream = nullptr;
};

/// Output of one successful run. The rewritten body still refers to the
/// caller's symbols; everything synthesized is owned by `symbols`.
struct LoweringResult {
  SymbolTable symbols;
  std::unique_ptr<NMethodBody> body;
  SynthesizedDeclarations declarations;
};

/// Lowers the nested functions of one method body. An instance may be reused;
/// every run() starts from a fresh analysis graph.
class ClosureConverter {
public:
  explicit ClosureConverter(ConversionOptions options = ConversionOptions());
  ~ClosureConverter() noexcept;

  /// Returns nullptr on failure. The failure is described by getError() and
  /// reported as fatal through ErrorReporter::current(), if one is set.
  std::unique_ptr<LoweringResult> run(const NMethodBody& method);

  [[nodiscard]] const LoweringError& getError() const { return error; }

  /// The analysis graph of the last run, for inspection; nullptr before the
  /// first run.
  [[nodiscard]] const ScopeTree* getScopeTree() const { return tree.get(); }

private:
  ConversionOptions options;
  LoweringError error;
  std::unique_ptr<ScopeTree> tree;

  bool runAnalysis(const NMethodBody& method, const char*& stage);
  void trace(const char* stage) const;
  void report(const NMethodBody& method, const char* stage) const;
};

/// True if the body contains a lambda or a local function.
[[nodiscard]] bool containsNestedFunctions(const NMethodBody& method);

/// Cancellation signal owned by the surrounding compiler.
class CancellationFlag {
public:
  void cancel() { cancelled.store(true, std::memory_order_relaxed); }
  [[nodiscard]] bool isCancelled() const {
    return cancelled.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled{false};
};

enum class LoweringStatus { Lowered, Bypassed, Failed, Cancelled };

struct MethodLowering {
  const NMethodBody* method = nullptr;
  LoweringStatus status = LoweringStatus::Cancelled;
  /// Set only for Lowered methods.
  std::unique_ptr<LoweringResult> result;
  LoweringError error;
};

/// Lower every method in order. Methods without nested functions are
/// Bypassed. The flag is polled between methods only; once it is set, the
/// remaining methods are Cancelled. A failure does not stop the batch.
std::vector<MethodLowering>
lowerMethods(llvm::ArrayRef<const NMethodBody*> methods,
             const ConversionOptions& options = ConversionOptions(),
             const CancellationFlag* cancellation = nullptr);

} // namespace cconv

#endif // CCONV_TRANSFORMS_CLOSURECONVERSION_H
