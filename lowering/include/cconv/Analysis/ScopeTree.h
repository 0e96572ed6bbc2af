//===- ScopeTree.h - Scope, closure and environment graph -------*- C++ -*-===//
//
// This file declares the analysis graph shared by the closure conversion
// micropasses. The graph mirrors the lexical nesting of one method body and
// is addressed by integer ids; parent links are plain ids, so the arena owns
// every node and no node owns another.
//
//===----------------------------------------------------------------------===//

#ifndef CCONV_ANALYSIS_SCOPETREE_H
#define CCONV_ANALYSIS_SCOPETREE_H

#include "tree/node.hpp"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SetVector.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace cconv {

using ScopeId = uint32_t;
using ClosureId = uint32_t;
using EnvironmentId = uint32_t;

enum class ScopeKind { MethodBody, Block, LambdaBody, LocalFunctionBody };

/// Value-typed environments live in the frame that creates them and reach
/// callees by reference; reference-typed environments are heap allocated.
enum class EnvironmentKind { Struct, Class };

llvm::StringRef stringifyScopeKind(ScopeKind kind);
llvm::StringRef stringifyEnvironmentKind(EnvironmentKind kind);

/// Failure categories of the pass. None of them is a user diagnostic.
enum class LoweringErrorKind {
  None,
  NonConvergentCaptures,
  InvalidEnvironmentGraph,
  MalformedInput,
};

struct LoweringError {
  LoweringErrorKind kind = LoweringErrorKind::None;
  std::string message;
  /// Node the failure was detected at; invalid when no node is involved.
  SourceLocation loc;

  [[nodiscard]] bool isSet() const { return kind != LoweringErrorKind::None; }

  /// Record a failure and return false so passes can `return fail(...)`.
  bool fail(LoweringErrorKind k, std::string msg,
            SourceLocation at = SourceLocation()) {
    kind = k;
    message = std::move(msg);
    loc = at;
    return false;
  }
};

struct Scope {
  ScopeKind kind;
  std::optional<ScopeId> parent;
  llvm::SmallVector<ScopeId, 4> children;
  llvm::SetVector<const VariableSymbol*> declaredVariables;
  /// Nested functions declared directly in this scope.
  llvm::SmallVector<ClosureId, 2> closures;
  /// Set for LambdaBody and LocalFunctionBody scopes.
  std::optional<ClosureId> ownerClosure;
  std::optional<EnvironmentId> environment;
  const NBlock* block = nullptr;
  unsigned depth = 0;
};

struct Closure {
  const FunctionSymbol* function = nullptr;
  ScopeId definingScope = 0;
  ScopeId bodyScope = 0;

  /// Captures recorded from references written inside this closure's own
  /// body (not inside nested closures).
  llvm::SetVector<const VariableSymbol*> directCaptures;
  /// Transitively closed capture set.
  llvm::SetVector<const VariableSymbol*> capturedVariables;
  /// Closures this one depends on: called or converted closures, and
  /// closures nested directly inside its body.
  llvm::SetVector<ClosureId> dependencies;

  bool isConvertedToDelegate = false;
  bool capturesThis = false;

  llvm::SetVector<EnvironmentId> capturedEnvironments;
  std::optional<EnvironmentId> containingEnvironment;

  /// Finalized by the code synthesizer.
  const MethodSymbol* loweredMethod = nullptr;
  llvm::SmallVector<EnvironmentId, 2> structParameters;

  [[nodiscard]] bool isLambda() const;

  /// True if captured state may be passed to this closure by reference:
  /// it is a local function that is never turned into a callable value and
  /// is not rewritten for asynchronous or iterator execution.
  [[nodiscard]] bool canTakeRefParameters() const;
};

struct Environment {
  ScopeId scope = 0;
  EnvironmentKind kind = EnvironmentKind::Struct;
  /// Hoisted variables, in declaration order. May contain the receiver.
  llvm::SetVector<const VariableSymbol*> variables;
  bool capturesParent = false;
  /// Set by the environment optimizer. A removed environment keeps its id but
  /// is detached from its scope and from every closure.
  bool removed = false;
  /// Closures lowered onto this environment, in closure order.
  llvm::SmallVector<ClosureId, 2> closures;

  [[nodiscard]] bool isStruct() const {
    return kind == EnvironmentKind::Struct;
  }
  [[nodiscard]] bool holdsOnlyReceiver() const;
};

/// Arena holding every scope, closure and environment of one method.
class ScopeTree {
public:
  explicit ScopeTree(const NMethodBody& method);

  ScopeTree(const ScopeTree&) = delete;
  ScopeTree& operator=(const ScopeTree&) = delete;

  [[nodiscard]] const NMethodBody& getMethod() const { return method; }
  /// The receiver symbol, or nullptr for static methods.
  [[nodiscard]] const VariableSymbol* getReceiver() const;

  /// @name Construction (used by the scope tree builder)
  /// @{
  ScopeId addScope(ScopeKind kind, std::optional<ScopeId> parent,
                   const NBlock* block);
  ClosureId addClosure(const FunctionSymbol* function, ScopeId definingScope);
  EnvironmentId addEnvironment(ScopeId scope, EnvironmentKind kind);
  /// Returns false if the variable was already declared somewhere.
  bool declareVariable(ScopeId scope, const VariableSymbol* variable);
  /// @}

  [[nodiscard]] ScopeId getRoot() const { return 0; }
  [[nodiscard]] size_t numScopes() const { return scopes.size(); }
  [[nodiscard]] size_t numClosures() const { return closures.size(); }
  [[nodiscard]] size_t numEnvironments() const { return environments.size(); }

  Scope& getScope(ScopeId id) { return scopes[id]; }
  const Scope& getScope(ScopeId id) const { return scopes[id]; }
  Closure& getClosure(ClosureId id) { return closures[id]; }
  const Closure& getClosure(ClosureId id) const { return closures[id]; }
  Environment& getEnvironment(EnvironmentId id) { return environments[id]; }
  const Environment& getEnvironment(EnvironmentId id) const {
    return environments[id];
  }

  [[nodiscard]] std::optional<ScopeId>
  lookupDeclaringScope(const VariableSymbol* variable) const;
  [[nodiscard]] std::optional<ClosureId>
  lookupClosure(const FunctionSymbol* function) const;
  [[nodiscard]] std::optional<ScopeId> lookupScope(const NBlock* block) const;

  /// True if `ancestor` is `scope` or one of its ancestors.
  [[nodiscard]] bool isAncestorOrSelf(ScopeId ancestor, ScopeId scope) const;

  /// True if `variable` is declared inside the body of `closure` (including
  /// its parameters and nested scopes).
  [[nodiscard]] bool isDeclaredInside(const VariableSymbol* variable,
                                      ClosureId closure) const;

  /// The closure whose body contains `scope`, or nullopt for scopes that
  /// belong to the top-level method.
  [[nodiscard]] std::optional<ClosureId> getFunctionFrame(ScopeId scope) const;

  /// The environment a reference-typed environment's parent field points to
  /// at run time: the innermost live Class environment of an enclosing scope
  /// in the same function frame, else the frame's own receiver (the
  /// containing environment of the frame's closure). nullopt means the
  /// enclosing receiver.
  [[nodiscard]] std::optional<EnvironmentId>
  getRuntimeParent(EnvironmentId env) const;

  /// The live environment holding the receiver, if any.
  [[nodiscard]] std::optional<EnvironmentId> getReceiverEnvironment() const;

  /// The live environment hoisting `variable`, if any.
  [[nodiscard]] std::optional<EnvironmentId>
  lookupEnvironment(const VariableSymbol* variable) const;

  /// Scope ids in pre-order (parents before children).
  [[nodiscard]] std::vector<ScopeId> getScopesInPreorder() const;

  /// Print the graph for tracing and debugging.
  void print(llvm::raw_ostream& os) const;

private:
  const NMethodBody& method;
  std::vector<Scope> scopes;
  std::vector<Closure> closures;
  std::vector<Environment> environments;
  llvm::DenseMap<const VariableSymbol*, ScopeId> declaringScopes;
  llvm::DenseMap<const FunctionSymbol*, ClosureId> closureOf;
  llvm::DenseMap<const NBlock*, ScopeId> scopeOf;
};

} // namespace cconv

#endif // CCONV_ANALYSIS_SCOPETREE_H
