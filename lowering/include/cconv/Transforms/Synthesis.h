//===- Synthesis.h - Synthesized environment types and methods --*- C++ -*-===//
//
// This file declares the declarations closure conversion hands to code
// emission: one type per live environment and one method per nested
// function, plus the steps that create, check and fill them in.
//
//===----------------------------------------------------------------------===//

#ifndef CCONV_TRANSFORMS_SYNTHESIS_H
#define CCONV_TRANSFORMS_SYNTHESIS_H

#include "cconv/Analysis/ScopeTree.h"

#include "tree/node.hpp"
#include "tree/symbols.hpp"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cconv {

struct SynthesizedType {
  std::string name;
  EnvironmentKind kind = EnvironmentKind::Struct;
  EnvironmentId environment = 0;
  /// Alpha-renamed copies of the method's type parameters.
  std::vector<std::string> typeParameters;
  /// Hoisted variables in declaration order, then the parent field.
  std::vector<const FieldSymbol*> fields;
  /// `__parent` or `__this`; null unless the environment captures its parent.
  const FieldSymbol* parentField = nullptr;
  /// Hoisted variable -> field. The receiver is mapped only for Struct
  /// environments; Class environments reach it through the parent chain.
  llvm::DenseMap<const VariableSymbol*, const FieldSymbol*> fieldOf;
  /// Methods lowered onto this type, in closure order.
  std::vector<const MethodSymbol*> methods;

  [[nodiscard]] bool isStruct() const {
    return kind == EnvironmentKind::Struct;
  }

  /// Spelling of the type where `typeArguments` are in scope.
  [[nodiscard]] std::string
  getReference(llvm::ArrayRef<std::string> typeArguments) const;
};

struct SynthesizedMethod {
  const MethodSymbol* symbol = nullptr;
  ClosureId closure = 0;
  /// nullptr when the method is added to the enclosing type.
  const SynthesizedType* host = nullptr;
  /// Original parameter -> parameter of the lowered method.
  llvm::DenseMap<const VariableSymbol*, const VariableSymbol*> parameterMap;
  /// Struct environments passed by reference, in parameter order.
  llvm::SmallVector<std::pair<EnvironmentId, const VariableSymbol*>, 2>
      environmentParameters;
  /// Filled in by the tree rewriter.
  std::unique_ptr<NBlock> body;

  [[nodiscard]] bool isStatic() const;
};

/// Everything the synthesizer produces for one method, in emission order.
class SynthesizedDeclarations {
public:
  std::vector<std::unique_ptr<SynthesizedType>> types;
  std::vector<std::unique_ptr<SynthesizedMethod>> methods;

  [[nodiscard]] SynthesizedType* lookupType(EnvironmentId env) const;
  /// Every closure has exactly one method once synthesis succeeded.
  [[nodiscard]] SynthesizedMethod* getMethod(ClosureId closure) const;

  SynthesizedType& addType(std::unique_ptr<SynthesizedType> type);
  SynthesizedMethod& addMethod(std::unique_ptr<SynthesizedMethod> method);

private:
  llvm::DenseMap<EnvironmentId, SynthesizedType*> typeOf;
};

/// Replace every whole-identifier occurrence of a type parameter in `type`
/// with its renamed spelling (`T` becomes `$T`).
std::string renameTypeParameters(llvm::StringRef type,
                                 llvm::ArrayRef<std::string> typeParameters);

/// Create the environment types and the lowered method signatures. Fills in
/// Closure::loweredMethod and Closure::structParameters. Always runs
/// checkStructFields on the result.
bool synthesizeDeclarations(ScopeTree& tree, SymbolTable& symbols,
                            SynthesizedDeclarations& declarations,
                            LoweringError& error);

/// Fail if a Struct environment type is the type of a synthesized field.
/// Struct environments live in the frame that creates them and may only be
/// reached through locals or by-reference parameters.
bool checkStructFields(const SynthesizedDeclarations& declarations,
                       LoweringError& error);

/// Check the synthesized declarations against the environment graph before
/// anything is rewritten.
bool verifyEnvironmentGraph(const ScopeTree& tree,
                            const SynthesizedDeclarations& declarations,
                            LoweringError& error);

/// Rewrite the method body and fill in the body of every synthesized method.
std::unique_ptr<NMethodBody>
rewriteMethodBody(const ScopeTree& tree, SymbolTable& symbols,
                  SynthesizedDeclarations& declarations, LoweringError& error);

} // namespace cconv

#endif // CCONV_TRANSFORMS_SYNTHESIS_H
