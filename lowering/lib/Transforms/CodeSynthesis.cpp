//===- CodeSynthesis.cpp - Synthesized declarations -------------*- C++ -*-===//
//
// This file finalizes the shape of every synthesized declaration before the
// tree is rewritten: environment types with their fields, and the signature
// of the method every nested function is lowered to.
//
//===----------------------------------------------------------------------===//

#include "cconv/Transforms/Synthesis.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"

#include <algorithm>
#include <cctype>

namespace cconv {

//===----------------------------------------------------------------------===//
// SynthesizedType / SynthesizedMethod / SynthesizedDeclarations
//===----------------------------------------------------------------------===//

std::string SynthesizedType::getReference(
    llvm::ArrayRef<std::string> typeArguments) const {
  if (typeArguments.empty()) {
    return name;
  }
  return name + "<" + llvm::join(typeArguments, ", ") + ">";
}

bool SynthesizedMethod::isStatic() const { return symbol->isStatic; }

SynthesizedType* SynthesizedDeclarations::lookupType(EnvironmentId env) const {
  return typeOf.lookup(env);
}

SynthesizedMethod* SynthesizedDeclarations::getMethod(ClosureId closure) const {
  if (closure >= methods.size()) {
    return nullptr;
  }
  return methods[closure].get();
}

SynthesizedType&
SynthesizedDeclarations::addType(std::unique_ptr<SynthesizedType> type) {
  typeOf[type->environment] = type.get();
  types.push_back(std::move(type));
  return *types.back();
}

SynthesizedMethod&
SynthesizedDeclarations::addMethod(std::unique_ptr<SynthesizedMethod> method) {
  methods.push_back(std::move(method));
  return *methods.back();
}

std::string renameTypeParameters(llvm::StringRef type,
                                 llvm::ArrayRef<std::string> typeParameters) {
  auto isIdentChar = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '$';
  };

  std::string result;
  size_t i = 0;
  while (i < type.size()) {
    if (!isIdentChar(type[i])) {
      result += type[i++];
      continue;
    }
    size_t start = i;
    while (i < type.size() && isIdentChar(type[i])) {
      ++i;
    }
    llvm::StringRef ident = type.slice(start, i);
    if (llvm::is_contained(typeParameters, ident)) {
      result += "$";
    }
    result += ident.str();
  }
  return result;
}

namespace {

//===----------------------------------------------------------------------===//
// CodeSynthesizer
//===----------------------------------------------------------------------===//

class CodeSynthesizer {
public:
  CodeSynthesizer(ScopeTree& tree, SymbolTable& symbols,
                  SynthesizedDeclarations& declarations, LoweringError& error)
      : tree(tree), symbols(symbols), declarations(declarations), error(error),
        method(*tree.getMethod().method) {
    for (const std::string& param : method.typeParameters) {
      renamedTypeParameters.push_back("$" + param);
    }
  }

  bool run() {
    unsigned ordinal = 0;
    for (EnvironmentId envId = 0; envId < tree.numEnvironments(); ++envId) {
      if (!tree.getEnvironment(envId).removed) {
        synthesizeType(envId, ordinal++);
      }
    }
    // Parent fields name other environment types, so they are added once
    // every type exists.
    for (auto& type : declarations.types) {
      addParentField(*type);
    }

    for (ClosureId id = 0; id < tree.numClosures(); ++id) {
      if (!synthesizeMethod(id)) {
        return false;
      }
    }
    return true;
  }

private:
  ScopeTree& tree;
  SymbolTable& symbols;
  SynthesizedDeclarations& declarations;
  LoweringError& error;
  const MethodSymbol& method;
  std::vector<std::string> renamedTypeParameters;

  std::string renamed(const std::string& type) const {
    return renameTypeParameters(type, method.typeParameters);
  }

  void synthesizeType(EnvironmentId envId, unsigned ordinal) {
    const Environment& env = tree.getEnvironment(envId);
    auto type = std::make_unique<SynthesizedType>();
    type->name = method.name + "$Env" + std::to_string(ordinal);
    type->kind = env.kind;
    type->environment = envId;
    type->typeParameters = renamedTypeParameters;

    for (const VariableSymbol* variable : env.variables) {
      const FieldSymbol* field = nullptr;
      if (variable->isThis()) {
        if (!env.isStruct()) {
          continue;
        }
        field = symbols.createField("__this", method.containingType,
                                    type->name);
      } else {
        field = symbols.createField(variable->name, renamed(variable->type),
                                    type->name);
      }
      type->fields.push_back(field);
      type->fieldOf[variable] = field;
    }
    declarations.addType(std::move(type));
  }

  void addParentField(SynthesizedType& type) {
    if (!tree.getEnvironment(type.environment).capturesParent) {
      return;
    }
    auto parent = tree.getRuntimeParent(type.environment);
    if (parent) {
      const SynthesizedType* parentType = declarations.lookupType(*parent);
      type.parentField = symbols.createField(
          "__parent", parentType->getReference(renamedTypeParameters),
          type.name);
    } else {
      type.parentField =
          symbols.createField("__this", method.containingType, type.name);
    }
    type.fields.push_back(type.parentField);
  }

  /// Struct environments the closure reads, deepest scope first, then in
  /// creation order.
  llvm::SmallVector<EnvironmentId, 2>
  collectStructParameters(const Closure& closure) const {
    llvm::SmallVector<EnvironmentId, 2> result;
    for (EnvironmentId envId : closure.capturedEnvironments) {
      if (tree.getEnvironment(envId).isStruct()) {
        result.push_back(envId);
      }
    }
    std::stable_sort(result.begin(), result.end(),
                     [&](EnvironmentId lhs, EnvironmentId rhs) {
                       unsigned lhsDepth =
                           tree.getScope(tree.getEnvironment(lhs).scope).depth;
                       unsigned rhsDepth =
                           tree.getScope(tree.getEnvironment(rhs).scope).depth;
                       if (lhsDepth != rhsDepth) {
                         return lhsDepth > rhsDepth;
                       }
                       return lhs < rhs;
                     });
    return result;
  }

  bool synthesizeMethod(ClosureId id) {
    Closure& closure = tree.getClosure(id);
    const FunctionSymbol& function = *closure.function;

    auto lowered = std::make_unique<SynthesizedMethod>();
    lowered->closure = id;
    if (closure.containingEnvironment) {
      lowered->host = declarations.lookupType(*closure.containingEnvironment);
      if (lowered->host == nullptr) {
        return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                          "closure '" + function.name +
                              "' is hosted on a removed environment");
      }
    }
    const bool onEnvironment = lowered->host != nullptr;
    auto typeOf = [&](const std::string& type) {
      return onEnvironment ? renamed(type) : type;
    };
    llvm::ArrayRef<std::string> typeArguments =
        onEnvironment ? llvm::ArrayRef<std::string>(renamedTypeParameters)
                      : llvm::ArrayRef<std::string>(method.typeParameters);

    const std::string containingType =
        onEnvironment ? lowered->host->name : method.containingType;
    MethodSymbol* symbol =
        symbols.createMethod(method.name + "$" + function.name + "$" +
                                 std::to_string(id),
                             containingType, typeOf(function.returnType));
    symbol->isStatic = !onEnvironment &&
                       !(closure.capturesThis && !tree.getReceiverEnvironment());
    if (!onEnvironment) {
      symbol->typeParameters = method.typeParameters;
    }

    for (const VariableSymbol* param : function.parameters) {
      VariableSymbol* copy =
          symbols.createParameter(param->name, typeOf(param->type));
      copy->isSynthesized = true;
      symbol->parameters.push_back(copy);
      lowered->parameterMap[param] = copy;
    }

    closure.structParameters = collectStructParameters(closure);
    if (!closure.structParameters.empty() && !closure.canTakeRefParameters()) {
      return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                        "closure '" + function.name +
                            "' cannot take environments by reference",
                        tree.getScope(closure.bodyScope).block->loc);
    }
    for (EnvironmentId envId : closure.structParameters) {
      const SynthesizedType* envType = declarations.lookupType(envId);
      VariableSymbol* param = symbols.createParameter(
          "__env" + std::to_string(envId), envType->getReference(typeArguments));
      param->isByRef = true;
      param->isSynthesized = true;
      symbol->parameters.push_back(param);
      lowered->environmentParameters.emplace_back(envId, param);
    }

    lowered->symbol = symbol;
    closure.loweredMethod = symbol;
    if (onEnvironment) {
      declarations.lookupType(*closure.containingEnvironment)
          ->methods.push_back(symbol);
    }
    declarations.addMethod(std::move(lowered));
    return true;
  }
};

} // namespace

bool synthesizeDeclarations(ScopeTree& tree, SymbolTable& symbols,
                            SynthesizedDeclarations& declarations,
                            LoweringError& error) {
  if (!declarations.types.empty() || !declarations.methods.empty()) {
    return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                      "declarations are already synthesized");
  }
  CodeSynthesizer synthesizer(tree, symbols, declarations, error);
  return synthesizer.run() && checkStructFields(declarations, error);
}

bool checkStructFields(const SynthesizedDeclarations& declarations,
                       LoweringError& error) {
  llvm::StringSet<> structTypes;
  for (const auto& type : declarations.types) {
    if (type->isStruct()) {
      structTypes.insert(type->name);
    }
  }
  for (const auto& type : declarations.types) {
    for (const FieldSymbol* field : type->fields) {
      // `Run$Env0<$T>` names the type `Run$Env0`.
      llvm::StringRef base = llvm::StringRef(field->type)
                                 .take_until([](char c) { return c == '<'; })
                                 .rtrim();
      if (structTypes.contains(base)) {
        return error.fail(LoweringErrorKind::InvalidEnvironmentGraph,
                          "struct environment '" + field->type +
                              "' is stored in field '" + type->name + "." +
                              field->name + "'");
      }
    }
  }
  return true;
}

} // namespace cconv
