#ifndef CCONV_SYMBOLS_HPP
#define CCONV_SYMBOLS_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

// Kinds of variables the binder hands to the middle-end
enum class VariableKind {
  Local,     // declared by a variable declaration
  Parameter, // formal parameter of the method or of a nested function
  This       // the enclosing receiver
};

// A variable as resolved by the binder. Identity is the object address.
class VariableSymbol {
public:
  VariableKind kind;
  std::string name;
  std::string type;
  bool isByRef = false;       // synthesized environment parameters only
  bool isSynthesized = false; // created by closure conversion
  VariableSymbol(VariableKind kind, std::string name, std::string type)
      : kind(kind), name(std::move(name)), type(std::move(type)) {}
  [[nodiscard]] bool isThis() const { return kind == VariableKind::This; }
};

enum class FunctionKind { Lambda, LocalFunction };

// A nested function (lambda or local function) as resolved by the binder
class FunctionSymbol {
public:
  FunctionKind kind;
  std::string name;
  std::string returnType;
  std::vector<const VariableSymbol*> parameters;
  // Set by the binder when the local function is ever used as a value
  bool isConvertedToDelegate = false;
  bool isAsync = false;
  bool isIterator = false;
  FunctionSymbol(FunctionKind kind, std::string name, std::string returnType)
      : kind(kind), name(std::move(name)), returnType(std::move(returnType)) {}
  [[nodiscard]] bool isLambda() const { return kind == FunctionKind::Lambda; }
};

// A method of some type: the method being compiled, a method it calls, or a
// method synthesized for a nested function.
class MethodSymbol {
public:
  std::string name;
  std::string containingType;
  bool isStatic = false;
  std::vector<std::string> typeParameters;
  std::vector<const VariableSymbol*> parameters;
  std::string returnType;
  MethodSymbol(std::string name, std::string containingType,
               std::string returnType)
      : name(std::move(name)), containingType(std::move(containingType)),
        returnType(std::move(returnType)) {}
  [[nodiscard]] std::string qualifiedName() const {
    return containingType + "." + name;
  }
};

// A field of a synthesized environment type
class FieldSymbol {
public:
  std::string name;
  std::string type;
  std::string containingType;
  FieldSymbol(std::string name, std::string type, std::string containingType)
      : name(std::move(name)), type(std::move(type)),
        containingType(std::move(containingType)) {}
};

/// Arena owning every symbol of one compilation unit of work.
/// Symbols are never removed; pointers stay valid for the table's lifetime.
class SymbolTable {
public:
  SymbolTable() = default;
  SymbolTable(const SymbolTable&) = delete;
  SymbolTable& operator=(const SymbolTable&) = delete;
  SymbolTable(SymbolTable&&) = default;
  SymbolTable& operator=(SymbolTable&&) = default;

  VariableSymbol* createLocal(const std::string& name, const std::string& type);
  VariableSymbol* createParameter(const std::string& name,
                                  const std::string& type);
  VariableSymbol* createThis(const std::string& type);
  FunctionSymbol* createFunction(FunctionKind kind, const std::string& name,
                                 const std::string& returnType);
  MethodSymbol* createMethod(const std::string& name,
                             const std::string& containingType,
                             const std::string& returnType);
  FieldSymbol* createField(const std::string& name, const std::string& type,
                           const std::string& containingType);

  [[nodiscard]] size_t variableCount() const { return variables.size(); }
  [[nodiscard]] size_t functionCount() const { return functions.size(); }

private:
  std::vector<std::unique_ptr<VariableSymbol>> variables;
  std::vector<std::unique_ptr<FunctionSymbol>> functions;
  std::vector<std::unique_ptr<MethodSymbol>> methods;
  std::vector<std::unique_ptr<FieldSymbol>> fields;
};

#endif // CCONV_SYMBOLS_HPP
