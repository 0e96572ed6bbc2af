#include <tree/symbols.hpp>

VariableSymbol* SymbolTable::createLocal(const std::string& name,
                                         const std::string& type) {
  variables.push_back(
      std::make_unique<VariableSymbol>(VariableKind::Local, name, type));
  return variables.back().get();
}

VariableSymbol* SymbolTable::createParameter(const std::string& name,
                                             const std::string& type) {
  variables.push_back(
      std::make_unique<VariableSymbol>(VariableKind::Parameter, name, type));
  return variables.back().get();
}

VariableSymbol* SymbolTable::createThis(const std::string& type) {
  variables.push_back(
      std::make_unique<VariableSymbol>(VariableKind::This, "this", type));
  return variables.back().get();
}

FunctionSymbol* SymbolTable::createFunction(FunctionKind kind,
                                            const std::string& name,
                                            const std::string& returnType) {
  functions.push_back(std::make_unique<FunctionSymbol>(kind, name, returnType));
  return functions.back().get();
}

MethodSymbol* SymbolTable::createMethod(const std::string& name,
                                        const std::string& containingType,
                                        const std::string& returnType) {
  methods.push_back(
      std::make_unique<MethodSymbol>(name, containingType, returnType));
  return methods.back().get();
}

FieldSymbol* SymbolTable::createField(const std::string& name,
                                      const std::string& type,
                                      const std::string& containingType) {
  fields.push_back(std::make_unique<FieldSymbol>(name, type, containingType));
  return fields.back().get();
}
