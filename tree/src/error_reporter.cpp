#include "tree/error_reporter.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

namespace cconv {

// Thread-local pointer to the current error reporter
static thread_local ErrorReporter* currentReporter = nullptr;

std::string CompilerError::format() const {
  std::ostringstream oss;
  oss << "fatal error: ";

  switch (kind) {
  case FailureKind::InternalError:
    oss << "internal compiler error";
    if (!stage.empty()) {
      oss << " in " << stage;
    }
    break;
  case FailureKind::MalformedInput:
    oss << "malformed input";
    break;
  }
  oss << ": " << message;

  if (!method.empty()) {
    oss << " while compiling '" << method << "'";
  }
  if (loc.isValid()) {
    oss << " at line " << loc.line;
    if (loc.column > 0) {
      oss << ", column " << loc.column;
    }
  }
  return oss.str();
}

ErrorReporter* ErrorReporter::current() { return currentReporter; }

void ErrorReporter::setCurrent(ErrorReporter* reporter) {
  currentReporter = reporter;
}

void ErrorReporter::fatal(CompilerError error) {
  errorList.push_back(std::move(error));
  const CompilerError& recorded = errorList.back();

  if (errorCallback) {
    errorCallback(recorded);
  }
  if (!quietMode) {
    std::fprintf(stderr, "%s\n", recorded.format().c_str());
  }
}

void ErrorReporter::setCallback(ErrorCallback cb) {
  errorCallback = std::move(cb);
}

void ErrorReporter::clear() { errorList.clear(); }

} // namespace cconv
