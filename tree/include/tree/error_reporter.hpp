#ifndef CCONV_ERROR_REPORTER_HPP
#define CCONV_ERROR_REPORTER_HPP

#include "tree/node.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cconv {

/// Why lowering a method stopped. The binder owns user diagnostics, so the
/// middle-end never reports anything it could recover from.
enum class FailureKind {
  /// A pass broke one of its own guarantees.
  InternalError,
  /// The input tree violates the binder contract.
  MalformedInput,
};

/// One failed method, with the node the failure was detected at.
struct CompilerError {
  FailureKind kind = FailureKind::InternalError;
  /// Pass that detected an internal error; empty for malformed input.
  std::string stage;
  std::string message;
  /// Qualified name of the method being lowered, empty if unknown.
  std::string method;
  SourceLocation loc;

  /// e.g. `fatal error: internal compiler error in tree rewriting: ... while
  /// compiling 'Program.Run' at line 3, column 5`.
  [[nodiscard]] std::string format() const;
};

/// Collects the failures of the middle-end.
class ErrorReporter {
public:
  using ErrorCallback = std::function<void(const CompilerError&)>;

  ErrorReporter() = default;

  /// Get the thread-local current error reporter.
  /// Returns nullptr if no reporter is set.
  static ErrorReporter* current();

  /// Set the current thread-local error reporter.
  static void setCurrent(ErrorReporter* reporter);

  /// Record a failure, run the callback and echo it to stderr.
  void fatal(CompilerError error);

  void setCallback(ErrorCallback cb);

  /// Suppress the stderr echo (the callback and the error list still work).
  void setQuiet(bool quiet) { quietMode = quiet; }

  [[nodiscard]] const std::vector<CompilerError>& errors() const {
    return errorList;
  }

  [[nodiscard]] bool hasErrors() const { return !errorList.empty(); }

  void clear();

private:
  std::vector<CompilerError> errorList;
  ErrorCallback errorCallback;
  bool quietMode = false;
};

/// RAII helper installing a reporter as the current one for a scope.
class ScopedErrorReporter {
public:
  explicit ScopedErrorReporter(ErrorReporter& reporter)
      : previous(ErrorReporter::current()) {
    ErrorReporter::setCurrent(&reporter);
  }
  ~ScopedErrorReporter() { ErrorReporter::setCurrent(previous); }
  ScopedErrorReporter(const ScopedErrorReporter&) = delete;
  ScopedErrorReporter& operator=(const ScopedErrorReporter&) = delete;

private:
  ErrorReporter* previous;
};

} // namespace cconv

#endif // CCONV_ERROR_REPORTER_HPP
