// stacksynth/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their construct/attribute location and, for
// constructs loaded from a stack file, the file position.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "stacksynth/basic/diagnostic.hpp"

namespace stacksynth
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0103]: Cyclic dependency: A -> B -> C -> A
 *     --> stacks/main.yaml:12:7 (C.config.input)
 *      |
 *      = note: C references A
 *      = help: break the cycle by removing one of the references
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location_line(const Location & location);
  void print_secondary_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] static std::string describe(const Location & location);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace stacksynth
