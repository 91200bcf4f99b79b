// ratchet/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "ratchet/basic/diagnostic.hpp"
#include "ratchet/basic/source_manager.hpp"

namespace ratchet
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[R001]: Syntax error
 *     --> app/models/order.rb:5:12
 *      |
 *    5 |   def total(
 *      |            ^
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
   *
   * @param diag The diagnostic
   * @param source Source the diagnostic ranges refer to (nullptr when there is none)
   * @param filename Name shown in the location line
   */
  void print(const Diagnostic & diag, const SourceManager * source, std::string_view filename);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(
    const DiagnosticBag & diags, const SourceManager * source, std::string_view filename);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace ratchet
