// ratchet/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Text goes through fmt; rang adds colour when it is enabled.
//
#include "ratchet/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace ratchet
{

namespace
{

constexpr std::string_view k_gutter = "      ";
constexpr uint32_t k_tab_width = 4;

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
  }
  return rang::fg::red;
}

std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(
  const Diagnostic & diag, const SourceManager * source, std::string_view filename)
{
  const std::string_view name = filename.empty() ? std::string_view("<unknown>") : filename;

  print_severity_header(diag);

  const FullSourceRange at =
    source != nullptr ? source->get_full_range(diag.primary_range()) : FullSourceRange{};
  if (at.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), name, at.start_line, at.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), name);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    if (source != nullptr) {
      print_label_context(label, *source);
    } else if (!label.message.empty()) {
      print_note(label.message);
    }
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(
  const DiagnosticBag & diags, const SourceManager * source, std::string_view filename)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, source, filename);
  }
}

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string head(severity_name(diag.severity));
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }

  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }
  os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
      << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & source)
{
  const FullSourceRange at =
    label.range.is_valid() ? source.get_full_range(label.range) : FullSourceRange{};
  if (!at.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  // Multi-line labels mark only their first character.
  const bool same_line = at.end_line == at.start_line && at.end_column > at.start_column;
  const uint32_t end_col = same_line ? at.end_column : at.start_column + 1;

  print_source_line(source, at.start_line - 1, at.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Pad under the line so the marker lines up after tab expansion.
  const size_t lead = std::min<size_t>(start_col - 1, line.size());
  const std::string padding = expand_tabs(line.substr(0, lead));
  const std::string pad(padding.size(), ' ');

  const bool primary = style == LabelStyle::Primary;
  const std::string marker(end_col > start_col ? end_col - start_col : 1, primary ? '^' : '-');

  fmt::print(os_, "{}{} {}", k_gutter, gutter_pipe_only(), pad);
  if (use_color_) {
    os_ << (primary ? rang::fg::red : rang::fg::cyan);
    if (primary) {
      os_ << rang::style::bold;
    }
  }
  fmt::print(os_, "{}", marker);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message) { print_trailer("help", message); }

void DiagnosticPrinter::print_note(std::string_view message) { print_trailer("note", message); }

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "   = ";
  }
  fmt::print(os_, "{}: {}\n", kind, message);
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? std::string("\033[1;36m  -->\033[0m") : std::string("  -->");
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return fmt::format("{}{}", k_gutter, gutter_pipe_only());
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  return use_color_ ? std::string("\033[1;36m|\033[0m") : std::string("|");
}

}  // namespace ratchet
