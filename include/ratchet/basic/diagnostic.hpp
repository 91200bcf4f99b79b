// ratchet/basic/diagnostic.hpp - Diagnostics reported while reading sources
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ratchet/basic/source_manager.hpp"

namespace ratchet
{

namespace diag_codes
{
inline constexpr const char * k_syntax_error = "R001";
inline constexpr const char * k_missing_token = "R002";
inline constexpr const char * k_unsupported_file = "R010";
inline constexpr const char * k_namespace_collision = "R020";
inline constexpr const char * k_config_error = "R030";
}  // namespace diag_codes

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle {
  Primary,
  Secondary,
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "R001"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// Range of the first primary label, or of the first label if none is primary.
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

/**
 * Fluent builder returned by DiagnosticBag::report_error. The diagnostic is
 * added to the bag when the builder is destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace ratchet
