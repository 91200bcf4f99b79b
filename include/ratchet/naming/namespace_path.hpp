// ratchet/naming/namespace_path.hpp - Fully-qualified constant paths
#pragma once

#include <gsl/span>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ratchet
{

/**
 * An ordered sequence of constant name segments, e.g. Billing::Invoice.
 *
 * The empty path is the top level. Paths compare segment-wise; the
 * qualified spelling joins segments with "::".
 */
class NamespacePath
{
public:
  NamespacePath() = default;
  NamespacePath(std::initializer_list<std::string> segments) : segments_(segments) {}
  explicit NamespacePath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  /**
   * Parse a qualified name ("A::B", "::A::B"). A leading "::" is accepted
   * and dropped. Returns nullopt for empty segments ("A::::B", "A::").
   */
  [[nodiscard]] static std::optional<NamespacePath> parse(std::string_view qualified);

  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return segments_.size(); }

  [[nodiscard]] gsl::span<const std::string> segments() const noexcept
  {
    return {segments_.data(), segments_.size()};
  }

  [[nodiscard]] const std::string & front() const { return segments_.front(); }
  [[nodiscard]] const std::string & back() const { return segments_.back(); }

  /// Path with `segment` appended
  [[nodiscard]] NamespacePath child(std::string segment) const;

  /// Path with all segments of `suffix` appended
  [[nodiscard]] NamespacePath concat(const NamespacePath & suffix) const;

  void push_back(std::string segment) { segments_.push_back(std::move(segment)); }

  /// "A::B"; the top level is spelled ""
  [[nodiscard]] std::string qualified_name() const;

  [[nodiscard]] bool operator==(const NamespacePath & other) const noexcept
  {
    return segments_ == other.segments_;
  }
  [[nodiscard]] bool operator!=(const NamespacePath & other) const noexcept
  {
    return segments_ != other.segments_;
  }
  [[nodiscard]] bool operator<(const NamespacePath & other) const noexcept
  {
    return segments_ < other.segments_;
  }

private:
  std::vector<std::string> segments_;
};

}  // namespace ratchet
