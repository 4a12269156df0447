#pragma once

#include "workspace.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace toolserver {

class IMetadataFormatter {
 public:
  virtual ~IMetadataFormatter() = default;

  // Category tag this formatter handles; empty for the fallback.
  virtual std::string Category() const = 0;
  virtual std::string Format(const MetadataObject& object, bool full) const = 0;
};

// Selects a formatter by the object's category tag and falls back to a
// generic one for categories nobody registered.
class FormatterRegistry {
 public:
  explicit FormatterRegistry(std::unique_ptr<IMetadataFormatter> fallback);

  void Register(std::unique_ptr<IMetadataFormatter> formatter);
  const IMetadataFormatter& Select(const std::string& category) const;
  std::string Format(const MetadataObject& object, bool full) const;

 private:
  std::unique_ptr<IMetadataFormatter> fallback_;
  std::unordered_map<std::string, std::unique_ptr<IMetadataFormatter>> by_category_;
};

FormatterRegistry BuildDefaultFormatters();

std::string EscapeMarkdownCell(const std::string& s);

}  // namespace toolserver
