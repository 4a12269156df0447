#include "tools/metadata_formatters.hpp"

#include <sstream>

namespace toolserver {
namespace {

static void WriteHeader(std::ostringstream& oss, const MetadataObject& o) {
  oss << "# " << o.Fqn() << "\n\n";
  oss << "| Property | Value |\n";
  oss << "|---|---|\n";
  oss << "| Name | " << EscapeMarkdownCell(o.name) << " |\n";
  oss << "| Type | " << EscapeMarkdownCell(o.category) << " |\n";
  if (!o.synonym.empty()) oss << "| Synonym | " << EscapeMarkdownCell(o.synonym) << " |\n";
  if (!o.comment.empty()) oss << "| Comment | " << EscapeMarkdownCell(o.comment) << " |\n";
}

static void WriteProperties(std::ostringstream& oss, const MetadataObject& o) {
  for (const auto& [k, v] : o.properties) {
    oss << "| " << EscapeMarkdownCell(k) << " | " << EscapeMarkdownCell(v) << " |\n";
  }
}

static void WriteAttributes(std::ostringstream& oss, const MetadataObject& o, const char* title) {
  if (o.attributes.empty()) return;
  oss << "\n## " << title << " (" << o.attributes.size() << ")\n\n";
  oss << "| Name | Type |\n";
  oss << "|---|---|\n";
  for (const auto& a : o.attributes) {
    oss << "| " << EscapeMarkdownCell(a.name) << " | " << EscapeMarkdownCell(a.type.empty() ? "-" : a.type) << " |\n";
  }
}

static void WriteList(std::ostringstream& oss, const std::vector<std::string>& items, const char* title) {
  if (items.empty()) return;
  oss << "\n## " << title << " (" << items.size() << ")\n\n";
  for (const auto& it : items) oss << "- " << it << "\n";
}

class CatalogFormatter : public IMetadataFormatter {
 public:
  std::string Category() const override { return "Catalog"; }

  std::string Format(const MetadataObject& o, bool full) const override {
    std::ostringstream oss;
    WriteHeader(oss, o);
    if (full) WriteProperties(oss, o);
    WriteAttributes(oss, o, "Attributes");
    WriteList(oss, o.tabular_sections, "Tabular sections");
    if (full) WriteList(oss, o.forms, "Forms");
    return oss.str();
  }
};

class DocumentFormatter : public IMetadataFormatter {
 public:
  std::string Category() const override { return "Document"; }

  std::string Format(const MetadataObject& o, bool full) const override {
    std::ostringstream oss;
    WriteHeader(oss, o);
    if (full) WriteProperties(oss, o);
    WriteAttributes(oss, o, "Header attributes");
    WriteList(oss, o.tabular_sections, "Tabular sections");
    if (full) WriteList(oss, o.forms, "Forms");
    return oss.str();
  }
};

// Common modules carry no attributes; their flags live in properties and
// are always shown.
class CommonModuleFormatter : public IMetadataFormatter {
 public:
  std::string Category() const override { return "CommonModule"; }

  std::string Format(const MetadataObject& o, bool) const override {
    std::ostringstream oss;
    WriteHeader(oss, o);
    WriteProperties(oss, o);
    return oss.str();
  }
};

class GenericFormatter : public IMetadataFormatter {
 public:
  std::string Category() const override { return {}; }

  std::string Format(const MetadataObject& o, bool full) const override {
    std::ostringstream oss;
    WriteHeader(oss, o);
    if (full) {
      WriteProperties(oss, o);
      WriteAttributes(oss, o, "Attributes");
      WriteList(oss, o.tabular_sections, "Tabular sections");
      WriteList(oss, o.forms, "Forms");
    }
    return oss.str();
  }
};

}  // namespace

std::string EscapeMarkdownCell(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n' || c == '\r') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

FormatterRegistry::FormatterRegistry(std::unique_ptr<IMetadataFormatter> fallback) : fallback_(std::move(fallback)) {
  if (!fallback_) fallback_ = std::make_unique<GenericFormatter>();
}

void FormatterRegistry::Register(std::unique_ptr<IMetadataFormatter> formatter) {
  if (!formatter) return;
  auto category = formatter->Category();
  by_category_[category] = std::move(formatter);
}

const IMetadataFormatter& FormatterRegistry::Select(const std::string& category) const {
  auto it = by_category_.find(category);
  if (it == by_category_.end()) return *fallback_;
  return *it->second;
}

std::string FormatterRegistry::Format(const MetadataObject& object, bool full) const {
  return Select(object.category).Format(object, full);
}

FormatterRegistry BuildDefaultFormatters() {
  FormatterRegistry reg(std::make_unique<GenericFormatter>());
  reg.Register(std::make_unique<CatalogFormatter>());
  reg.Register(std::make_unique<DocumentFormatter>());
  reg.Register(std::make_unique<CommonModuleFormatter>());
  return reg;
}

}  // namespace toolserver
