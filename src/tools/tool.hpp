#pragma once

#include "params.hpp"
#include "schema.hpp"

#include <stdexcept>
#include <string>

namespace toolserver {

enum class ContentType { Markdown, Json };

// Thrown by tool bodies for expected failures (unknown project, bad FQN).
class ToolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A tool body is called exactly once per invocation, always on the mutation
// context, so it may read and mutate the host model without locking.
class ITool {
 public:
  virtual ~ITool() = default;

  virtual std::string Name() const = 0;
  virtual std::string Description() const = 0;
  virtual SchemaNode InputSchema() const = 0;
  virtual ContentType ResultType() const { return ContentType::Markdown; }

  virtual std::string Execute(const ParamMap& params) = 0;
};

}  // namespace toolserver
