#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "internal/observability/logging.hpp"

namespace famgraph::audit {

/*
  Records who changed the graph.

  One line per mutation: "actor=<actor> action=<action> <detail fields>".
  Written to its own file when a path is configured, otherwise through the
  default logger.
*/
class AuditLog {
 public:
  // Empty path: route through the default logger.
  explicit AuditLog(const std::string& path = {});

  // Wraps an existing logger; used by tests to capture records.
  explicit AuditLog(std::shared_ptr<spdlog::logger> logger);

  void Record(std::string_view actor, std::string_view action, std::initializer_list<observability::LogField> detail = {});

  static std::string Format(std::string_view actor, std::string_view action, std::initializer_list<observability::LogField> detail);

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace famgraph::audit
