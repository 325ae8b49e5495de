#include "internal/audit/audit_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace famgraph::audit {

namespace {

constexpr const char* kLoggerName = "audit";

} // namespace

AuditLog::AuditLog(const std::string& path) {
  if (path.empty()) return;

  logger_ = spdlog::get(kLoggerName);
  if (!logger_) {
    logger_ = spdlog::basic_logger_mt(kLoggerName, path);
    logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z %v");
    logger_->flush_on(spdlog::level::info);
  }
}

AuditLog::AuditLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
}

std::string AuditLog::Format(std::string_view actor, std::string_view action, std::initializer_list<observability::LogField> detail) {
  std::string line = "actor=" + std::string(actor.empty() ? std::string_view("system") : actor) + " action=" + std::string(action);
  auto        rest = observability::SerializeFields(detail);
  if (!rest.empty()) {
    line += ' ';
    line += rest;
  }
  return line;
}

void AuditLog::Record(std::string_view actor, std::string_view action, std::initializer_list<observability::LogField> detail) {
  auto line = Format(actor, action, detail);
  if (logger_) {
    logger_->info(line);
    return;
  }
  FAMGRAPH_LOG_INFO("audit " + line);
}

} // namespace famgraph::audit
