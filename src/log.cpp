#include "log.h"

#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace fxlog {

namespace {

std::string format_message(char const *fmt, va_list args) {
  if (fmt == nullptr) { return {}; }

  std::string buffer(256, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written < 0) {
    va_end(args_copy);
    return fmt;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written < 0) { return fmt; }
  buffer.resize(static_cast<std::size_t>(written));
  return buffer;
}

void emit_formatted(context &ctx, log_level level, std::string message) {
  ctx.emit(make_log(level, lazy_message{ std::move(message) }));
}

}  // namespace

void log(context &ctx, log_level level, lazy_message message) {
  ctx.emit(make_log(level, std::move(message)));
}

void debug(context &ctx, char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string message{ format_message(fmt, args) };
  va_end(args);
  emit_formatted(ctx, log_level::LOG_DEBUG, std::move(message));
}

void info(context &ctx, char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string message{ format_message(fmt, args) };
  va_end(args);
  emit_formatted(ctx, log_level::LOG_INFO, std::move(message));
}

void warn(context &ctx, char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string message{ format_message(fmt, args) };
  va_end(args);
  emit_formatted(ctx, log_level::LOG_WARNING, std::move(message));
}

void error(context &ctx, char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string message{ format_message(fmt, args) };
  va_end(args);
  emit_formatted(ctx, log_level::LOG_ERROR, std::move(message));
}

void debug(context &ctx, lazy_message message) {
  log(ctx, log_level::LOG_DEBUG, std::move(message));
}

void info(context &ctx, lazy_message message) {
  log(ctx, log_level::LOG_INFO, std::move(message));
}

void warn(context &ctx, lazy_message message) {
  log(ctx, log_level::LOG_WARNING, std::move(message));
}

void error(context &ctx, lazy_message message) {
  log(ctx, log_level::LOG_ERROR, std::move(message));
}

}  // namespace fxlog
