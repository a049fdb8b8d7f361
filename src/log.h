#pragma once

#include "context.h"
#include "event.h"

#if defined(__clang__) || defined(__GNUC__)
#define FXLOG_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define FXLOG_PRINTF(idx, first)
#endif

namespace fxlog {

// Emit a record at any level. Pass a callable as `message` to defer formatting until a
// renderer needs the text.
void log(context &ctx, log_level level, lazy_message message);

// printf-style helpers format eagerly. The lazy_message overloads take a callable or
// ready text and leave formatting to whichever renderer first reads the message.
void debug(context &ctx, char const *fmt, ...) FXLOG_PRINTF(2, 3);
void info(context &ctx, char const *fmt, ...) FXLOG_PRINTF(2, 3);
void warn(context &ctx, char const *fmt, ...) FXLOG_PRINTF(2, 3);
void error(context &ctx, char const *fmt, ...) FXLOG_PRINTF(2, 3);

void debug(context &ctx, lazy_message message);
void info(context &ctx, lazy_message message);
void warn(context &ctx, lazy_message message);
void error(context &ctx, lazy_message message);

}  // namespace fxlog

#undef FXLOG_PRINTF
