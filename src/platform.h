#pragma once

#include <cstdio>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <io.h>
#include <windows.h>
#endif

namespace fxlog::platform {

bool is_tty(std::FILE *stream);

// True when the terminal behind `stream` interprets ANSI cursor and SGR sequences.
// On Windows this also switches the console into virtual terminal mode.
bool ansi_supported(std::FILE *stream);

// Column count of the terminal behind `stream`, or 80 when it cannot be queried.
int terminal_width(std::FILE *stream);

int process_id();

}  // namespace fxlog::platform
