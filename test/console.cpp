/**
 * @copyright Copyright The pagereg Contributors
 */

#include "console.h"

#include <cinttypes>
#include <cstdio>

void console_putc(char c) { std::fputc(c, stdout); }

void console_puts(const char *str) { std::fputs(str, stdout); }

void console_put_hex(uint64_t num) { std::printf("%" PRIx64, num); }

void console_put_dec(uint64_t num) { std::printf("%" PRIu64, num); }

auto console_vprintf(const char *format, va_list args) -> int {
  return std::vprintf(format, args);
}
