/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief x86 in/out 指令端口原语
 *
 * 可直接作为 Traits 的端口部分使用：
 *
 * @code
 * struct KernelTraits : pagereg::X86PortIo {
 *   static auto Log(const char* fmt, ...) -> int;
 * };
 * @endcode
 *
 * 调用方需已具备 I/O 特权（内核态，或用户态下已 ioperm/iopl）。
 */

#ifndef PAGEREG_X86_PORT_IO_HPP_
#define PAGEREG_X86_PORT_IO_HPP_

#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/expected.hpp"

#if !defined(__x86_64__) && !defined(__i386__)
#error "pagereg/x86_port_io.hpp requires an x86 target"
#endif

namespace pagereg {

struct X86PortIo {
  static auto In8(PortAddress port) -> Expected<uint8_t> {
    uint8_t v;
    asm volatile("inb %1, %0" : "=a"(v) : "Nd"(port) : "memory");
    return v;
  }

  static auto Out8(PortAddress port, uint8_t v) -> Expected<void> {
    asm volatile("outb %0, %1" : : "a"(v), "Nd"(port) : "memory");
    return {};
  }
};

}  // namespace pagereg

#endif /* PAGEREG_X86_PORT_IO_HPP_ */
