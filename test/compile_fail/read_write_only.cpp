/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 读只写寄存器
 */

#include <cstdint>

#include "null_port_io.h"

using namespace pagereg;

auto ReadWriteOnly() -> Expected<uint16_t> {
  auto nic = ne2000::Ne2000<NullPortIo>::Create(0x300);
  if (!nic) {
    return std::unexpected(nic.error());
  }
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  return nic->Run<Page1Off>(ReadRegister<ne2000::reg::CurrentLocalDma>());
#else
  return nic->Run<Page1Off>(ne2000::ReadCurrentPage().Then(
      [](uint8_t curr) { return Return(static_cast<uint16_t>(curr << 8)); }));
#endif
}
