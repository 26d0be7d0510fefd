/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 在不提供 Page 3 的型号上选中 Page 3
 */

#include "null_port_io.h"

using namespace pagereg;

auto ReadConfig0() -> Expected<uint8_t> {
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  auto nic = ne2000::Ne2000<NullPortIo, ne2000::Dp8390>::Create(0x300);
#else
  auto nic = ne2000::Ne2000<NullPortIo, ne2000::Rtl8019as>::Create(0x300);
#endif
  if (!nic) {
    return std::unexpected(nic.error());
  }
  return nic->Run<Page0Off>(TurnToPage<Page::kPage3>().Then(
      [] { return ne2000::ReadConfig0(); }));
}
