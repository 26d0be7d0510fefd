/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 控制器运行时写 DCR
 */

#include "null_port_io.h"

using namespace pagereg;

auto WriteDcrWhileRunning() -> Expected<void> {
  auto nic = ne2000::Ne2000<NullPortIo>::Create(0x300);
  if (!nic) {
    return std::unexpected(nic.error());
  }
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  return nic->Run<Page0On>(ne2000::WriteDataConfiguration(0x48));
#else
  return nic->Run<Page0On>(SetPower<PowerState::kOff>().Then(
      [] { return ne2000::WriteDataConfiguration(0x48); }));
#endif
}
