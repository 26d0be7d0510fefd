/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 直接构造 Computation：执行体可以写 CR 并声明任意起止状态
 */

#include "null_port_io.h"

using namespace pagereg;

namespace {

constexpr auto kWriteCommand = [](const auto& regs) -> Expected<void> {
  return regs.Write(command::kOffset, static_cast<uint8_t>(0x62));
};

}  // namespace

auto ForgedComputation() -> Expected<void> {
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  auto start = Computation<Page0Off, Page0Off, void,
                           decltype(kWriteCommand), 0>(kWriteCommand);
#else
  auto start = Unit<Page0Off>();
#endif
  auto nic = ne2000::Ne2000<NullPortIo>::Create(0x300);
  if (!nic) {
    return std::unexpected(nic.error());
  }
  return nic->Run<Page0Off>(
      start.Then([] { return ne2000::SetBoundary(0x46); }));
}
