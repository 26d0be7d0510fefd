/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 后一步要求的起始状态与前一步的退出状态不同
 */

#include "null_port_io.h"

using namespace pagereg;

auto SequenceMismatch() -> Expected<void> {
  // (Page 0, 停止) -> (Page 1, 停止)
  auto c1 = PlaceAt<Page0Off>(TurnToPage<Page::kPage1>());
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  // c1 退出于 Page 1，而 Unit<Page0Off> 要求从 Page 0 开始
  auto c = c1.Then([] { return Unit<Page0Off>(); });
#else
  auto c = c1.Then([] { return Unit<Page1Off>(); });
#endif
  auto nic = ne2000::Ne2000<NullPortIo>::Create(0x300);
  if (!nic) {
    return std::unexpected(nic.error());
  }
  return nic->Run<Page0Off>(c);
}
