/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 在公开接口中构造声明页切换却不写 CR 的步骤
 */

#include "null_port_io.h"

using namespace pagereg;

auto ForgedStep() -> Expected<void> {
#ifndef PAGEREG_COMPILE_FAIL_CONTROL
  auto turn = MakeStep<Page0Off, Page1Off, void>(
      [](const auto&) -> Expected<void> { return {}; });
#else
  auto turn = TurnToPage<Page::kPage1>();
#endif
  auto nic = ne2000::Ne2000<NullPortIo>::Create(0x300);
  if (!nic) {
    return std::unexpected(nic.error());
  }
  return nic->Run<Page0Off>(
      turn.Then([] { return ne2000::SetCurrentPage(0x47); }));
}
