/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_PAGE_TURN_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_PAGE_TURN_HPP_

#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/detail/command_register.hpp"
#include "pagereg/detail/computation.hpp"
#include "pagereg/detail/state.hpp"
#include "pagereg/expected.hpp"

namespace pagereg {

/**
 * @brief 写命令寄存器的方式
 */
enum class PageTurnStrategy : uint8_t {
  /// 先读回 CR，校验页/运行状态与类型标签一致，只替换目标字段后写回
  kReadModifyWrite,
  /// 不读 CR，按类型标签中的页/运行状态与 kIdleBits 重建整个字节。
  /// 要求没有其他代码路径写 CR
  kTracked,
};

namespace detail {

/**
 * @brief 按策略将 CR 从 Entry 状态写到 Exit 状态
 */
template <StateTag Entry, StateTag Exit, PageTurnStrategy Strategy,
          typename Regs>
auto WriteCommand(const Regs& regs) -> Expected<void> {
  if constexpr (Strategy == PageTurnStrategy::kTracked) {
    return regs.Write(command::kOffset,
                      command::Encode(Exit::kPage, Exit::kPower,
                                      command::kIdleBits));
  } else {
    auto current = regs.template Read<uint8_t>(command::kOffset);
    if (!current) {
      return std::unexpected(current.error());
    }
    if (!command::Matches(*current, Entry::kPage, Entry::kPower)) {
      return std::unexpected(Error{ErrorCode::kStartingStateMismatch});
    }
    // TXP 写 0 无效，写 1 会再次触发发送
    auto value = static_cast<uint8_t>(*current & ~command::kTransmit);
    if constexpr (Entry::kPage != Exit::kPage) {
      value = command::WithPage(value, Exit::kPage);
    }
    if constexpr (Entry::kPower != Exit::kPower) {
      value = command::WithPower(value, Exit::kPower);
    }
    return regs.Write(command::kOffset, value);
  }
}

}  // namespace detail

/**
 * @brief 页切换：(任意页, p) -> (Target, p)
 *
 * 唯一允许改变页选择位的操作；运行状态位保持不变。
 */
template <Page Target,
          PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
class PageTurn : public GenericStep<PageTurn<Target, Strategy>> {
 public:
  template <StateTag Entry>
  [[nodiscard]] constexpr auto At() const {
    using Exit = DeviceState<Target, Entry::kPower>;
    return detail::MakeStep<Entry, Exit, void, PageBit(Target)>(
        [](const auto& regs) -> Expected<void> {
          return detail::WriteCommand<Entry, Exit, Strategy>(regs);
        });
  }
};

/**
 * @brief 运行状态切换：(p, 任意状态) -> (p, Target)
 *
 * 唯一允许改变 STA/STP 位的操作；页选择位保持不变。
 */
template <PowerState Target,
          PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
class PowerChange : public GenericStep<PowerChange<Target, Strategy>> {
 public:
  template <StateTag Entry>
  [[nodiscard]] constexpr auto At() const {
    using Exit = DeviceState<Entry::kPage, Target>;
    return detail::MakeStep<Entry, Exit, void>(
        [](const auto& regs) -> Expected<void> {
          return detail::WriteCommand<Entry, Exit, Strategy>(regs);
        });
  }
};

template <Page Target,
          PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
constexpr auto TurnToPage() -> PageTurn<Target, Strategy> {
  return {};
}

template <PowerState Target,
          PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
constexpr auto SetPower() -> PowerChange<Target, Strategy> {
  return {};
}

}  // namespace pagereg

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_PAGE_TURN_HPP_ */
