/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_STATE_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_STATE_HPP_

#include <concepts>
#include <cstdint>

#include "pagereg/defs.h"

namespace pagereg {

/**
 * @brief 编译期设备状态标签：当前选中的页与运行状态
 *
 * 只存在于类型中，不占用任何运行时存储。
 * 其值与命令寄存器中对应位的实际值一致，前提是 CR 只被页切换和
 * 运行状态切换两种操作写入。
 */
template <Page P, PowerState S>
struct DeviceState {
  static constexpr Page kPage = P;
  static constexpr PowerState kPower = S;
};

template <typename T>
concept StateTag = requires {
  { T::kPage } -> std::convertible_to<Page>;
  { T::kPower } -> std::convertible_to<PowerState>;
};

template <StateTag A, StateTag B>
inline constexpr bool kSameState = A::kPage == B::kPage && A::kPower == B::kPower;

/// @brief 运行状态是否满足寄存器的要求
constexpr auto PowerSatisfies(PowerRequirement requirement, PowerState state)
    -> bool {
  switch (requirement) {
    case PowerRequirement::kOff:
      return state == PowerState::kOff;
    case PowerRequirement::kOn:
      return state == PowerState::kOn;
    case PowerRequirement::kAny:
      return true;
  }
  return false;
}

}  // namespace pagereg

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_STATE_HPP_ */
