/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_ROUTINES_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_ROUTINES_HPP_

#include <cstdint>

#include "pagereg/detail/computation.hpp"
#include "pagereg/detail/ne2000/ne2000_registers.hpp"
#include "pagereg/detail/page_turn.hpp"

namespace pagereg::ne2000 {

/**
 * @brief 三个网络错误计数器的快照
 */
struct ErrorCounters {
  uint8_t frame_alignment;
  uint8_t crc;
  uint8_t missed;
};

/**
 * @brief 依次读取 CNTR0、CNTR1、CNTR2
 *
 * 需处于 Page 0，运行状态不限；三个计数器读后均被硬件清零。
 */
inline constexpr auto ReadErrorCounters() {
  return ReadFrameAlignmentErrorCounter().Then([](uint8_t frame_alignment) {
    return ReadCrcErrorCounter().Then([frame_alignment](uint8_t crc) {
      return ReadMissedPacketCounter().Then(
          [frame_alignment, crc](uint8_t missed) {
            return Return(ErrorCounters{frame_alignment, crc, missed});
          });
    });
  });
}

/**
 * @brief 停止控制器并等待 ISR.RST 置位
 *
 * 任意页、任意运行状态进入，结束于 (Page 0, 停止)。
 *
 * @param max_polls ISR 最多读取次数
 * @return 最后一次读到的 ISR 值；max_polls 次内未置位返回 kTimeout
 */
template <PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
constexpr auto StopController(uint32_t max_polls) {
  return SetPower<PowerState::kOff, Strategy>()
      .Then([] { return TurnToPage<Page::kPage0, Strategy>(); })
      .Then([max_polls] {
        return PollUntil(
            ReadInterruptStatus(),
            [](uint8_t isr) { return (isr & kIsrReset) != 0; }, max_polls);
      });
}

/**
 * @brief 写 DCR 并从其读端口读回
 *
 * 需处于 (Page 0, 停止)；中途切到 Page 1 读回，结束时回到 Page 0。
 *
 * @return 读回的 DCR 值
 */
template <PageTurnStrategy Strategy = PageTurnStrategy::kReadModifyWrite>
constexpr auto ConfigureDataPath(uint8_t dcr) {
  return WriteDataConfiguration(dcr)
      .Then([] { return TurnToPage<Page::kPage1, Strategy>(); })
      .Then([] { return ReadDataConfiguration(); })
      .Then([](uint8_t readback) {
        return TurnToPage<Page::kPage0, Strategy>().Then(
            [readback] { return Return(readback); });
      });
}

}  // namespace pagereg::ne2000

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_ROUTINES_HPP_ */
