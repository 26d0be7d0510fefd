/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_COMMAND_REGISTER_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_COMMAND_REGISTER_HPP_

#include <cstdint>

#include "pagereg/defs.h"

/**
 * @brief 命令寄存器（CR）位布局
 *
 * 所有页的偏移 0 都映射到同一个命令寄存器：
 *
 * | bit | 7   6 | 5   4   3 | 2   | 1   | 0   |
 * |-----|-------|-----------|-----|-----|-----|
 * |     | PS1 PS0 | RD2 RD1 RD0 | TXP | STA | STP |
 *
 * 只有本文件中的编解码函数知道页选择位与运行状态位的位置；
 * 写 CR 的只有页切换和运行状态切换两种操作。
 */
namespace pagereg::command {

/// @brief CR 在每一页上的偏移
static constexpr uint8_t kOffset = 0x00;

/// @name 字段
/// @{
static constexpr uint8_t kPageShift = 6;
static constexpr uint8_t kPageMask = 0xC0;
/// STP：停止
static constexpr uint8_t kStop = 0x01;
/// STA：启动
static constexpr uint8_t kStart = 0x02;
static constexpr uint8_t kPowerMask = kStop | kStart;
/// TXP：读回为 1 表示正在发送，写 1 触发发送
static constexpr uint8_t kTransmit = 0x04;
/// RD2：中止/完成远程 DMA
static constexpr uint8_t kNoDma = 0x20;
/// @}

/// @brief 不读回 CR 时用来补全页/运行状态以外各位的值
static constexpr uint8_t kIdleBits = kNoDma;

/**
 * @brief 编码命令寄存器值
 * @param page 页选择
 * @param power 运行状态
 * @param preserved 先前读到（或约定）的 CR 值，页与运行状态以外的位原样保留
 * @return 待写入 CR 的字节
 */
constexpr auto Encode(Page page, PowerState power, uint8_t preserved)
    -> uint8_t {
  auto bits = static_cast<uint8_t>(preserved & ~(kPageMask | kPowerMask));
  bits |= static_cast<uint8_t>(static_cast<uint8_t>(page) << kPageShift);
  bits |= power == PowerState::kOn ? kStart : kStop;
  return bits;
}

/// @brief 只替换页选择位
constexpr auto WithPage(uint8_t value, Page page) -> uint8_t {
  return static_cast<uint8_t>((value & ~kPageMask) |
                              (static_cast<uint8_t>(page) << kPageShift));
}

/// @brief 只替换 STA/STP 位
constexpr auto WithPower(uint8_t value, PowerState power) -> uint8_t {
  return static_cast<uint8_t>((value & ~kPowerMask) |
                              (power == PowerState::kOn ? kStart : kStop));
}

/**
 * @brief 解析页选择位
 */
constexpr auto DecodePage(uint8_t value) -> Page {
  return static_cast<Page>((value & kPageMask) >> kPageShift);
}

/**
 * @brief 解析运行状态位
 *
 * STP 优先：STP 置位即视为已停止，与芯片行为一致。
 */
constexpr auto DecodePowerState(uint8_t value) -> PowerState {
  if ((value & kStop) != 0) {
    return PowerState::kOff;
  }
  return (value & kStart) != 0 ? PowerState::kOn : PowerState::kOff;
}

/// @brief 页与运行状态以外的位
constexpr auto OtherBits(uint8_t value) -> uint8_t {
  return static_cast<uint8_t>(value & ~(kPageMask | kPowerMask));
}

/**
 * @brief 判断 CR 值是否处于给定页与运行状态
 */
constexpr auto Matches(uint8_t value, Page page, PowerState power) -> bool {
  return DecodePage(value) == page && DecodePowerState(value) == power;
}

}  // namespace pagereg::command

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_COMMAND_REGISTER_HPP_ */
