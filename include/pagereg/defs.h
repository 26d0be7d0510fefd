/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_DEFS_H_
#define PAGEREG_DEFS_H_

#include <cstdint>

namespace pagereg {

/// @brief 寄存器页，由命令寄存器 bit[7:6] 选择
enum class Page : uint8_t {
  kPage0 = 0,
  kPage1 = 1,
  kPage2 = 2,
  /// 仅部分型号（如 RTL8019AS）存在
  kPage3 = 3,
};

/// @brief 控制器运行状态，对应命令寄存器的 STA/STP 位
enum class PowerState : uint8_t {
  /// STP=1：已停止
  kOff = 0,
  /// STA=1：已启动
  kOn = 1,
};

/// @brief 寄存器访问方向
enum class Direction : uint8_t {
  kReadOnly,
  kWriteOnly,
  /// 读写同一端口
  kReadWrite,
  /// 读写位于不同偏移和/或不同页
  kSplit,
};

/// @brief 寄存器对运行状态的要求
enum class PowerRequirement : uint8_t {
  kAny,
  kOff,
  kOn,
};

/// @brief 端口地址（base + offset）
using PortAddress = uint16_t;

/// @brief 寄存器组的端口数
static constexpr uint8_t kRegisterCount = 16;

/**
 * @brief 页集合位图中某页对应的位
 * @param page 页
 * @return 1 << page
 */
constexpr auto PageBit(Page page) -> uint8_t {
  return static_cast<uint8_t>(1U << static_cast<uint8_t>(page));
}

}  // namespace pagereg

#endif /* PAGEREG_DEFS_H_ */
