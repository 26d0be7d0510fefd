/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_DEVICE_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_DEVICE_HPP_

#include <concepts>
#include <cstdint>
#include <utility>

#include "pagereg/defs.h"
#include "pagereg/detail/command_register.hpp"
#include "pagereg/detail/computation.hpp"
#include "pagereg/detail/port_accessor.hpp"
#include "pagereg/detail/state.hpp"
#include "pagereg/expected.hpp"
#include "pagereg/traits.hpp"

namespace pagereg::ne2000 {

/// @name 控制器型号
/// @{

/// 原版 DP8390 内核：Page 0–2
struct Dp8390 {
  static constexpr uint8_t kPages = PageBit(Page::kPage0) |
                                    PageBit(Page::kPage1) |
                                    PageBit(Page::kPage2);
  static constexpr const char* kName = "DP8390";
};

/// RTL8019AS：额外提供 Page 3 配置寄存器
struct Rtl8019as {
  static constexpr uint8_t kPages =
      Dp8390::kPages | PageBit(Page::kPage3);
  static constexpr const char* kName = "RTL8019AS";
};

template <typename T>
concept ControllerVariant = requires {
  { T::kPages } -> std::convertible_to<uint8_t>;
  { T::kName } -> std::convertible_to<const char*>;
};

/// @}

/**
 * @brief NE2000 驱动所需的平台能力：日志 + 8 位端口 I/O
 */
template <typename T>
concept Ne2000Traits = EnvironmentTraits<T> && PortIoTraits<T>;

/**
 * @brief 计算 C 只会选中型号 Variant 实际存在的页
 */
template <typename C, typename Variant>
concept SupportedBy =
    AnyComputation<C> && ((C::kPagesTouched & ~Variant::kPages) == 0);

/**
 * @brief 状态 S 所选中的页在型号 Variant 上存在
 */
template <typename S, typename Variant>
concept ValidStartFor =
    StateTag<S> && ((PageBit(S::kPage) & Variant::kPages) != 0);

/**
 * @brief 从硬件读到的命令寄存器状态
 */
struct ProbedState {
  Page page;
  PowerState power;
  /// CR 原始值
  uint8_t raw;
};

/**
 * @brief NE2000 设备句柄
 *
 * 持有构造时确定的端口基址，之后不可更改。所有寄存器访问都以
 * Computation 的形式交给 Run() 执行，Run() 要求调用方声明设备当前
 * 所处的页与运行状态。
 *
 * 页/运行状态只在类型中跟踪：同一设备上的多个计算不得交错执行，
 * 需要并发访问时，调用方须在整个 Run() 期间持有互斥锁。
 *
 * @tparam Traits  平台能力
 * @tparam Variant 控制器型号
 */
template <Ne2000Traits Traits, ControllerVariant Variant = Dp8390>
class Ne2000 {
 public:
  /**
   * @brief 工厂方法：创建设备句柄
   * @param base 寄存器组端口基址（ISA 跳线或 PCI BAR 给出）
   * @return 成功返回设备句柄；base 为 0 返回 kInvalidArgument，
   *         寄存器组越过端口地址空间返回 kPortOutOfRange
   */
  [[nodiscard]] static auto Create(PortAddress base) -> Expected<Ne2000> {
    if (base == 0) {
      Traits::Log("%s: base port is 0", Variant::kName);
      return std::unexpected(Error{ErrorCode::kInvalidArgument});
    }
    if (base > static_cast<PortAddress>(0xFFFF - (kRegisterCount - 1))) {
      Traits::Log("%s: register file at 0x%x exceeds port space",
                  Variant::kName, static_cast<unsigned>(base));
      return std::unexpected(Error{ErrorCode::kPortOutOfRange});
    }

    Traits::Log("%s: register file at port 0x%x", Variant::kName,
                static_cast<unsigned>(base));
    return Ne2000(base);
  }

  /// @name 构造/析构函数
  /// @{
  Ne2000(const Ne2000&) = delete;
  Ne2000(Ne2000&&) = default;
  auto operator=(const Ne2000&) -> Ne2000& = delete;
  auto operator=(Ne2000&&) -> Ne2000& = default;
  ~Ne2000() = default;
  /// @}

  /**
   * @brief 执行计算
   *
   * 将 step 放置在声明的起始状态 Start 上并按声明顺序执行全部端口访问。
   * 成功时设备处于计算的退出状态。
   *
   * 编译期拒绝：Start 或 step 会选中本型号不存在的页，或 step 不能从
   * Start 开始。
   *
   * @tparam Start 调用方声明的设备当前状态
   * @param step   Computation 或状态泛型步骤
   * @return 计算结果；端口原语失败或读回校验不符时返回对应错误，
   *         此时设备状态未知，需由调用方重新探测
   */
  template <StateTag Start, typename Step>
    requires ValidStartFor<Start, Variant> && PlaceableAt<Step, Start> &&
             SupportedBy<PlacedAt<Step, Start>, Variant>
  [[nodiscard]] auto Run(Step&& step) const
      -> Expected<typename PlacedAt<Step, Start>::ValueType> {
    auto result = detail::ComputationAccess::Execute(
        PlaceAt<Start>(std::forward<Step>(step)), regs_);
    if (!result) {
      Traits::Log("%s@0x%x: computation from page %u (%s) failed: %s",
                  Variant::kName, static_cast<unsigned>(regs_.base()),
                  static_cast<unsigned>(Start::kPage),
                  Start::kPower == PowerState::kOn ? "on" : "off",
                  result.error().message());
    }
    return result;
  }

  /**
   * @brief 读取命令寄存器，解析硬件当前的页与运行状态
   *
   * 用于在第一次 Run() 之前确定应声明的起始状态。
   */
  [[nodiscard]] auto ProbeState() const -> Expected<ProbedState> {
    auto raw = regs_.template Read<uint8_t>(command::kOffset);
    if (!raw) {
      Traits::Log("%s@0x%x: command register read failed: %s",
                  Variant::kName, static_cast<unsigned>(regs_.base()),
                  raw.error().message());
      return std::unexpected(raw.error());
    }
    return ProbedState{command::DecodePage(*raw),
                       command::DecodePowerState(*raw), *raw};
  }

  [[nodiscard]] auto base() const -> PortAddress { return regs_.base(); }

 private:
  detail::PortAccessor<Traits> regs_;

  explicit Ne2000(PortAddress base) : regs_(base) {}
};

}  // namespace pagereg::ne2000

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_DEVICE_HPP_ */
