/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_REGISTER_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_REGISTER_HPP_

#include <concepts>
#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/detail/command_register.hpp"
#include "pagereg/detail/computation.hpp"
#include "pagereg/detail/state.hpp"
#include "pagereg/expected.hpp"

namespace pagereg {

/**
 * @brief 单端口寄存器描述符
 *
 * @tparam Offset 端口偏移；16 位寄存器占用 Offset 与 Offset + 1
 * @tparam P      所在页
 * @tparam D      访问方向（kReadOnly / kWriteOnly / kReadWrite）
 * @tparam Power  对运行状态的要求
 * @tparam Value  uint8_t 或 uint16_t
 */
template <uint8_t Offset, Page P, Direction D,
          PowerRequirement Power = PowerRequirement::kAny,
          typename Value = uint8_t>
struct PortRegister {
  static_assert(D != Direction::kSplit,
                "split-port registers are described with SplitRegister");
  static_assert(std::same_as<Value, uint8_t> || std::same_as<Value, uint16_t>,
                "registers are 8 or 16 bits wide");
  static_assert(Offset != command::kOffset,
                "offset 0 is the command register");
  static_assert(Offset + sizeof(Value) <= kRegisterCount,
                "register must lie within the 16-port window");

  static constexpr uint8_t kOffset = Offset;
  static constexpr Page kPage = P;
  static constexpr Direction kDirection = D;
  static constexpr PowerRequirement kPower = Power;
  using ValueType = Value;
};

/**
 * @brief 读写分离的寄存器描述符
 *
 * 同一个逻辑寄存器的读端口与写端口位于不同的偏移和/或不同的页，
 * 两侧分别记录，读写操作也分别要求各自的页。
 */
template <typename ReadPort, typename WritePort>
struct SplitRegister {
  static_assert(ReadPort::kDirection == Direction::kReadOnly,
                "read side must be a read-only port");
  static_assert(WritePort::kDirection == Direction::kWriteOnly,
                "write side must be a write-only port");
  static_assert(std::same_as<typename ReadPort::ValueType,
                             typename WritePort::ValueType>,
                "both sides must have the same width");

  static constexpr Direction kDirection = Direction::kSplit;
  using ReadSide = ReadPort;
  using WriteSide = WritePort;
  using ValueType = typename ReadPort::ValueType;
};

template <typename R>
concept RegisterDescriptor = requires {
  { R::kDirection } -> std::convertible_to<Direction>;
  typename R::ValueType;
};

template <typename R>
concept ReadableRegister =
    RegisterDescriptor<R> && (R::kDirection == Direction::kReadOnly ||
                              R::kDirection == Direction::kReadWrite ||
                              R::kDirection == Direction::kSplit);

template <typename R>
concept WritableRegister =
    RegisterDescriptor<R> && (R::kDirection == Direction::kWriteOnly ||
                              R::kDirection == Direction::kReadWrite ||
                              R::kDirection == Direction::kSplit);

namespace detail {

template <typename R>
struct ReadSideOf {
  using type = R;
};

template <typename R>
  requires(R::kDirection == Direction::kSplit)
struct ReadSideOf<R> {
  using type = typename R::ReadSide;
};

template <typename R>
struct WriteSideOf {
  using type = R;
};

template <typename R>
  requires(R::kDirection == Direction::kSplit)
struct WriteSideOf<R> {
  using type = typename R::WriteSide;
};

}  // namespace detail

template <typename R>
using ReadSideT = typename detail::ReadSideOf<R>::type;

template <typename R>
using WriteSideT = typename detail::WriteSideOf<R>::type;

/**
 * @brief 端口 Port 能否在状态 Entry 下访问：页相同且运行状态满足要求
 */
template <typename Port, typename Entry>
concept AccessibleAt = StateTag<Entry> && (Entry::kPage == Port::kPage) &&
                       (PowerSatisfies(Port::kPower, Entry::kPower));

/**
 * @brief 读寄存器步骤，不改变页与运行状态
 */
template <typename Port>
class RegisterRead : public GenericStep<RegisterRead<Port>> {
 public:
  using Value = typename Port::ValueType;

  constexpr RegisterRead() = default;

  template <StateTag Entry>
    requires AccessibleAt<Port, Entry>
  [[nodiscard]] constexpr auto At() const {
    return detail::MakeStep<Entry, Entry, Value, PageBit(Port::kPage)>(
        [](const auto& regs) -> Expected<Value> {
          return regs.template Read<Value>(Port::kOffset);
        });
  }
};

/**
 * @brief 写寄存器步骤，不改变页与运行状态
 */
template <typename Port>
class RegisterWrite : public GenericStep<RegisterWrite<Port>> {
 public:
  using Value = typename Port::ValueType;

  explicit constexpr RegisterWrite(Value value) : value_(value) {}

  template <StateTag Entry>
    requires AccessibleAt<Port, Entry>
  [[nodiscard]] constexpr auto At() const {
    return detail::MakeStep<Entry, Entry, void, PageBit(Port::kPage)>(
        [value = value_](const auto& regs) -> Expected<void> {
          return regs.Write(Port::kOffset, value);
        });
  }

 private:
  Value value_;
};

/**
 * @brief 读取寄存器 R（读写分离时使用读端口）
 *
 * 只写寄存器不满足约束，没有对应的读操作。
 */
template <ReadableRegister R>
constexpr auto ReadRegister() -> RegisterRead<ReadSideT<R>> {
  return {};
}

/**
 * @brief 写入寄存器 R（读写分离时使用写端口）
 *
 * 只读寄存器不满足约束，没有对应的写操作。
 */
template <WritableRegister R>
constexpr auto WriteRegister(typename R::ValueType value)
    -> RegisterWrite<WriteSideT<R>> {
  return RegisterWrite<WriteSideT<R>>(value);
}

}  // namespace pagereg

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_REGISTER_HPP_ */
