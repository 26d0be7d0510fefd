/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_PORT_ACCESSOR_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_PORT_ACCESSOR_HPP_

#include <concepts>
#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/expected.hpp"
#include "pagereg/traits.hpp"

namespace pagereg::detail {

/**
 * @brief 基址相对的端口寄存器访问器
 *
 * 将寄存器偏移（0–15）加上构造时固定的基址转换为端口号，
 * 交给平台端口原语完成读写。不检查页是否正确：页约束由上层的
 * Computation 类型保证。
 *
 * 16 位寄存器占用两个相邻的 8 位端口，先低字节后高字节，
 * 与 DP8390 数据手册中 CLDA0/CLDA1、RSAR0/RSAR1 等寄存器对的顺序一致。
 *
 * @tparam Io 平台端口原语
 */
template <PortIoTraits Io>
class PortAccessor {
 public:
  explicit constexpr PortAccessor(PortAddress base = 0) : base_(base) {}

  template <typename T>
    requires std::same_as<T, uint8_t>
  [[nodiscard]] auto Read(uint8_t offset) const -> Expected<uint8_t> {
    return Io::In8(Port(offset));
  }

  template <typename T>
    requires std::same_as<T, uint16_t>
  [[nodiscard]] auto Read(uint8_t offset) const -> Expected<uint16_t> {
    auto low = Io::In8(Port(offset));
    if (!low) {
      return std::unexpected(low.error());
    }
    auto high = Io::In8(Port(offset + 1));
    if (!high) {
      return std::unexpected(high.error());
    }
    return static_cast<uint16_t>(*low | (*high << 8));
  }

  [[nodiscard]] auto Write(uint8_t offset, uint8_t val) const
      -> Expected<void> {
    return Io::Out8(Port(offset), val);
  }

  [[nodiscard]] auto Write(uint8_t offset, uint16_t val) const
      -> Expected<void> {
    auto low = Io::Out8(Port(offset), static_cast<uint8_t>(val & 0xFF));
    if (!low) {
      return low;
    }
    return Io::Out8(Port(offset + 1), static_cast<uint8_t>(val >> 8));
  }

  [[nodiscard]] constexpr auto base() const -> PortAddress { return base_; }

 private:
  PortAddress base_;

  [[nodiscard]] constexpr auto Port(unsigned offset) const -> PortAddress {
    return static_cast<PortAddress>(base_ + offset);
  }
};

}  // namespace pagereg::detail

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_PORT_ACCESSOR_HPP_ */
