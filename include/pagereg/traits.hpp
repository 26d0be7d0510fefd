/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_TRAITS_HPP_
#define PAGEREG_TRAITS_HPP_

#include <concepts>
#include <cstddef>
#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/expected.hpp"

namespace pagereg {

/// @name 正交能力 Concepts
/// 驱动通过 concept refinement 按需组合所需的平台能力。
/// @{

/**
 * @brief 基础环境特征约束（所有驱动必需）
 *
 * 提供日志输出能力，是最小的 Traits 约束。
 */
template <typename T>
concept EnvironmentTraits = requires {
  { T::Log(static_cast<const char*>("")) } -> std::same_as<int>;
};

/**
 * @brief 8 位端口 I/O 能力
 *
 * 由平台提供的原始端口读写原语。失败时返回 kPortIoFailure，
 * 寄存器访问层原样向上传播，不做重试。
 */
template <typename T>
concept PortIoTraits = requires(PortAddress port, uint8_t value) {
  { T::In8(port) } -> std::same_as<Expected<uint8_t>>;
  { T::Out8(port, value) } -> std::same_as<Expected<void>>;
};

/// @}

/**
 * @brief 零开销默认 Traits
 *
 * 满足 EnvironmentTraits，所有方法在编译期消除。
 * 不提供端口能力：端口原语必须由平台给出。
 */
struct NullTraits {
  static auto Log(const char* /*fmt*/, ...) -> int { return 0; }
};

}  // namespace pagereg

#endif /* PAGEREG_TRAITS_HPP_ */
