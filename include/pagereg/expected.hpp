/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_EXPECTED_HPP_
#define PAGEREG_INCLUDE_PAGEREG_EXPECTED_HPP_

#include <cstddef>
#include <cstdint>
#include <expected>

namespace pagereg {

/// @brief 寄存器访问层错误码
///
/// 编号段划分：
/// - 0x000        通用成功
/// - 0x001–0x0FF  通用错误
/// - 0x100–0x1FF  端口层错误（Port）
/// - 0x200–0x2FF  页/运行状态错误（State）
///
/// 页选择错误不在此列：在错误的页上访问寄存器无法通过编译。
enum class ErrorCode : uint32_t {
  /// 操作成功
  kSuccess = 0,

  /// @name 通用错误 (0x001–0x0FF)
  /// @{
  /// 无效的参数
  kInvalidArgument = 0x001,
  /// 轮询次数耗尽
  kTimeout = 0x002,
  /// @}

  /// @name 端口层错误 (0x100–0x1FF)
  /// @{
  /// 平台端口原语报告失败
  kPortIoFailure = 0x100,
  /// 寄存器组超出 16 位端口地址空间
  kPortOutOfRange = 0x101,
  /// @}

  /// @name 页/运行状态错误 (0x200–0x2FF)
  /// @{
  /// 声明的起始页/运行状态与硬件不符
  kStartingStateMismatch = 0x200,
  /// @}
};

/**
 * @brief 获取错误码的描述字符串
 * @param code 错误码
 * @return 错误描述字符串
 */
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";

    // 通用错误 (0x001–0x0FF)
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kTimeout:
      return "Polling attempts exhausted";

    // 端口层错误 (0x100–0x1FF)
    case ErrorCode::kPortIoFailure:
      return "Port I/O primitive failed";
    case ErrorCode::kPortOutOfRange:
      return "Register file exceeds port address space";

    // 页/运行状态错误 (0x200–0x2FF)
    case ErrorCode::kStartingStateMismatch:
      return "Declared page/power state does not match hardware";

    default:
      return "Unknown error";
  }
}

/**
 * @brief 寄存器访问层错误类型
 */
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  /**
   * @brief 获取错误描述消息
   * @return 错误描述字符串
   */
  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }

  /**
   * @brief 显式转换为 ErrorCode
   */
  explicit constexpr operator ErrorCode() const { return code; }

  /// @name 比较运算符
  /// @{
  [[nodiscard]] constexpr auto operator==(const Error& other) const -> bool {
    return code == other.code;
  }
  [[nodiscard]] constexpr auto operator==(ErrorCode other) const -> bool {
    return code == other;
  }
  /// @}
};

/// @brief std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

}  // namespace pagereg

#endif /* PAGEREG_INCLUDE_PAGEREG_EXPECTED_HPP_ */
