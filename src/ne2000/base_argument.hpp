/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 解析命令行给出的端口基址
 */

#ifndef PAGEREG_SRC_NE2000_BASE_ARGUMENT_HPP_
#define PAGEREG_SRC_NE2000_BASE_ARGUMENT_HPP_

#include <cerrno>
#include <cstdlib>

#include "pagereg/defs.h"
#include "pagereg/expected.hpp"

/**
 * @brief 解析十进制、0x 十六进制或 0 八进制的端口基址
 * @return 基址；含多余字符或为空返回 kInvalidArgument，
 *         超出 16 位端口地址空间返回 kPortOutOfRange
 */
inline auto ParseBaseArgument(const char* text)
    -> pagereg::Expected<pagereg::PortAddress> {
  if (text == nullptr || *text == '\0' || *text == '-') {
    return std::unexpected(
        pagereg::Error{pagereg::ErrorCode::kInvalidArgument});
  }
  char* end = nullptr;
  errno = 0;
  auto value = std::strtoul(text, &end, 0);
  if (end == text || *end != '\0') {
    return std::unexpected(
        pagereg::Error{pagereg::ErrorCode::kInvalidArgument});
  }
  if (errno == ERANGE || value > 0xFFFF) {
    return std::unexpected(
        pagereg::Error{pagereg::ErrorCode::kPortOutOfRange});
  }
  return static_cast<pagereg::PortAddress>(value);
}

#endif /* PAGEREG_SRC_NE2000_BASE_ARGUMENT_HPP_ */
