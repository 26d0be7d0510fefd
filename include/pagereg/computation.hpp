/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief 分页寄存器计算的公开接口
 *
 * 提供与具体控制器无关的部分：状态标签、Computation 组合、
 * 寄存器描述符、页切换与运行状态切换、命令寄存器编解码。
 *
 * @code
 * #include "pagereg/computation.hpp"
 *
 * using Stopped0 = pagereg::DeviceState<pagereg::Page::kPage0,
 *                                       pagereg::PowerState::kOff>;
 * auto c = pagereg::Unit<Stopped0>().Then(
 *     [] { return pagereg::TurnToPage<pagereg::Page::kPage1>(); });
 * @endcode
 */

#ifndef PAGEREG_COMPUTATION_HPP_
#define PAGEREG_COMPUTATION_HPP_

#include "pagereg/detail/command_register.hpp"
#include "pagereg/detail/computation.hpp"
#include "pagereg/detail/page_turn.hpp"
#include "pagereg/detail/register.hpp"
#include "pagereg/detail/state.hpp"

#endif /* PAGEREG_COMPUTATION_HPP_ */
