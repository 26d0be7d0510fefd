/**
 * @copyright Copyright The pagereg Contributors
 *
 * @brief NE2000 寄存器访问公开接口
 *
 * 用户应通过此头文件使用 NE2000 寄存器目录与设备句柄，而非直接包含
 * detail/ 中的实现文件。
 *
 * @code
 * #include "pagereg/ne2000.hpp"
 *
 * using namespace pagereg;
 * auto nic = ne2000::Ne2000<PlatformTraits>::Create(0x300);
 * auto crc = nic->Run<DeviceState<Page::kPage0, PowerState::kOn>>(
 *     ne2000::ReadCrcErrorCounter());
 * @endcode
 */

#ifndef PAGEREG_NE2000_HPP_
#define PAGEREG_NE2000_HPP_

#include "pagereg/computation.hpp"
#include "pagereg/detail/ne2000/ne2000_device.hpp"
#include "pagereg/detail/ne2000/ne2000_registers.hpp"
#include "pagereg/detail/ne2000/ne2000_routines.hpp"

#endif /* PAGEREG_NE2000_HPP_ */
