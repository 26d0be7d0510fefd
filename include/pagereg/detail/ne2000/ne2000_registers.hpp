/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_REGISTERS_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_REGISTERS_HPP_

#include <cstdint>

#include "pagereg/defs.h"
#include "pagereg/detail/register.hpp"

namespace pagereg::ne2000 {

/**
 * @brief NE2000（DP8390 内核）寄存器描述符
 *
 * 16 个端口、4 页，偏移 0 在每一页上都是命令寄存器，不在此列。
 * 只描述驱动用到的寄存器。
 */
namespace reg {

/// @name Page 0
/// @{
/// PSTART：接收环起始页，仅在停止状态下设置
using PageStart = PortRegister<0x01, Page::kPage0, Direction::kWriteOnly,
                               PowerRequirement::kOff>;
/// PSTOP：接收环结束页，仅在停止状态下设置
using PageStop = PortRegister<0x02, Page::kPage0, Direction::kWriteOnly,
                              PowerRequirement::kOff>;
/// BNRY：边界指针
using Boundary = PortRegister<0x03, Page::kPage0, Direction::kReadWrite>;
/// ISR：中断状态，写 1 清除对应位
using InterruptStatus =
    PortRegister<0x07, Page::kPage0, Direction::kReadWrite>;
/// CNTR0：帧对齐错误计数
using FrameAlignmentErrors =
    PortRegister<0x0D, Page::kPage0, Direction::kReadOnly>;
/// CNTR1：CRC 错误计数。同一偏移的写端口是 DCR
using CrcErrors = PortRegister<0x0E, Page::kPage0, Direction::kReadOnly>;
/// CNTR2：丢包计数。同一偏移的写端口是 IMR
using MissedPackets = PortRegister<0x0F, Page::kPage0, Direction::kReadOnly>;
/// @}

/// @name Page 1
/// @{
/// CLDA0/CLDA1：当前本地 DMA 地址，只写，低字节在前
using CurrentLocalDma =
    PortRegister<0x01, Page::kPage1, Direction::kWriteOnly,
                 PowerRequirement::kAny, uint16_t>;
/// CURR：接收环当前页
using CurrentPage = PortRegister<0x07, Page::kPage1, Direction::kReadWrite>;
/// @}

/// @name 读写分离
/// @{
/// DCR：Page 0 写，Page 1 读；只能在停止状态下写
using DataConfiguration = SplitRegister<
    PortRegister<0x0E, Page::kPage1, Direction::kReadOnly>,
    PortRegister<0x0E, Page::kPage0, Direction::kWriteOnly,
                 PowerRequirement::kOff>>;
/// IMR：Page 0 写，Page 2 读
using InterruptMask =
    SplitRegister<PortRegister<0x0F, Page::kPage2, Direction::kReadOnly>,
                  PortRegister<0x0F, Page::kPage0, Direction::kWriteOnly>>;
/// @}

/// @name Page 3（RTL8019AS）
/// @{
/// CONFIG0：只读的硬件配置
using Config0 = PortRegister<0x03, Page::kPage3, Direction::kReadOnly>;
/// @}

}  // namespace reg

/// @name ISR 位
/// @{
static constexpr uint8_t kIsrPacketReceived = 0x01;
static constexpr uint8_t kIsrPacketTransmitted = 0x02;
static constexpr uint8_t kIsrReceiveError = 0x04;
static constexpr uint8_t kIsrTransmitError = 0x08;
static constexpr uint8_t kIsrOverwrite = 0x10;
static constexpr uint8_t kIsrCounterOverflow = 0x20;
static constexpr uint8_t kIsrRemoteDmaComplete = 0x40;
/// 停止完成（或溢出后进入复位状态）
static constexpr uint8_t kIsrReset = 0x80;
static constexpr uint8_t kIsrAll = 0xFF;
/// @}

/// @name DCR 位
/// @{
/// WTS：字传输
static constexpr uint8_t kDcrWordTransfer = 0x01;
/// BOS：大端字节序
static constexpr uint8_t kDcrBigEndian = 0x02;
/// LAS：32 位 DMA 地址
static constexpr uint8_t kDcrLongAddress = 0x04;
/// LS：0 为回环，1 为正常工作
static constexpr uint8_t kDcrNormal = 0x08;
/// ARM：自动初始化远程 DMA
static constexpr uint8_t kDcrAutoInitRemote = 0x10;
/// FT1/FT0：FIFO 阈值 8 字节
static constexpr uint8_t kDcrFifo8Bytes = 0x40;
/// @}

/// @name Page 0
/// @{
inline constexpr auto SetPageStart(uint8_t page) {
  return WriteRegister<reg::PageStart>(page);
}

inline constexpr auto SetPageStop(uint8_t page) {
  return WriteRegister<reg::PageStop>(page);
}

inline constexpr auto ReadBoundary() { return ReadRegister<reg::Boundary>(); }

inline constexpr auto SetBoundary(uint8_t page) {
  return WriteRegister<reg::Boundary>(page);
}

inline constexpr auto ReadInterruptStatus() {
  return ReadRegister<reg::InterruptStatus>();
}

/**
 * @brief 清除 ISR 中 mask 对应的位
 */
inline constexpr auto AcknowledgeInterrupts(uint8_t mask) {
  return WriteRegister<reg::InterruptStatus>(mask);
}

inline constexpr auto ReadFrameAlignmentErrorCounter() {
  return ReadRegister<reg::FrameAlignmentErrors>();
}

/**
 * @brief 读取 CRC 错误计数
 *
 * 计数器读取后由硬件清零；没有写操作。
 */
inline constexpr auto ReadCrcErrorCounter() {
  return ReadRegister<reg::CrcErrors>();
}

inline constexpr auto ReadMissedPacketCounter() {
  return ReadRegister<reg::MissedPackets>();
}

inline constexpr auto SetInterruptMask(uint8_t mask) {
  return WriteRegister<reg::InterruptMask>(mask);
}

/**
 * @brief 写 DCR，需处于 (Page 0, 停止)
 */
inline constexpr auto WriteDataConfiguration(uint8_t value) {
  return WriteRegister<reg::DataConfiguration>(value);
}
/// @}

/// @name Page 1
/// @{
/**
 * @brief 写当前本地 DMA 地址（CLDA0 后 CLDA1）
 *
 * 硬件不提供对应的读端口，因此没有读操作。
 */
inline constexpr auto WriteCurrentLocalDma(uint16_t address) {
  return WriteRegister<reg::CurrentLocalDma>(address);
}

inline constexpr auto ReadCurrentPage() {
  return ReadRegister<reg::CurrentPage>();
}

inline constexpr auto SetCurrentPage(uint8_t page) {
  return WriteRegister<reg::CurrentPage>(page);
}

inline constexpr auto ReadDataConfiguration() {
  return ReadRegister<reg::DataConfiguration>();
}
/// @}

/// @name Page 2
/// @{
inline constexpr auto ReadInterruptMask() {
  return ReadRegister<reg::InterruptMask>();
}
/// @}

/// @name Page 3
/// @{
inline constexpr auto ReadConfig0() { return ReadRegister<reg::Config0>(); }
/// @}

}  // namespace pagereg::ne2000

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_NE2000_NE2000_REGISTERS_HPP_ */
