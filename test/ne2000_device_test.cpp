/**
 * @file ne2000_device_test.cpp
 * @brief NE2000 设备句柄测试：创建、执行、状态探测与页切换策略
 * @copyright Copyright The pagereg Contributors
 */

#include "pagereg/detail/ne2000/ne2000_device.hpp"

#include <cstdint>
#include <type_traits>
#include <vector>

#include "pagereg/ne2000.hpp"
#include "test.h"
#include "test_env.h"

namespace {

using pagereg::ErrorCode;
using pagereg::Page;
using pagereg::PageTurnStrategy;
using pagereg::PowerState;
namespace ne2000 = pagereg::ne2000;

using Device = ne2000::Ne2000<FakeTraits>;
using Rtl8019 = ne2000::Ne2000<FakeTraits, ne2000::Rtl8019as>;

/// 选中 Page 3 的计算只能交给提供 Page 3 的型号执行
template <typename D, typename Step>
concept Runnable = requires(const D& device, Step step) {
  device.template Run<Page0Off>(step);
};

using ReadConfig0FromPage0 =
    decltype(pagereg::TurnToPage<Page::kPage3>().Then(
        [] { return ne2000::ReadConfig0(); }));
static_assert(Runnable<Rtl8019, ReadConfig0FromPage0>);
static_assert(!Runnable<Device, ReadConfig0FromPage0>);
static_assert(Runnable<Device, decltype(ne2000::ReadBoundary())>);

/// 声明的起始页同样必须存在于该型号
template <typename D, typename Start, typename Step>
concept RunnableFrom = requires(const D& device, Step step) {
  device.template Run<Start>(step);
};

using Page3Off = pagereg::DeviceState<Page::kPage3, PowerState::kOff>;
using TurnToPage0 = decltype(pagereg::TurnToPage<Page::kPage0>());
static_assert(RunnableFrom<Rtl8019, Page3Off, TurnToPage0>);
static_assert(!RunnableFrom<Device, Page3Off, TurnToPage0>);
static_assert(RunnableFrom<Device, Page2On, TurnToPage0>);

// 句柄只能移动
static_assert(!std::is_copy_constructible_v<Device>);
static_assert(std::is_move_constructible_v<Device>);

/**
 * @brief 写 BNRY，切到 Page 1 读 CURR，切回 Page 0 读 CRC 错误计数
 * @return {CURR, CNTR1}
 */
template <PageTurnStrategy Strategy>
constexpr auto BoundaryScenario() {
  return ne2000::SetBoundary(0x46)
      .Then([] { return pagereg::TurnToPage<Page::kPage1, Strategy>(); })
      .Then([] { return ne2000::ReadCurrentPage(); })
      .Then([](uint8_t curr) {
        return pagereg::TurnToPage<Page::kPage0, Strategy>()
            .Then([] { return ne2000::ReadCrcErrorCounter(); })
            .Then([curr](uint8_t crc) {
              return pagereg::Return(static_cast<uint16_t>((curr << 8) | crc));
            });
      });
}

static_assert(pagereg::kSameState<
              pagereg::PlacedAt<decltype(BoundaryScenario<
                                         PageTurnStrategy::kTracked>()),
                                Page0Off>::ExitState,
              Page0Off>);

}  // namespace

void test_ne2000_device() {
  TEST_SUITE_BEGIN("NE2000 Device");

  // === 测试 1: 基址校验 ===
  {
    auto zero = Device::Create(0);
    EXPECT_FALSE(zero.has_value(), "base 0 is rejected");
    if (!zero.has_value()) {
      EXPECT_EQ(static_cast<int>(ErrorCode::kInvalidArgument),
                static_cast<int>(zero.error().code), "kInvalidArgument");
    }

    auto overflow = Device::Create(0xFFF8);
    EXPECT_FALSE(overflow.has_value(), "register file past 0xFFFF rejected");
    if (!overflow.has_value()) {
      EXPECT_EQ(static_cast<int>(ErrorCode::kPortOutOfRange),
                static_cast<int>(overflow.error().code), "kPortOutOfRange");
    }

    auto last = Device::Create(0xFFF0);
    EXPECT_TRUE(last.has_value(), "register file ending at 0xFFFF accepted");

    auto isa = Device::Create(kNicBase);
    EXPECT_TRUE(isa.has_value(), "ISA base accepted");
    if (isa.has_value()) {
      EXPECT_EQ(kNicBase, isa->base(), "base() returns construction base");
    }
  }

  auto device = Device::Create(kNicBase);
  EXPECT_TRUE(device.has_value(), "Create DP8390 device");
  if (!device.has_value()) {
    TEST_SUITE_END();
    return;
  }

  // === 测试 2: 端到端场景，不读回 CR ===
  {
    FakePortBus::Reset();
    FakePortBus::Script(Page::kPage1, 0x07, {0x4C});
    FakePortBus::Script(Page::kPage0, 0x0E, {0x03});
    auto result = device->Run<Page0Off>(
        BoundaryScenario<PageTurnStrategy::kTracked>());
    EXPECT_TRUE(result.has_value(), "scenario succeeds");
    EXPECT_EQ(0x4C03, result.value_or(0), "CURR and CNTR1 returned");

    std::vector<PortAccess> expected = {
        Out(0x03, 0x46, Page::kPage0), Out(0x00, 0x61, Page::kPage0),
        In(0x07, 0x4C, Page::kPage1), Out(0x00, 0x21, Page::kPage1),
        In(0x0E, 0x03, Page::kPage0)};
    EXPECT_EQ(5u, FakePortBus::Accesses().size(), "exactly 5 port accesses");
    EXPECT_TRUE(FakePortBus::Accesses() == expected,
                "accesses in declared order on the expected pages");
    EXPECT_TRUE(FakePortBus::CommandWrites() ==
                    (std::vector<uint8_t>{0x61, 0x21}),
                "CR written exactly twice");
  }

  // === 测试 3: 端到端场景，读-改-写 ===
  {
    FakePortBus::Reset();
    FakePortBus::Script(Page::kPage1, 0x07, {0x4C});
    FakePortBus::Script(Page::kPage0, 0x0E, {0x03});
    auto result = device->Run<Page0Off>(
        BoundaryScenario<PageTurnStrategy::kReadModifyWrite>());
    EXPECT_EQ(0x4C03, result.value_or(0), "same result with RMW turns");

    std::vector<PortAccess> expected = {
        Out(0x03, 0x46, Page::kPage0), In(0x00, 0x21, Page::kPage0),
        Out(0x00, 0x61, Page::kPage0), In(0x07, 0x4C, Page::kPage1),
        In(0x00, 0x61, Page::kPage1),  Out(0x00, 0x21, Page::kPage1),
        In(0x0E, 0x03, Page::kPage0)};
    EXPECT_TRUE(FakePortBus::Accesses() == expected,
                "each turn reads CR before writing it");
  }

  // === 测试 4: 读-改-写保留页/运行状态以外的位 ===
  {
    // RD0 置位（远程读），TXP 置位
    FakePortBus::Reset(0x0D);
    auto result = device->Run<Page0Off>(pagereg::TurnToPage<Page::kPage2>());
    EXPECT_TRUE(result.has_value(), "turn succeeds");
    EXPECT_EQ(0x89, FakePortBus::Command(),
              "page bits replaced, RD kept, TXP cleared");
  }

  // === 测试 5: 声明的起始状态与硬件不符 ===
  {
    FakePortBus::Reset();
    FakePortBus::ForceCommand(0x62);
    auto result = device->Run<Page0Off>(
        pagereg::TurnToPage<Page::kPage1>().Then(
            [] { return ne2000::ReadCurrentPage(); }));
    EXPECT_FALSE(result.has_value(), "mismatch detected");
    if (!result.has_value()) {
      EXPECT_EQ(static_cast<int>(ErrorCode::kStartingStateMismatch),
                static_cast<int>(result.error().code),
                "kStartingStateMismatch");
    }
    EXPECT_EQ(1u, FakePortBus::Accesses().size(), "only the CR read issued");
    EXPECT_TRUE(FakePortBus::CommandWrites().empty(), "CR not written");
  }

  // === 测试 6: 端口失败中止后续访问 ===
  {
    FakePortBus::Reset();
    FakePortBus::FailAt(2);
    auto result = device->Run<Page0Off>(
        BoundaryScenario<PageTurnStrategy::kTracked>());
    EXPECT_FALSE(result.has_value(), "failure propagated");
    if (!result.has_value()) {
      EXPECT_EQ(static_cast<int>(ErrorCode::kPortIoFailure),
                static_cast<int>(result.error().code), "kPortIoFailure");
    }
    EXPECT_EQ(2u, FakePortBus::Accesses().size(),
              "no access after the failing one");
  }

  // === 测试 7: 探测当前状态 ===
  {
    FakePortBus::Reset(0xA2);
    auto probed = device->ProbeState();
    EXPECT_TRUE(probed.has_value(), "probe succeeds");
    if (probed.has_value()) {
      EXPECT_EQ(static_cast<int>(Page::kPage2),
                static_cast<int>(probed->page), "probed page");
      EXPECT_EQ(static_cast<int>(PowerState::kOn),
                static_cast<int>(probed->power), "probed power");
      EXPECT_EQ(0xA2, probed->raw, "raw CR value");
    }

    // STP 与 STA 同时置位时视为停止
    FakePortBus::Reset(0x23);
    probed = device->ProbeState();
    EXPECT_TRUE(probed.has_value() && probed->power == PowerState::kOff,
                "STP wins over STA");

    FakePortBus::Reset();
    FakePortBus::FailAt(0);
    probed = device->ProbeState();
    EXPECT_FALSE(probed.has_value(), "probe reports port failure");
  }

  // === 测试 8: 启动控制器后在运行状态下访问 ===
  {
    FakePortBus::Reset();
    auto c = pagereg::SetPower<PowerState::kOn, PageTurnStrategy::kTracked>()
                 .Then([] { return ne2000::AcknowledgeInterrupts(ne2000::kIsrAll); });
    auto result = device->Run<Page0Off>(c);
    EXPECT_TRUE(result.has_value(), "start then acknowledge");
    EXPECT_EQ(0x22, FakePortBus::Command(), "CR shows page 0 running");
  }

  TEST_SUITE_END();
}
