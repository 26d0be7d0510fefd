/**
 * @file ne2000_example.cpp
 * @brief 在 x86 Linux 用户态访问 ISA NE2000 寄存器组的示例
 * @copyright Copyright The pagereg Contributors
 *
 * 需要 root 权限（ioperm）。用法：ne2000_example [base]，base 默认 0x300。
 * 示例先探测 CR，然后停止控制器、配置数据通路并读取错误计数器。
 */

#include <sys/io.h>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include "base_argument.hpp"
#include "pagereg/ne2000.hpp"
#include "pagereg/x86_port_io.hpp"

using namespace pagereg;

namespace {

struct LinuxTraits : X86PortIo {
  static auto Log(const char* fmt, ...) -> int {
    va_list ap;
    va_start(ap, fmt);
    int ret = std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
    return ret;
  }
};

using Nic = ne2000::Ne2000<LinuxTraits>;
using Page0Off = DeviceState<Page::kPage0, PowerState::kOff>;

/**
 * @brief 示例 1：探测后按硬件当前状态选择起始状态
 *
 * 计算的起始状态是编译期类型，探测结果只能在已知的几种状态之间分派。
 */
auto StopFromProbedState(const Nic& nic) -> Expected<uint8_t> {
  auto probed = nic.ProbeState();
  if (!probed) {
    return std::unexpected(probed.error());
  }
  std::printf("CR=0x%02x page=%u %s\n", static_cast<unsigned>(probed->raw),
              static_cast<unsigned>(probed->page),
              probed->power == PowerState::kOn ? "running" : "stopped");

  constexpr uint32_t kMaxPolls = 1000;
  auto stop = ne2000::StopController(kMaxPolls);
  switch (probed->page) {
    case Page::kPage0:
      return probed->power == PowerState::kOn
                 ? nic.Run<DeviceState<Page::kPage0, PowerState::kOn>>(stop)
                 : nic.Run<DeviceState<Page::kPage0, PowerState::kOff>>(stop);
    case Page::kPage1:
      return probed->power == PowerState::kOn
                 ? nic.Run<DeviceState<Page::kPage1, PowerState::kOn>>(stop)
                 : nic.Run<DeviceState<Page::kPage1, PowerState::kOff>>(stop);
    case Page::kPage2:
      return probed->power == PowerState::kOn
                 ? nic.Run<DeviceState<Page::kPage2, PowerState::kOn>>(stop)
                 : nic.Run<DeviceState<Page::kPage2, PowerState::kOff>>(stop);
    default:
      // DP8390 没有 Page 3
      return std::unexpected(Error{ErrorCode::kStartingStateMismatch});
  }
}

/**
 * @brief 示例 2：停止状态下初始化接收环
 */
auto InitReceiveRing(const Nic& nic) -> Expected<uint8_t> {
  auto dcr = static_cast<uint8_t>(ne2000::kDcrNormal | ne2000::kDcrFifo8Bytes);
  auto init =
      ne2000::SetPageStart(0x46)
          .Then([] { return ne2000::SetPageStop(0x80); })
          .Then([] { return ne2000::SetBoundary(0x46); })
          .Then([] {
            return ne2000::AcknowledgeInterrupts(ne2000::kIsrAll);
          })
          .Then([] { return TurnToPage<Page::kPage1>(); })
          .Then([] { return ne2000::SetCurrentPage(0x47); })
          .Then([] { return TurnToPage<Page::kPage0>(); })
          .Then([dcr] { return ne2000::ConfigureDataPath(dcr); });
  return nic.Run<Page0Off>(init);
}

}  // namespace

auto main(int argc, char** argv) -> int {
  PortAddress base = 0x300;
  if (argc > 1) {
    auto parsed = ParseBaseArgument(argv[1]);
    if (!parsed) {
      std::fprintf(stderr, "base %s: %s\n", argv[1],
                   parsed.error().message());
      return EXIT_FAILURE;
    }
    base = *parsed;
  }

  auto nic = Nic::Create(base);
  if (!nic) {
    std::fprintf(stderr, "create: %s\n", nic.error().message());
    return EXIT_FAILURE;
  }

  if (ioperm(base, kRegisterCount, 1) != 0) {
    std::perror("ioperm");
    return EXIT_FAILURE;
  }

  auto isr = StopFromProbedState(*nic);
  if (!isr) {
    std::fprintf(stderr, "stop: %s\n", isr.error().message());
    return EXIT_FAILURE;
  }
  std::printf("stopped, ISR=0x%02x\n", static_cast<unsigned>(*isr));

  auto dcr = InitReceiveRing(*nic);
  if (!dcr) {
    std::fprintf(stderr, "init: %s\n", dcr.error().message());
    return EXIT_FAILURE;
  }
  std::printf("DCR=0x%02x\n", static_cast<unsigned>(*dcr));

  auto counters = nic->Run<Page0Off>(ne2000::ReadErrorCounters());
  if (!counters) {
    std::fprintf(stderr, "counters: %s\n", counters.error().message());
    return EXIT_FAILURE;
  }
  std::printf("frame alignment=%u crc=%u missed=%u\n",
              static_cast<unsigned>(counters->frame_alignment),
              static_cast<unsigned>(counters->crc),
              static_cast<unsigned>(counters->missed));
  return EXIT_SUCCESS;
}
