/**
 * @copyright Copyright The pagereg Contributors
 */

#ifndef PAGEREG_INCLUDE_PAGEREG_DETAIL_COMPUTATION_HPP_
#define PAGEREG_INCLUDE_PAGEREG_DETAIL_COMPUTATION_HPP_

#include <concepts>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

#include "pagereg/defs.h"
#include "pagereg/detail/state.hpp"
#include "pagereg/expected.hpp"

namespace pagereg {

template <StateTag From, StateTag To, typename T, typename Body, uint8_t Pages>
class Computation;

namespace detail {

template <typename T>
struct IsComputation : std::false_type {};

template <StateTag From, StateTag To, typename T, typename Body, uint8_t Pages>
struct IsComputation<Computation<From, To, T, Body, Pages>> : std::true_type {};

/**
 * @brief 构造与执行 Computation 的唯一入口
 *
 * 仅供设备句柄和组合子使用：用户代码只能通过设备的 Run() 执行计算，
 * 并且必须在那里声明起始状态；也不能凭空构造声明任意起止状态的计算。
 */
struct ComputationAccess {
  template <typename C, typename Body>
  static constexpr auto Make(Body body) -> C {
    return C(std::move(body));
  }

  template <typename C, typename Regs>
  static auto Execute(const C& computation, const Regs& regs) {
    return computation.body_(regs);
  }
};

template <typename F, typename T>
struct ContinuationResult {
  using type = std::invoke_result_t<const F&, T>;
};

template <typename F>
struct ContinuationResult<F, void> {
  using type = std::invoke_result_t<const F&>;
};

}  // namespace detail

/// @brief 已确定起始状态的计算
template <typename C>
concept AnyComputation = detail::IsComputation<std::remove_cvref_t<C>>::value;

/**
 * @brief 状态泛型步骤：在被放置到某个状态之前不确定起始状态
 *
 * 寄存器操作、页切换、运行状态切换都是状态泛型步骤，At<Entry>()
 * 在 Entry 不满足其要求时不参与重载决议。
 */
template <typename S, typename Entry>
concept StateGenericAt =
    StateTag<Entry> && requires(const std::remove_cvref_t<S>& step) {
      step.template At<Entry>();
    };

/**
 * @brief 步骤 S 能否放置在状态 Entry 上
 *
 * Computation 要求其起始状态与 Entry 完全相同；状态泛型步骤要求
 * At<Entry>() 可用。
 */
template <typename S, typename Entry>
concept PlaceableAt =
    StateTag<Entry> &&
    ((AnyComputation<S> &&
      kSameState<typename std::remove_cvref_t<S>::EntryState, Entry>) ||
     (!AnyComputation<S> && StateGenericAt<S, Entry>));

/**
 * @brief 将步骤放置到状态 Entry 上，得到起始状态确定的 Computation
 */
template <StateTag Entry, typename S>
  requires PlaceableAt<S, Entry>
constexpr auto PlaceAt(S&& step) {
  if constexpr (AnyComputation<S>) {
    return std::remove_cvref_t<S>(std::forward<S>(step));
  } else {
    return step.template At<Entry>();
  }
}

template <typename S, typename Entry>
using PlacedAt = decltype(PlaceAt<Entry>(std::declval<S>()));

template <typename F, typename T>
using ContinuationResultT = typename detail::ContinuationResult<F, T>::type;

template <typename F, typename T>
concept ContinuationOf = (std::is_void_v<T> && std::invocable<const F&>) ||
                         (!std::is_void_v<T> && std::invocable<const F&, T>);

/**
 * @brief F 的结果能否接在退出状态为 Exit、结果类型为 T 的计算之后
 */
template <typename F, typename T, typename Exit>
concept ChainsFrom =
    ContinuationOf<F, T> && PlaceableAt<ContinuationResultT<F, T>, Exit>;

/**
 * @brief 带页/运行状态类型标签的寄存器计算
 *
 * 一个 Computation 描述一串按声明顺序执行的端口访问：
 * 从 From 状态开始，结束于 To 状态，产生 T 类型的结果。
 * 只能通过 Then() 追加后续步骤，且后续步骤的起始状态必须等于 To，
 * 否则 Then() 不参与重载决议，程序无法通过编译。
 *
 * 计算本身不持有设备，只有交给设备句柄的 Run() 才会产生 I/O。
 * 任一步骤失败时后续步骤不再执行，错误原样返回。
 *
 * @tparam From  起始状态
 * @tparam To    退出状态
 * @tparam T     结果类型（可为 void）
 * @tparam Body  执行体，签名 (const Regs&) -> Expected<T>
 * @tparam Pages 该计算会选中的页集合（PageBit 位图）
 */
template <StateTag From, StateTag To, typename T, typename Body, uint8_t Pages>
class Computation {
 public:
  using EntryState = From;
  using ExitState = To;
  using ValueType = T;
  static constexpr uint8_t kPagesTouched = Pages;

  /**
   * @brief 顺序组合
   *
   * 先执行本计算，将结果交给 next，再执行 next 返回的步骤。
   * next 返回的步骤被放置在本计算的退出状态上。
   *
   * @param next 签名 () -> Step（T 为 void 时）或 (T) -> Step
   * @return From 到 next 所返回步骤退出状态的新计算
   */
  template <typename F>
    requires ChainsFrom<F, T, To>
  [[nodiscard]] constexpr auto Then(F next) const {
    using Next = PlacedAt<ContinuationResultT<F, T>, To>;
    using U = typename Next::ValueType;

    auto body = [first = body_,
                 next = std::move(next)](const auto& regs) -> Expected<U> {
      auto head = first(regs);
      if (!head) {
        return std::unexpected(head.error());
      }
      if constexpr (std::is_void_v<T>) {
        return detail::ComputationAccess::Execute(PlaceAt<To>(next()), regs);
      } else {
        return detail::ComputationAccess::Execute(
            PlaceAt<To>(next(std::move(*head))), regs);
      }
    };
    return detail::ComputationAccess::Make<
        Computation<From, typename Next::ExitState, U, decltype(body),
                    static_cast<uint8_t>(Pages | Next::kPagesTouched)>>(
        std::move(body));
  }

 private:
  friend struct detail::ComputationAccess;

  Body body_;

  explicit constexpr Computation(Body body) : body_(std::move(body)) {}
};

namespace detail {

/**
 * @brief 以执行体构造一个原子步骤
 *
 * 执行体直接访问端口，起止状态由调用方声明而不经检查，因此只供
 * 寄存器读写、页切换、运行状态切换与本文件中的组合子使用。
 */
template <StateTag From, StateTag To, typename T, uint8_t Pages = 0,
          typename Body>
constexpr auto MakeStep(Body body) -> Computation<From, To, T, Body, Pages> {
  return ComputationAccess::Make<Computation<From, To, T, Body, Pages>>(
      std::move(body));
}

}  // namespace detail

/// @brief 不做任何 I/O 的计算，起止状态均为 S
template <StateTag S>
constexpr auto Unit() {
  return detail::MakeStep<S, S, void>(
      [](const auto& /*regs*/) -> Expected<void> { return {}; });
}

/// @brief 不做任何 I/O、直接产生 value 的计算
template <StateTag S, typename T>
constexpr auto Pure(T value) {
  return detail::MakeStep<S, S, T>(
      [value](const auto& /*regs*/) -> Expected<T> { return value; });
}

template <typename Head, typename F>
class Chained;

/**
 * @brief 状态泛型步骤的 CRTP 基类
 *
 * 提供 Then()：组合结果仍是状态泛型的，放置时才检查各步骤的状态。
 *
 * @tparam Derived 具体步骤类型，需提供 template <StateTag> At()
 */
template <class Derived>
class GenericStep {
 public:
  template <typename F>
  [[nodiscard]] constexpr auto Then(F next) const -> Chained<Derived, F> {
    return Chained<Derived, F>(static_cast<const Derived&>(*this),
                               std::move(next));
  }
};

/**
 * @brief 状态泛型步骤与后续步骤的组合
 */
template <typename Head, typename F>
class Chained : public GenericStep<Chained<Head, F>> {
 public:
  constexpr Chained(Head head, F next)
      : head_(std::move(head)), next_(std::move(next)) {}

  template <StateTag Entry>
    requires requires(const Head& head, const F& next) {
      head.template At<Entry>().Then(next);
    }
  [[nodiscard]] constexpr auto At() const {
    return head_.template At<Entry>().Then(next_);
  }

 private:
  Head head_;
  F next_;
};

/**
 * @brief 状态泛型的 Pure
 */
template <typename T>
class Returned : public GenericStep<Returned<T>> {
 public:
  explicit constexpr Returned(T value) : value_(std::move(value)) {}

  template <StateTag Entry>
  [[nodiscard]] constexpr auto At() const {
    return Pure<Entry>(value_);
  }

 private:
  T value_;
};

template <typename T>
constexpr auto Return(T value) -> Returned<T> {
  return Returned<T>(std::move(value));
}

/**
 * @brief 反复执行保持状态不变的步骤，直到谓词成立
 *
 * 最多执行 max_attempts 次；仍不成立时返回 kTimeout。
 * 步骤本身失败时立即返回该错误。
 */
template <typename Step, typename Pred>
class Poll : public GenericStep<Poll<Step, Pred>> {
 public:
  constexpr Poll(Step step, Pred done, uint32_t max_attempts)
      : step_(std::move(step)),
        done_(std::move(done)),
        max_attempts_(max_attempts) {}

  template <StateTag Entry>
    requires PlaceableAt<const Step&, Entry> &&
             kSameState<typename PlacedAt<const Step&, Entry>::ExitState,
                        Entry> &&
             std::predicate<const Pred&,
                            typename PlacedAt<const Step&, Entry>::ValueType>
  [[nodiscard]] constexpr auto At() const {
    using Placed = PlacedAt<const Step&, Entry>;
    using T = typename Placed::ValueType;

    auto body = [step = PlaceAt<Entry>(step_), done = done_,
                 max_attempts = max_attempts_](const auto& regs)
        -> Expected<T> {
      for (uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
        auto value = detail::ComputationAccess::Execute(step, regs);
        if (!value || done(*value)) {
          return value;
        }
      }
      return std::unexpected(Error{ErrorCode::kTimeout});
    };
    return detail::MakeStep<Entry, Entry, T, Placed::kPagesTouched>(
        std::move(body));
  }

 private:
  Step step_;
  Pred done_;
  uint32_t max_attempts_;
};

template <typename Step, typename Pred>
constexpr auto PollUntil(Step step, Pred done, uint32_t max_attempts)
    -> Poll<Step, Pred> {
  return Poll<Step, Pred>(std::move(step), std::move(done), max_attempts);
}

}  // namespace pagereg

#endif /* PAGEREG_INCLUDE_PAGEREG_DETAIL_COMPUTATION_HPP_ */
