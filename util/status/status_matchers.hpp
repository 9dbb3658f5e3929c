#ifndef UTIL_STATUS_STATUS_MATCHERS_HPP_
#define UTIL_STATUS_STATUS_MATCHERS_HPP_

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/status/status_macros.hpp"

namespace util::status {

namespace internal {

inline absl::Status const& GetStatus(absl::Status const& status) {
  return status;
}

template <class T>
absl::Status const& GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

template <class ValueMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(ValueMatcher value_matcher)
      : value_matcher_(std::move(value_matcher)) {}

  template <class StatusType>
  operator testing::Matcher<StatusType>() const {
    return testing::Matcher<StatusType>(new Impl<StatusType>(value_matcher_));
  }

 private:
  template <class StatusType>
  class Impl : public testing::MatcherInterface<StatusType> {
   public:
    using ValueType = typename std::decay_t<StatusType>::value_type;
    explicit Impl(ValueMatcher const& value_matcher)
        : value_matcher_(
              testing::SafeMatcherCast<ValueType const&>(value_matcher)) {}

    void DescribeTo(std::ostream* os) const override {
      *os << "is OK and holds a value that ";
      value_matcher_.DescribeTo(os);
    }

    void DescribeNegationTo(std::ostream* os) const override {
      *os << "is not OK or holds a value that ";
      value_matcher_.DescribeNegationTo(os);
    }

    bool MatchAndExplain(
        StatusType const& status_or,
        testing::MatchResultListener* listener) const override {
      if (!status_or.ok()) {
        *listener << "which is not OK: " << status_or.status();
        return false;
      }
      *listener << "whose value ";
      return value_matcher_.MatchAndExplain(*status_or, listener);
    }

   private:
    testing::Matcher<ValueType const&> value_matcher_;
  };

  ValueMatcher const value_matcher_;
};

class StatusIsImpl {
 public:
  StatusIsImpl(absl::StatusCode code, testing::Matcher<std::string> message)
      : code_(code), message_(std::move(message)) {}

  void DescribeTo(std::ostream* os) const {
    *os << "has code " << absl::StatusCodeToString(code_)
        << " and a message that ";
    message_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "does not have code " << absl::StatusCodeToString(code_)
        << " or has a message that ";
    message_.DescribeNegationTo(os);
  }

  template <class T>
  bool MatchAndExplain(T const& value,
                       testing::MatchResultListener* listener) const {
    absl::Status const& status = GetStatus(value);
    if (status.code() != code_) {
      *listener << "whose status is " << status;
      return false;
    }
    return message_.MatchAndExplain(std::string(status.message()), listener);
  }

 private:
  absl::StatusCode code_;
  testing::Matcher<std::string> message_;
};

}  // namespace internal

class IsOkImpl {
 public:
  void DescribeTo(std::ostream* os) const { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const { *os << "is not OK"; }
  template <class T>
  bool MatchAndExplain(T const& value,
                       testing::MatchResultListener* listener) const {
    if (!value.ok()) {
      *listener << "which is not OK: " << internal::GetStatus(value);
      return false;
    }
    return true;
  }
};

inline testing::PolymorphicMatcher<IsOkImpl> IsOk() {
  return testing::MakePolymorphicMatcher(IsOkImpl());
}

inline testing::PolymorphicMatcher<internal::StatusIsImpl> StatusIs(
    absl::StatusCode code,
    testing::Matcher<std::string> message = testing::_) {
  return testing::MakePolymorphicMatcher(
      internal::StatusIsImpl(code, std::move(message)));
}

template <class ValueMatcher>
internal::IsOkAndHoldsMatcher<std::decay_t<ValueMatcher>> IsOkAndHolds(
    ValueMatcher&& matcher) {
  return internal::IsOkAndHoldsMatcher<std::decay_t<ValueMatcher>>(
      std::forward<ValueMatcher>(matcher));
}

#define ASSERT_OK(x) ASSERT_THAT(x, ::util::status::IsOk())
#define EXPECT_OK(x) EXPECT_THAT(x, ::util::status::IsOk())
#define ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                              \
  ASSERT_OK(statusor);                                  \
  lhs = std::move(statusor).value()
#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                       \
  ASSERT_OK_AND_ASSIGN_IMPL(STATUS_MACROS_CONCAT_(_status_or_value, __LINE__), \
                            lhs, rexpr)

}  // namespace util::status

#endif
