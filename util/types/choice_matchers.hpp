#ifndef UTIL_TYPES_CHOICE_MATCHERS_HPP
#define UTIL_TYPES_CHOICE_MATCHERS_HPP

#include <ostream>
#include <type_traits>

#include "gmock/gmock.h"

namespace util {

namespace internal {
template <class ChoiceT>
class ChoiceOfImpl {
 public:
  explicit ChoiceOfImpl(testing::Matcher<ChoiceT const&> const& matcher)
      : matcher_(matcher) {}

  void DescribeTo(std::ostream* os) const {
    *os << "holds the expected alternative that ";
    matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "does not hold the expected alternative that ";
    matcher_.DescribeTo(os);
  }

  template <class T>
  bool MatchAndExplain(T const& value,
                       testing::MatchResultListener* listener) const {
    if (!value.template has<ChoiceT>()) {
      *listener << "holds alternative #" << value.index();
      return false;
    }
    return matcher_.MatchAndExplain(value.template as<ChoiceT>(), listener);
  }

 private:
  testing::Matcher<ChoiceT const&> matcher_;
};

}  // namespace internal

// Matches a ChoiceBase value that holds a ChoiceT that matches `matcher`.
template <class ChoiceT>
testing::PolymorphicMatcher<internal::ChoiceOfImpl<ChoiceT>> ChoiceOf(
    testing::Matcher<ChoiceT const&> const& matcher) {
  return testing::MakePolymorphicMatcher(
      internal::ChoiceOfImpl<ChoiceT>(matcher));
}

}  // namespace util
#endif
