#ifndef PSHARE_UTILS_DEFER_HPP_
#define PSHARE_UTILS_DEFER_HPP_

#include <functional>
#include <utility>

namespace pshare::utils
{
// Runs a callable when leaving the enclosing scope, unless dismissed
class Defer
{
public:
    explicit Defer(std::function<void()> call)
        : call_ {std::move(call)}
    {}

    Defer(const Defer &) = delete;
    Defer &operator=(const Defer &) = delete;

    ~Defer()
    {
        if (call_)
        {
            call_();
        }
    }

    void dismiss()
    {
        call_ = nullptr;
    }

private:
    std::function<void()> call_;
};
}  // namespace pshare::utils

#define PSHARE_DEFER_CONCAT_IMPL(a, b) a##b
#define PSHARE_DEFER_CONCAT(a, b)      PSHARE_DEFER_CONCAT_IMPL(a, b)
#define DEFER(...) \
    ::pshare::utils::Defer PSHARE_DEFER_CONCAT(defer_obj_, __COUNTER__)([&] { __VA_ARGS__; })

#endif  // PSHARE_UTILS_DEFER_HPP_
