#ifndef PSHARE_UTILS_COMPLETIONTOKEN_HPP_
#define PSHARE_UTILS_COMPLETIONTOKEN_HPP_

#include <chrono>
#include <memory>

namespace pshare::utils
{
class CompletionToken
{
public:
    CompletionToken();

    void               cancel() const;
    [[nodiscard]] bool is_cancelled() const;
    [[nodiscard]] bool is_completed() const;
    void               complete() const;
    void               wait_for_completion() const;
    bool               wait_for_completion(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_COMPLETIONTOKEN_HPP_
