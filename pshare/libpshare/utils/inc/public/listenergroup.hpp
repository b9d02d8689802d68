#ifndef PSHARE_UTILS_LISTENERGROUP_HPP_
#define PSHARE_UTILS_LISTENERGROUP_HPP_

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace pshare::utils
{
// Holds weak references to listeners; expired ones are dropped on the next notification
template<typename T>
class ListenerGroup
{
public:
    using Listener = T;

    bool add(const std::shared_ptr<Listener> &listener)
    {
        if (!listener)
        {
            return false;
        }

        std::lock_guard lock {mutex_};
        if (find(listener.get()) != listeners_.end())
        {
            return false;
        }
        listeners_.emplace_back(listener.get(), listener);
        return true;
    }

    bool remove(const std::shared_ptr<Listener> &listener)
    {
        std::lock_guard lock {mutex_};
        auto            it = find(listener.get());
        if (it == listeners_.end())
        {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    template<typename M, typename... Args>
    void notify(M method, Args &&... args)
    {
        std::vector<std::shared_ptr<Listener>> alive;

        {
            std::lock_guard lock {mutex_};
            alive.reserve(listeners_.size());
            listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                 [&alive](const auto &entry) {
                                     auto listener = entry.second.lock();
                                     if (!listener)
                                     {
                                         return true;
                                     }
                                     alive.push_back(std::move(listener));
                                     return false;
                                 }),
                listeners_.end());
        }

        for (const auto &listener : alive)
        {
            ((*listener).*method)(args...);
        }
    }

private:
    using Entry = std::pair<const Listener *, std::weak_ptr<Listener>>;

    typename std::vector<Entry>::iterator find(const Listener *key)
    {
        return std::find_if(listeners_.begin(), listeners_.end(),
            [key](const Entry &entry) { return entry.first == key; });
    }

    std::vector<Entry> listeners_;
    std::mutex         mutex_;
};
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_LISTENERGROUP_HPP_
