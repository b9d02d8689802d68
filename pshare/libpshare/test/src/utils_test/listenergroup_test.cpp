#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "listenergroup.hpp"

using namespace ::testing;
using namespace ::pshare::utils;

namespace
{
class Listener
{
public:
    void on_event(int value, const std::string &text)
    {
        events.emplace_back(std::to_string(value) + text);
    }

    std::vector<std::string> events;
};

class ListenerGroupTest : public Test
{
protected:
    ListenerGroup<Listener> group_;
};
}  // namespace

TEST_F(ListenerGroupTest, NotifyAllListeners)
{
    auto l1 = std::make_shared<Listener>();
    auto l2 = std::make_shared<Listener>();
    EXPECT_TRUE(group_.add(l1));
    EXPECT_TRUE(group_.add(l2));

    group_.notify(&Listener::on_event, 7, std::string {"x"});

    EXPECT_EQ(l1->events, std::vector<std::string> {"7x"});
    EXPECT_EQ(l2->events, std::vector<std::string> {"7x"});
}

TEST_F(ListenerGroupTest, AddTwiceFails)
{
    auto l = std::make_shared<Listener>();
    EXPECT_TRUE(group_.add(l));
    EXPECT_FALSE(group_.add(l));

    group_.notify(&Listener::on_event, 1, std::string {});
    EXPECT_EQ(l->events.size(), 1);
}

TEST_F(ListenerGroupTest, AddNullFails)
{
    EXPECT_FALSE(group_.add(nullptr));
}

TEST_F(ListenerGroupTest, RemovedListenerIsNotNotified)
{
    auto l = std::make_shared<Listener>();
    group_.add(l);
    EXPECT_TRUE(group_.remove(l));
    EXPECT_FALSE(group_.remove(l));

    group_.notify(&Listener::on_event, 1, std::string {});
    EXPECT_TRUE(l->events.empty());
}

TEST_F(ListenerGroupTest, ExpiredListenerIsSkipped)
{
    auto alive = std::make_shared<Listener>();
    group_.add(alive);
    {
        auto expired = std::make_shared<Listener>();
        group_.add(expired);
    }

    group_.notify(&Listener::on_event, 2, std::string {"y"});
    EXPECT_EQ(alive->events, std::vector<std::string> {"2y"});
}
