#ifndef PSHARE_TRACKER_TRACKERSERVER_HPP_
#define PSHARE_TRACKER_TRACKERSERVER_HPP_

namespace pshare::tracker
{
class TrackerServer
{
public:
    virtual ~TrackerServer() = default;

    virtual bool                         start()      = 0;
    virtual void                         stop()       = 0;
    [[nodiscard]] virtual unsigned short port() const = 0;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERSERVER_HPP_
