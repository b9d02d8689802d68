#include "psharetracker.hpp"

#include "psharetrackerimpl.hpp"

namespace pshare
{
PShareTracker::PShareTracker(const std::string &config_file_path)
    : impl_ {std::make_unique<PShareTrackerImpl>(config_file_path)}
{}

PShareTracker::PShareTracker(PShareTracker &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

PShareTracker &PShareTracker::operator=(PShareTracker &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

PShareTracker::~PShareTracker() = default;

bool PShareTracker::start()
{
    return impl_->start();
}

void PShareTracker::stop()
{
    impl_->stop();
}

unsigned short PShareTracker::port() const
{
    return impl_->port();
}
}  // namespace pshare
