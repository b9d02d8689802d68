#include "psharenode.hpp"

#include "psharenodeimpl.hpp"

namespace pshare
{
PShareNode::PShareNode(const std::string &config_file_path)
    : impl_ {std::make_unique<PShareNodeImpl>(config_file_path)}
{}

PShareNode::PShareNode(PShareNode &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

PShareNode &PShareNode::operator=(PShareNode &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

PShareNode::~PShareNode() = default;

bool PShareNode::register_listener(const std::shared_ptr<PShareNodeListener> &listener)
{
    return impl_->register_listener(listener);
}

bool PShareNode::unregister_listener(const std::shared_ptr<PShareNodeListener> &listener)
{
    return impl_->unregister_listener(listener);
}

bool PShareNode::share_file(const std::string &file_path, std::string &error_string)
{
    return impl_->share_file(file_path, error_string);
}

bool PShareNode::stop_sharing()
{
    return impl_->stop_sharing();
}

bool PShareNode::is_sharing() const
{
    return impl_->is_sharing();
}

bool PShareNode::download_file(const std::string &manifest_path, std::string &error_string)
{
    return impl_->download_file(manifest_path, error_string);
}
}  // namespace pshare
