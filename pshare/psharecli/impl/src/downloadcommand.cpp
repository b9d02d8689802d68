#include "downloadcommand.hpp"

#include "psharenode.hpp"

namespace psharecli
{
DownloadCommand::DownloadCommand(std::string manifest_path)
    : manifest_path_ {std::move(manifest_path)}
{}

const std::string &DownloadCommand::manifest_path() const
{
    return manifest_path_;
}

bool DownloadCommand::execute(pshare::PShareNode &node, std::string &error_message) const
{
    return node.download_file(manifest_path_, error_message);
}

bool DownloadCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace psharecli
