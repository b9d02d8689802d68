#include "uploadcommand.hpp"

#include "psharenode.hpp"

namespace psharecli
{
UploadCommand::UploadCommand(std::string file_path)
    : file_path_ {std::move(file_path)}
{}

const std::string &UploadCommand::file_path() const
{
    return file_path_;
}

bool UploadCommand::execute(pshare::PShareNode &node, std::string &error_message) const
{
    return node.share_file(file_path_, error_message);
}

bool UploadCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace psharecli
