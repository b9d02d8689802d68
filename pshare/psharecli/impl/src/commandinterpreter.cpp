#include "commandinterpreter.hpp"

#include "downloadcommand.hpp"
#include "exitcommand.hpp"
#include "uploadcommand.hpp"

namespace psharecli
{
namespace
{
constexpr char const *upload_command_name   = "upload";
constexpr char const *download_command_name = "download";
constexpr char const *exit_command_name     = "exit";
}  // namespace

std::unique_ptr<ExecutableCommand> CommandInterpreter::interpret(
    const Command &command, std::string &err) const
{
    if (!command)
    {
        err = "Invalid command object";
        return nullptr;
    }

    if (command.cmd == upload_command_name)
    {
        if (command.args.size() != 1)
        {
            err = "Usage: upload {file_path}";
            return nullptr;
        }
        return std::make_unique<UploadCommand>(command.args[0]);
    }
    else if (command.cmd == download_command_name)
    {
        if (command.args.size() != 1)
        {
            err = "Usage: download {manifest_path}";
            return nullptr;
        }
        return std::make_unique<DownloadCommand>(command.args[0]);
    }
    else if (command.cmd == exit_command_name)
    {
        if (!command.args.empty())
        {
            err = "Usage: exit";
            return nullptr;
        }
        return std::make_unique<ExitCommand>();
    }
    else
    {
        err = "Unknown command";
        return nullptr;
    }
}

std::unique_ptr<ExecutableCommand> CommandInterpreter::make_exit_command() const
{
    return std::make_unique<ExitCommand>();
}
}  // namespace psharecli
