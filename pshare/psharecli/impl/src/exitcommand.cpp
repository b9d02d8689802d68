#include "exitcommand.hpp"

#include <iostream>

#include "psharenode.hpp"

namespace psharecli
{
bool ExitCommand::execute(pshare::PShareNode &node, std::string & /*error_message*/) const
{
    if (node.is_sharing())
    {
        std::cout << "\nStopping upload...\n";
        node.stop_sharing();
    }
    return true;
}

bool ExitCommand::should_terminate_program_after_execution() const
{
    return true;
}
}  // namespace psharecli
