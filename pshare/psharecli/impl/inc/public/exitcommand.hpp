#ifndef PSHARECLI_EXITCOMMAND_HPP_
#define PSHARECLI_EXITCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace psharecli
{
class ExitCommand : public ExecutableCommand
{
public:
    [[nodiscard]] bool execute(pshare::PShareNode &node, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;
};
}  // namespace psharecli

#endif  // PSHARECLI_EXITCOMMAND_HPP_
