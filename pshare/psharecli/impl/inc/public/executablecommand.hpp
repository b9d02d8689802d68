#ifndef PSHARECLI_EXECUTABLECOMMAND_HPP_
#define PSHARECLI_EXECUTABLECOMMAND_HPP_

#include <string>

namespace pshare
{
// Forward declarations
class PShareNode;
}  // namespace pshare

namespace psharecli
{
class ExecutableCommand
{
public:
    virtual ~ExecutableCommand() = default;

    [[nodiscard]] virtual bool execute(
        pshare::PShareNode &node, std::string &error_message) const             = 0;
    [[nodiscard]] virtual bool should_terminate_program_after_execution() const = 0;
};
}  // namespace psharecli

#endif  // PSHARECLI_EXECUTABLECOMMAND_HPP_
