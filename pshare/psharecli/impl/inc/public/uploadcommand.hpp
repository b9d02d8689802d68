#ifndef PSHARECLI_UPLOADCOMMAND_HPP_
#define PSHARECLI_UPLOADCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace psharecli
{
class UploadCommand : public ExecutableCommand
{
public:
    explicit UploadCommand(std::string file_path);

    [[nodiscard]] const std::string &file_path() const;

    [[nodiscard]] bool execute(pshare::PShareNode &node, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string file_path_;
};
}  // namespace psharecli

#endif  // PSHARECLI_UPLOADCOMMAND_HPP_
