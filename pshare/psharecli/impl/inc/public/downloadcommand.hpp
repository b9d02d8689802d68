#ifndef PSHARECLI_DOWNLOADCOMMAND_HPP_
#define PSHARECLI_DOWNLOADCOMMAND_HPP_

#include <string>

#include "executablecommand.hpp"

namespace psharecli
{
class DownloadCommand : public ExecutableCommand
{
public:
    explicit DownloadCommand(std::string manifest_path);

    [[nodiscard]] const std::string &manifest_path() const;

    [[nodiscard]] bool execute(pshare::PShareNode &node, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    std::string manifest_path_;
};
}  // namespace psharecli

#endif  // PSHARECLI_DOWNLOADCOMMAND_HPP_
