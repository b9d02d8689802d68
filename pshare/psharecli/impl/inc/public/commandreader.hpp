#ifndef PSHARECLI_COMMANDREADER_HPP_
#define PSHARECLI_COMMANDREADER_HPP_

#include <istream>

#include "command.hpp"

namespace psharecli
{
class CommandReader
{
public:
    explicit CommandReader(std::istream &input);

    // Skips blank lines; returns an invalid command once the input is exhausted
    [[nodiscard]] Command read_next_command() const;

private:
    std::istream &input_;
};
}  // namespace psharecli

#endif  // PSHARECLI_COMMANDREADER_HPP_
