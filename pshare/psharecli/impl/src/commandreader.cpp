#include "commandreader.hpp"

#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace psharecli
{
CommandReader::CommandReader(std::istream &input)
    : input_ {input}
{}

Command CommandReader::read_next_command() const
{
    std::string              input_line;
    std::vector<std::string> tokens;
    do
    {
        if (!std::getline(input_, input_line))
        {
            return {};
        }

        std::istringstream ss {input_line};
        tokens.assign(
            std::istream_iterator<std::string> {ss}, std::istream_iterator<std::string> {});
    } while (tokens.empty());

    return {tokens.front(), std::next(tokens.cbegin()), tokens.cend()};
}
}  // namespace psharecli
