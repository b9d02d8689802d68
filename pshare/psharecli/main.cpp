#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <glog/logging.h>

#include "commandinterpreter.hpp"
#include "commandreader.hpp"
#include "psharenode.hpp"
#include "pshareversion.hpp"
#include "transferprogressprinter.hpp"

namespace
{
constexpr char const *config_file_name                   = "config.json";
constexpr int         transfer_progress_print_timeout_ms = 1000;

constexpr char const *default_configuration = R"({
    "port": 9000,
    "announce_address": "localhost",
    "tracker_address": "localhost",
    "tracker_port": 8080,
    "chunk_size": 1048576,
    "downloads_dir": "downloads",
    "max_concurrent_uploads": 0
}
)";

std::string get_app_data_dir()
{
    const char *home = std::getenv("HOME");
    return (std::filesystem::path {home ? home : "."} / ".pshare").string();
}

bool write_file_if_not_exists(const std::string &path, const std::string &content)
{
    if (std::filesystem::exists(path))
    {
        return true;
    }

    std::ofstream fs {path};
    if (!fs)
    {
        std::cout << "Cannot open " << path << " for writing\n";
        return false;
    }
    fs << content;
    return true;
}

// Executes one command; returns false if the program should stop afterwards
bool run_command(const psharecli::Command &cmd, const psharecli::CommandInterpreter &interpreter,
    pshare::PShareNode &node, int &exit_status)
{
    std::string error_message;
    auto        exec_cmd = cmd ? interpreter.interpret(cmd, error_message) :
                          interpreter.make_exit_command();
    if (!exec_cmd)
    {
        std::cout << "Invalid command: " << error_message << '\n';
        exit_status = EXIT_FAILURE;
        return true;
    }

    bool exec_success = exec_cmd->execute(node, error_message);
    exit_status       = exec_success ? EXIT_SUCCESS : EXIT_FAILURE;
    if (!exec_success)
    {
        std::cout << error_message << '\n';
    }

    return !exec_cmd->should_terminate_program_after_execution();
}
}  // namespace

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::cout << "pshare command line utility " << PSHARECLI_VERSION << " (lib version "
              << pshare::pshare_version << ")\n\n";

    std::string     app_data_dir {get_app_data_dir()};
    std::error_code ec;
    std::filesystem::create_directories(app_data_dir, ec);
    if (ec)
    {
        std::cout << "Error while creating app data directory " << app_data_dir << ": "
                  << ec.message() << "\n";
        return EXIT_FAILURE;
    }

    auto config_file_path = (std::filesystem::path {app_data_dir} / config_file_name).string();
    if (!write_file_if_not_exists(config_file_path, default_configuration))
    {
        return EXIT_FAILURE;
    }

    pshare::PShareNode node {config_file_path};
    auto               progress_printer = std::make_shared<psharecli::TransferProgressPrinter>(
        std::cout, transfer_progress_print_timeout_ms);
    node.register_listener(progress_printer);

    psharecli::CommandInterpreter cmd_interpreter;
    int                           exit_status = EXIT_SUCCESS;

    if (argc > 1)
    {
        psharecli::Command cmd {argv[1], argv + 2, argv + argc};
        if (!run_command(cmd, cmd_interpreter, node, exit_status) || !node.is_sharing())
        {
            // Downloads and failed uploads end the program; a running upload keeps serving
            return exit_status;
        }
    }

    psharecli::CommandReader cmd_reader {std::cin};
    for (;;)
    {
        std::cout << "> ";
        psharecli::Command cmd = cmd_reader.read_next_command();
        if (!run_command(cmd, cmd_interpreter, node, exit_status))
        {
            break;
        }
    }

    return exit_status;
}
