#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace multibar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;

    CLI::App* set_cmd_;
    std::string set_key_;
    std::string set_value_;

    CLI::App* get_cmd_;
    std::string get_key_;

    CLI::App* show_cmd_;
    CLI::App* validate_cmd_;
    CLI::App* path_cmd_;

    int executeSet();
    int executeGet();
    int executeShow();
    int executeValidate();
    int executePath();

    bool canWriteConfig(const std::string& config_path);
};

}}
