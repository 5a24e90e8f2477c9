#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace multibar {
namespace cli {

// Copies stdin to stdout line by line while a bar on stderr counts the lines.
class PipeCommand : public MainCommand {
public:
    PipeCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    uint64_t total_ = 0;
    std::string label_;
    std::string style_;

    int copyLines(std::istream& in, std::ostream& out);
};

}}
