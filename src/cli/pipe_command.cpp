#include "pipe_command.hpp"
#include "multibar/common/config.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/core/display.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/terminal/terminal.hpp"
#include <iostream>
#include <optional>

namespace multibar {
namespace cli {

PipeCommand::PipeCommand() : was_called_(false) {}

void PipeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--total", total_, "Expected number of lines (0 = unknown)");
    subcommand->add_option("--label", label_, "Bar label");
    subcommand->add_option("--style", style_, "Bar style (ascii, block, balloon, custom:<glyphs>)");

    subcommand->callback([this]() { was_called_ = true; });
}

bool PipeCommand::wasCalled() const {
    return was_called_;
}

int PipeCommand::execute() {
    return copyLines(std::cin, std::cout);
}

int PipeCommand::copyLines(std::istream& in, std::ostream& out) {
    common::DisplayConfig settings = common::Config::instance().global().display;
    settings.stream = "stderr";
    if (!style_.empty()) {
        settings.style = style_;
    }

    std::shared_ptr<core::Display> display;
    try {
        display = std::make_shared<core::Display>(terminal::AnsiTerminal::forStream(settings.stream), settings);
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto bar = display->create(total_ > 0 ? std::optional<uint64_t>(total_) : std::nullopt);
    if (!label_.empty()) {
        bar.label(label_);
    }

    uint64_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        out << line << '\n';
        if (!out) {
            common::Logger::instance().error("[Pipe] Output closed | lines={}", lines);
            return 1;
        }
        ++lines;
        bar.advance();
    }
    out.flush();
    bar.close();

    common::Logger::instance().info("[Pipe] Completed | lines={}", lines);
    return 0;
}

}}
