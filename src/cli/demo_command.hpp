#pragma once

#include "main_command.hpp"
#include "multibar/common/config.hpp"
#include "multibar/core/display.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace multibar {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

    bool validateArguments() const override;

private:
    bool was_called_;
    std::string mode_ = "parallel";
    uint64_t count_ = 200;
    size_t bars_ = 4;
    std::string style_;
    size_t width_ = 0;
    uint64_t delay_ms_ = 10;
    bool clear_ = false;

    std::shared_ptr<core::Display> createDisplay() const;

    int runNested(const std::shared_ptr<core::Display>& display);
    int runParallel(const std::shared_ptr<core::Display>& display);
    int runStream(const std::shared_ptr<core::Display>& display);
    int runAsync(const std::shared_ptr<core::Display>& display);

    void pause(uint64_t factor = 1) const;
};

}}
