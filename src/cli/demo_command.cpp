#include "demo_command.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/core/async.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/core/tracked.hpp"
#include "multibar/terminal/terminal.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <chrono>
#include <future>
#include <iostream>
#include <numeric>
#include <thread>
#include <vector>

namespace multibar {
namespace cli {

DemoCommand::DemoCommand() : was_called_(false) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--mode", mode_, "Demo scenario")
        ->check(CLI::IsMember({"nested", "parallel", "stream", "async"}));
    subcommand->add_option("-n,--count", count_, "Items per bar");
    subcommand->add_option("-b,--bars", bars_, "Number of concurrent bars");
    subcommand->add_option("--style", style_, "Bar style (ascii, block, balloon, custom:<glyphs>)");
    subcommand->add_option("--width", width_, "Fixed bar width in columns (0 = terminal width)");
    subcommand->add_option("--delay-ms", delay_ms_, "Simulated work per item in milliseconds");
    subcommand->add_flag("--clear", clear_, "Remove bars from the screen when they finish");

    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::wasCalled() const {
    return was_called_;
}

bool DemoCommand::validateArguments() const {
    if (bars_ == 0) {
        std::cerr << "Error: --bars must be at least 1\n";
        return false;
    }
    if (bars_ > 64) {
        std::cerr << "Error: --bars must not exceed 64\n";
        return false;
    }
    return true;
}

int DemoCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    std::shared_ptr<core::Display> display;
    try {
        display = createDisplay();
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    common::Logger::instance().info("[Demo] Starting | mode={} | bars={} | count={}",
                                    mode_, bars_, count_);

    auto start = std::chrono::steady_clock::now();
    int result = 0;
    if (mode_ == "nested") {
        result = runNested(display);
    } else if (mode_ == "stream") {
        result = runStream(display);
    } else if (mode_ == "async") {
        result = runAsync(display);
    } else {
        result = runParallel(display);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    common::Logger::instance().info("[Demo] Completed | mode={} | elapsed_ms={}", mode_, elapsed.count());
    return result;
}

std::shared_ptr<core::Display> DemoCommand::createDisplay() const {
    common::DisplayConfig settings = common::Config::instance().global().display;
    if (!style_.empty()) {
        settings.style = style_;
    }
    if (width_ > 0) {
        settings.width = width_;
    }
    if (clear_) {
        settings.clear_on_close = true;
    }

    return std::make_shared<core::Display>(terminal::AnsiTerminal::forStream(settings.stream), settings);
}

int DemoCommand::runNested(const std::shared_ptr<core::Display>& display) {
    std::vector<size_t> groups(bars_);
    std::iota(groups.begin(), groups.end(), 1);

    for (size_t group : core::track(groups, display)) {
        auto inner = display->create(count_);
        inner.label(fmt::format("group {}", group)).clearOnClose(true);
        for (uint64_t i = 0; i < count_; ++i) {
            pause();
            inner.advance();
        }
    }

    display->print("nested: all groups processed");
    return 0;
}

int DemoCommand::runParallel(const std::shared_ptr<core::Display>& display) {
    tbb::task_arena arena(static_cast<int>(bars_));
    arena.execute([&] {
        tbb::parallel_for(size_t(0), bars_, [&](size_t worker) {
            auto bar = display->create(count_);
            bar.label(fmt::format("worker {}", worker));

            // Stagger the workers so the bars move at different speeds.
            uint64_t factor = 1 + worker % 3;
            for (uint64_t i = 0; i < count_; ++i) {
                pause(factor);
                bar.advance();
            }
        });
    });

    display->print(fmt::format("parallel: {} workers finished", bars_));
    return 0;
}

int DemoCommand::runStream(const std::shared_ptr<core::Display>& display) {
    auto bar = display->create();
    bar.label("stream");

    for (uint64_t i = 0; i < count_; ++i) {
        pause();
        bar.advance(1 + i % 4);
    }
    bar.close();
    return 0;
}

int DemoCommand::runAsync(const std::shared_ptr<core::Display>& display) {
    std::vector<std::future<uint64_t>> jobs;
    jobs.reserve(count_);

    for (uint64_t i = 0; i < count_; ++i) {
        uint64_t delay = delay_ms_ * (1 + (i * 7) % 11);
        jobs.push_back(std::async(std::launch::async, [delay, i]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            return i * i;
        }));
    }

    auto tracked = core::trackAsync(std::move(jobs), display);

    uint64_t checksum = 0;
    for (auto& job : tracked) {
        checksum += job.get();
    }

    display->print(fmt::format("async: {} jobs done, checksum={}", count_, checksum));
    return 0;
}

void DemoCommand::pause(uint64_t factor) const {
    if (delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_ * factor));
    }
}

}}
