#include "multibar/core/progress_handle.hpp"
#include "multibar/core/display.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/core/rate_estimator.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/format/format_utils.hpp"
#include <utility>

namespace multibar {
namespace core {

namespace {

std::optional<std::string> normalizeLabel(const std::string& label) {
    if (label.empty()) {
        return std::nullopt;
    }
    return format::sanitizeControlCharacters(label);
}

void requireValidSmoothing(double factor) {
    if (!RateEstimator::isValidSmoothing(factor)) {
        throw ConfigurationError(ProgressErrorCode::SMOOTHING_OUT_OF_RANGE,
                                 {"ProgressHandle", {{"smoothing", fmt::format("{}", factor)}}});
    }
}

}

ProgressHandle::ProgressHandle(std::shared_ptr<Display> display, uint64_t id, TimePoint created_at,
                               Clock::duration min_interval, uint64_t min_iterations)
    : display_(std::move(display)),
      id_(id),
      closed_(false),
      min_interval_(min_interval),
      min_iterations_(min_iterations),
      next_flush_at_(created_at) {}

ProgressHandle::~ProgressHandle() {
    closeQuietly();
}

ProgressHandle::ProgressHandle(ProgressHandle&& other) noexcept
    : display_(std::move(other.display_)),
      id_(other.id_),
      closed_(other.closed_),
      pending_(other.pending_),
      flushed_(other.flushed_),
      min_interval_(other.min_interval_),
      min_iterations_(other.min_iterations_),
      next_flush_at_(other.next_flush_at_) {
    other.closed_ = true;
    other.pending_ = 0;
}

ProgressHandle& ProgressHandle::operator=(ProgressHandle&& other) noexcept {
    if (this != &other) {
        closeQuietly();

        display_ = std::move(other.display_);
        id_ = other.id_;
        closed_ = other.closed_;
        pending_ = other.pending_;
        flushed_ = other.flushed_;
        min_interval_ = other.min_interval_;
        min_iterations_ = other.min_iterations_;
        next_flush_at_ = other.next_flush_at_;

        other.closed_ = true;
        other.pending_ = 0;
    }
    return *this;
}

void ProgressHandle::advance(uint64_t n) {
    if (closed_ || !display_) {
        return;
    }

    pending_ += n;
    if (pending_ < min_iterations_) {
        return;
    }

    TimePoint now = display_->now();
    if (now < next_flush_at_) {
        return;
    }

    uint64_t delta = pending_;
    pending_ = 0;
    flushed_ += delta;
    next_flush_at_ = now + min_interval_;

    display_->update(id_, delta, now);
}

ProgressHandle& ProgressHandle::label(const std::string& label) {
    if (closed_ || !display_) return *this;

    auto value = normalizeLabel(label);
    display_->configure(id_, [&value](BarRecord& record) {
        record.config.label = value;
    });
    return *this;
}

ProgressHandle& ProgressHandle::width(std::optional<size_t> width) {
    if (closed_ || !display_) return *this;

    if (width && *width == 0) {
        width.reset();
    }
    display_->configure(id_, [width](BarRecord& record) {
        record.config.fixed_width = width;
    });
    return *this;
}

ProgressHandle& ProgressHandle::style(const std::string& name) {
    if (closed_ || !display_) return *this;
    return style(Style::fromName(name));
}

ProgressHandle& ProgressHandle::style(const Style& style) {
    if (closed_ || !display_) return *this;

    display_->configure(id_, [&style](BarRecord& record) {
        record.config.style = style;
    });
    return *this;
}

ProgressHandle& ProgressHandle::smoothing(double factor) {
    if (closed_ || !display_) return *this;

    requireValidSmoothing(factor);
    display_->configure(id_, [factor](BarRecord& record) {
        record.config.smoothing_factor = factor;
    });
    return *this;
}

ProgressHandle& ProgressHandle::clearOnClose(bool clear) {
    if (closed_ || !display_) return *this;

    display_->configure(id_, [clear](BarRecord& record) {
        record.config.clear_on_close = clear;
    });
    return *this;
}

ProgressHandle& ProgressHandle::total(std::optional<uint64_t> total) {
    if (closed_ || !display_) return *this;

    display_->configure(id_, [total](BarRecord& record) {
        record.total = total;
    });
    return *this;
}

ProgressHandle& ProgressHandle::configure(const BarOptions& options) {
    if (closed_ || !display_) return *this;

    // Every field is checked before the record is touched.
    auto config = display_->registry().get(id_);
    if (!config) {
        return *this;
    }
    BarConfig updated = config->config;

    if (options.style) {
        updated.style = Style::fromName(*options.style);
    }
    if (options.smoothing) {
        requireValidSmoothing(*options.smoothing);
        updated.smoothing_factor = *options.smoothing;
    }
    if (options.label) {
        updated.label = normalizeLabel(*options.label);
    }
    if (options.width) {
        updated.fixed_width = *options.width == 0 ? std::nullopt : std::optional<size_t>(*options.width);
    }
    if (options.clear_on_close) {
        updated.clear_on_close = *options.clear_on_close;
    }

    applyConfig(updated);
    return *this;
}

ProgressHandle& ProgressHandle::minInterval(Clock::duration interval) {
    if (closed_ || !display_) return *this;

    if (interval < Clock::duration::zero()) {
        throw ConfigurationError(ProgressErrorCode::INTERVAL_NEGATIVE,
                                 {"ProgressHandle", {{"min_interval_ns", std::to_string(
                                     std::chrono::duration_cast<std::chrono::nanoseconds>(interval).count())}}});
    }
    // Shifts the pending deadline so a shorter interval takes effect at once.
    next_flush_at_ = next_flush_at_ - min_interval_ + interval;
    min_interval_ = interval;
    return *this;
}

ProgressHandle& ProgressHandle::minIterations(uint64_t iterations) {
    if (closed_ || !display_) return *this;

    min_iterations_ = iterations;
    return *this;
}

void ProgressHandle::applyConfig(const BarConfig& config) {
    display_->configure(id_, [&config](BarRecord& record) {
        record.config = config;
    });
}

void ProgressHandle::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (!display_) {
        return;
    }

    if (pending_ > 0) {
        uint64_t delta = pending_;
        pending_ = 0;
        flushed_ += delta;
        display_->registry().update(id_, delta, display_->now());
    }

    display_->finalize(id_);
}

void ProgressHandle::closeQuietly() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        common::Logger::instance().error("[ProgressHandle] Close failed | id={} | error={}", id_, e.what());
    }
}

}}
