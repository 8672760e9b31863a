#include "history/composite_history_sink.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlrunner {

CompositeHistorySink::CompositeHistorySink(std::vector<std::shared_ptr<IHistorySink>> sinks)
    : sinks_(std::move(sinks)) {}

void CompositeHistorySink::add(std::shared_ptr<IHistorySink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void CompositeHistorySink::record(const HistoryEntry& entry) {
    for (const auto& sink : sinks_) {
        try {
            sink->record(entry);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("History sink '{}' failed: {}", sink->name(), e.what()));
        }
    }
}

std::string CompositeHistorySink::name() const {
    std::string out = "composite[";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i > 0) out += ',';
        out += sinks_[i]->name();
    }
    out += ']';
    return out;
}

} // namespace sqlrunner
