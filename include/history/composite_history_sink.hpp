#pragma once

#include "history/history_sink.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqlrunner {

/**
 * @brief Fans every entry out to several sinks
 */
class CompositeHistorySink : public IHistorySink {
public:
    CompositeHistorySink() = default;
    explicit CompositeHistorySink(std::vector<std::shared_ptr<IHistorySink>> sinks);

    void add(std::shared_ptr<IHistorySink> sink);

    void record(const HistoryEntry& entry) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t size() const { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<IHistorySink>> sinks_;
};

} // namespace sqlrunner
