// test_strategies.cpp
// Strategy tests: moving average crossover, OLS pairs mean reversion and window statistics

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "replay/core/event_queue.hpp"
#include "replay/core/exceptions.hpp"
#include "replay/data/historic_data_handler.hpp"
#include "replay/strategies/moving_average_cross_strategy.hpp"
#include "replay/strategies/ols_mean_reversion_strategy.hpp"
#include "replay/strategies/ols_statistics.hpp"
#include "test_support.hpp"

using namespace replay;
using namespace replay_test;

namespace {

// Advances one bar, runs the strategy and returns the signals it published
std::vector<SignalEvent> step(HistoricDataHandler& bars, IStrategy& strategy, EventQueue& queue) {
    if (!bars.updateBars()) {
        throw std::runtime_error("bar source exhausted early");
    }
    strategy.calculateSignals(MarketEvent(*bars.getLatestBarDatetime(bars.getSymbols().front())));

    std::vector<SignalEvent> signals;
    while (auto event = queue.try_consume()) {
        signals.push_back(std::get<SignalEvent>(*event));
    }
    return signals;
}

MovingAverageCrossStrategy::MACrossConfig smallWindows() {
    MovingAverageCrossStrategy::MACrossConfig config;
    config.short_window = 2;
    config.long_window = 3;
    return config;
}

OLSMeanReversionStrategy::OLSMeanReversionConfig smallPairConfig() {
    OLSMeanReversionStrategy::OLSMeanReversionConfig config;
    config.ols_window = 5;
    config.zscore_high = 1.5;
    config.zscore_low = 0.5;
    return config;
}

// x is flat at 10, so the hedge ratio is mean(y)/10 and the spread is y - mean(y)
HistoricDataHandler makePair(const std::vector<double>& y) {
    HistoricDataHandler::SeriesMap series;
    series["Y"] = makeSeries(y);
    series["X"] = makeSeries(std::vector<double>(y.size(), 10.0));
    return HistoricDataHandler({"Y", "X"}, series);
}

} // namespace

// ============================================================================
// Window statistics
// ============================================================================

void test_window_statistics() {
    std::vector<double> v = {1.0, 2.0, 3.0, 4.0};
    expectNear(windowMean(v), 2.5, 1e-12, "mean");
    expectNear(trailingMean(v, 2), 3.5, 1e-12, "trailing mean of last two");
    expectNear(trailingMean(v, 10), 2.5, 1e-12, "trailing mean clamps to available");
    expectNear(windowStdDev(v), std::sqrt(1.25), 1e-12, "population std");

    auto hr = hedgeRatio({2.0, 4.0, 6.0}, {1.0, 2.0, 3.0});
    expect(hr.has_value(), "hedge ratio defined");
    expectNear(*hr, 2.0, 1e-12, "y = 2x gives ratio 2");
    expect(!hedgeRatio({1.0}, {0.0}).has_value(), "zero x has no regression");
    expect(!lastZScore({5.0, 5.0, 5.0}).has_value(), "no dispersion, no z-score");
}

// ============================================================================
// Moving average crossover
// ============================================================================

void test_ma_cross_waits_for_long_window() {
    HistoricDataHandler::SeriesMap series;
    series["A"] = makeSeries({1.0, 2.0, 3.0, 4.0});
    HistoricDataHandler bars({"A"}, series);
    EventQueue queue;
    MovingAverageCrossStrategy strategy(bars, smallWindows());
    strategy.setEventQueue(queue);

    expect(step(bars, strategy, queue).empty(), "one bar: no signal");
    expect(step(bars, strategy, queue).empty(), "two bars: no signal");
    auto third = step(bars, strategy, queue);
    expect(third.size() == 1, "rising series crosses once the window fills");
    expect(third[0].direction == SignalEvent::Direction::LONG, "first signal is LONG");
}

void test_ma_cross_long_then_exit() {
    HistoricDataHandler::SeriesMap series;
    series["A"] = makeSeries({10.0, 10.0, 10.0, 9.0, 12.0, 13.0, 14.0, 5.0});
    HistoricDataHandler bars({"A"}, series);
    EventQueue queue;
    MovingAverageCrossStrategy strategy(bars, smallWindows(), "MAC");
    strategy.setEventQueue(queue);

    for (int i = 0; i < 4; ++i) {
        expect(step(bars, strategy, queue).empty(), "no cross in the flat/falling prefix");
    }
    expect(!strategy.isInvested("A"), "still flat");

    auto cross = step(bars, strategy, queue);
    expect(cross.size() == 1, "exactly one signal on the upward cross");
    expect(cross[0].direction == SignalEvent::Direction::LONG, "upward cross is LONG");
    expect(cross[0].symbol == "A" && cross[0].strategy_id == "MAC", "signal identifies its source");
    expectNear(cross[0].strength, 1.0, 1e-12, "unit strength");
    expect(cross[0].timestamp == day(4), "stamped with the bar date");
    expect(strategy.isInvested("A"), "in-position flag set");

    expect(step(bars, strategy, queue).empty(), "short mean still above: nothing");
    expect(step(bars, strategy, queue).empty(), "still above: nothing");

    auto exit = step(bars, strategy, queue);
    expect(exit.size() == 1 && exit[0].direction == SignalEvent::Direction::EXIT,
           "downward cross exits");
    expect(!strategy.isInvested("A"), "flag cleared");

    auto stats = strategy.getStats();
    expect(stats.total_signals == 2 && stats.long_signals == 1 && stats.exit_signals == 1,
           "signal counters");
}

void test_ma_cross_configuration() {
    HistoricDataHandler::SeriesMap series;
    series["A"] = makeSeries({1.0});
    HistoricDataHandler bars({"A"}, series);

    MovingAverageCrossStrategy::MACrossConfig inverted;
    inverted.short_window = 10;
    inverted.long_window = 5;
    expectThrows<ConfigurationException>([&] { MovingAverageCrossStrategy s(bars, inverted); },
                                         "short window above long window");

    MovingAverageCrossStrategy::MACrossConfig bad_field = smallWindows();
    bad_field.price_field = "mid";
    expectThrows<InvalidFieldException>([&] { MovingAverageCrossStrategy s(bars, bad_field); },
                                        "unknown price field fails at construction");

    MovingAverageCrossStrategy strategy(bars, smallWindows());
    expectThrows<SymbolLookupException>([&] { strategy.isInvested("B"); }, "untracked symbol");
}

// ============================================================================
// OLS pairs mean reversion
// ============================================================================

void test_pairs_short_spread_entry_and_exit() {
    auto bars = makePair({10.0, 11.0, 10.0, 11.0, 10.0, 14.0, 11.25});
    EventQueue queue;
    OLSMeanReversionStrategy strategy(bars, "Y", "X", smallPairConfig());
    strategy.setEventQueue(queue);

    for (int i = 0; i < 4; ++i) {
        expect(step(bars, strategy, queue).empty(), "insufficient history withholds signals");
    }
    expect(step(bars, strategy, queue).empty(), "z inside the bands: nothing");
    expect(!strategy.isLongMarket() && !strategy.isShortMarket(), "flat");

    auto entry = step(bars, strategy, queue);
    expect(entry.size() == 2, "entry emits one signal per leg");
    expect(*strategy.getLastZScore() >= 1.5, "z above the entry threshold");
    expect(entry[0].symbol == "Y" && entry[0].direction == SignalEvent::Direction::SHORT,
           "short y");
    expect(entry[1].symbol == "X" && entry[1].direction == SignalEvent::Direction::LONG,
           "long x");
    expectNear(entry[0].strength, 1.0, 1e-12, "y leg at unit strength");
    expectNear(entry[1].strength, std::abs(strategy.getHedgeRatio()), 1e-12,
               "x leg scaled by |hedge ratio|");
    expectNear(strategy.getHedgeRatio(), 1.12, 1e-9, "hedge ratio over the window");
    expect(entry[0].timestamp == entry[1].timestamp, "legs share a timestamp");
    expect(strategy.isShortMarket() && !strategy.isLongMarket(), "short flag set");

    auto exit = step(bars, strategy, queue);
    expect(exit.size() == 2, "exit emits one signal per leg");
    expect(exit[0].direction == SignalEvent::Direction::EXIT &&
           exit[1].direction == SignalEvent::Direction::EXIT, "EXIT/EXIT pair");
    expect(!strategy.isShortMarket(), "short flag cleared");

    auto stats = strategy.getStats();
    expect(stats.total_signals == 4 && stats.short_spread_entries == 1 && stats.exits == 1,
           "pair counters");
}

void test_pairs_long_spread_entry() {
    auto bars = makePair({10.0, 11.0, 10.0, 11.0, 10.0, 7.0});
    EventQueue queue;
    OLSMeanReversionStrategy strategy(bars, "Y", "X", smallPairConfig());
    strategy.setEventQueue(queue);

    for (int i = 0; i < 5; ++i) step(bars, strategy, queue);
    auto entry = step(bars, strategy, queue);

    expect(entry.size() == 2, "two linked signals");
    expect(*strategy.getLastZScore() <= -1.5, "z below the negative threshold");
    expect(entry[0].direction == SignalEvent::Direction::LONG, "long y");
    expect(entry[1].direction == SignalEvent::Direction::SHORT, "short x");
    expectNear(entry[1].strength, 0.98, 1e-9, "x leg scaled by |hedge ratio|");
    expect(strategy.isLongMarket(), "long flag set");
}

void test_pairs_no_repeat_entry() {
    // Second extreme bar while already short must not emit again
    auto bars = makePair({10.0, 11.0, 10.0, 11.0, 10.0, 14.0, 18.0});
    EventQueue queue;
    OLSMeanReversionStrategy strategy(bars, "Y", "X", smallPairConfig());
    strategy.setEventQueue(queue);

    for (int i = 0; i < 5; ++i) step(bars, strategy, queue);
    expect(step(bars, strategy, queue).size() == 2, "entry");
    auto again = step(bars, strategy, queue);
    expect(*strategy.getLastZScore() >= 1.5, "still beyond the threshold");
    expect(again.empty(), "no duplicate entry while short");
}

void test_pairs_configuration() {
    auto bars = makePair({10.0, 11.0});

    OLSMeanReversionStrategy::OLSMeanReversionConfig bands = smallPairConfig();
    bands.zscore_low = 2.0;
    bands.zscore_high = 1.0;
    expectThrows<ConfigurationException>(
        [&] { OLSMeanReversionStrategy s(bars, "Y", "X", bands); }, "low above high");
    expectThrows<ConfigurationException>(
        [&] { OLSMeanReversionStrategy s(bars, "Y", "Y", smallPairConfig()); }, "same leg twice");
    expectThrows<SymbolLookupException>(
        [&] { OLSMeanReversionStrategy s(bars, "Y", "Q", smallPairConfig()); }, "untracked leg");
}

int main() {
    std::cout << "=== Strategy Tests ===" << std::endl;
    TestReporter reporter;

    std::cout << "\nStatistics Tests:" << std::endl;
    reporter.test("Window Statistics", test_window_statistics);

    std::cout << "\nMoving Average Crossover Tests:" << std::endl;
    reporter.test("Waits For Long Window", test_ma_cross_waits_for_long_window);
    reporter.test("Long Then Exit", test_ma_cross_long_then_exit);
    reporter.test("Configuration", test_ma_cross_configuration);

    std::cout << "\nPairs Mean Reversion Tests:" << std::endl;
    reporter.test("Short Spread Entry And Exit", test_pairs_short_spread_entry_and_exit);
    reporter.test("Long Spread Entry", test_pairs_long_spread_entry);
    reporter.test("No Repeat Entry", test_pairs_no_repeat_entry);
    reporter.test("Configuration", test_pairs_configuration);

    return reporter.report();
}
