#pragma once

#include "analytics/MarketStructure.h"
#include "common/InstrumentClass.h"
#include "common/Types.h"
#include <optional>
#include <string>

namespace signaldesk {
namespace strategy {

// 생성 후 변경되지 않는 매매 신호. 확인(confirm) 시 Trade 가 새로 만들어질 뿐 Signal 은 그대로
struct Signal {
    std::string id;                         // UUID v4
    std::string symbol;
    std::string timeframe;
    TradingMode mode;                       // AUTO 는 생성 시 해석됨
    std::string strategy;                   // 전략 태그 (통계 그룹 기준)
    common::InstrumentClass instrument;
    Direction direction;

    double current_price;                   // 분석 시점 가격
    double optimal_entry;
    EntryType entry_type;
    double stop_loss;
    double take_profit_1;
    std::optional<double> take_profit_2;
    std::optional<double> take_profit_3;
    double rr_ratio;

    double confidence;                      // 0 ~ 100
    char quality_tier;                      // 'A' / 'B' / 'C'

    analytics::StructureSnapshot structure;
    long long created_at;                   // ms

    Signal()
        : mode(TradingMode::INTRADAY)
        , instrument(common::InstrumentClass::CRYPTO)
        , direction(Direction::NEUTRAL)
        , current_price(0.0)
        , optimal_entry(0.0)
        , entry_type(EntryType::MARKET)
        , stop_loss(0.0)
        , take_profit_1(0.0)
        , rr_ratio(0.0)
        , confidence(0.0)
        , quality_tier('C')
        , created_at(0)
    {}
};

} // namespace strategy
} // namespace signaldesk
