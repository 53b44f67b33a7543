#pragma once

#include <optional>
#include <string>
#include <vector>

namespace signaldesk {
namespace analytics {

enum class Trend { BULLISH, BEARISH, RANGING };
enum class PricePosition { DISCOUNT, EQUILIBRIUM, PREMIUM };
enum class SwingKind { HIGH, LOW };
enum class StructureDirection { BULLISH, BEARISH };

struct SwingPoint {
    size_t index = 0;
    double price = 0.0;
    SwingKind kind = SwingKind::HIGH;
    bool broken = false;        // 이후 종가가 레벨을 넘어섰는지
};

// 임펄스 직전의 마지막 반대색 캔들
struct OrderBlock {
    double entry_zone = 0.0;    // 블록 캔들의 시가
    double high = 0.0;
    double low = 0.0;
    StructureDirection direction = StructureDirection::BULLISH;
    size_t origin_index = 0;

    bool contains(double price) const { return price >= low && price <= high; }
};

// Break of Structure
struct BOSEvent {
    double level = 0.0;
    StructureDirection direction = StructureDirection::BULLISH;
    size_t index = 0;           // 돌파가 확정된 봉
};

// 분석 호출마다 새로 만들어지는 불변 결과
struct StructureSnapshot {
    Trend trend = Trend::RANGING;
    PricePosition price_position = PricePosition::EQUILIBRIUM;
    double current_price = 0.0;
    std::optional<double> nearest_support;
    std::optional<double> nearest_resistance;
    double atr = 0.0;
    std::vector<SwingPoint> swing_points;
    std::vector<OrderBlock> order_blocks;
    std::optional<BOSEvent> last_bos;

    // 피보나치 기준 범위 (최근 스윙 고점/저점). 범위가 없으면 비어 있음
    std::optional<double> range_high;
    std::optional<double> range_low;
    std::vector<double> fib_levels;
};

std::string toString(Trend trend);
std::string toString(PricePosition position);
std::string toString(SwingKind kind);
std::string toString(StructureDirection direction);

} // namespace analytics
} // namespace signaldesk
