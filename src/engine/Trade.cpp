#include "engine/Trade.h"
#include "common/Errors.h"

namespace signaldesk {
namespace engine {

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j;
    j["id"] = trade.id;
    j["signal_id"] = trade.signal_id;
    j["symbol"] = trade.symbol;
    j["direction"] = toString(trade.direction);
    j["mode"] = toString(trade.mode);
    j["instrument"] = common::toString(trade.instrument);
    j["strategy"] = trade.strategy;
    j["entry_price"] = trade.entry_price;
    j["quantity"] = trade.quantity;
    j["stop_loss"] = trade.stop_loss;
    j["take_profit"] = trade.take_profit;
    j["take_profit_2"] = trade.take_profit_2 ? nlohmann::json(*trade.take_profit_2) : nlohmann::json();
    j["status"] = toString(trade.status);
    j["created_at"] = trade.created_at;
    j["exit_price"] = trade.exit_price ? nlohmann::json(*trade.exit_price) : nlohmann::json();
    j["pnl"] = trade.pnl ? nlohmann::json(*trade.pnl) : nlohmann::json();
    j["closed_at"] = trade.closed_at ? nlohmann::json(*trade.closed_at) : nlohmann::json();
    j["close_reason"] = trade.close_reason ? nlohmann::json(toString(*trade.close_reason)) : nlohmann::json();
    return j;
}

Trade tradeFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("symbol")) {
        throw InvalidArgumentError("trade record missing id/symbol");
    }

    auto optionalDouble = [&j](const char* key) -> std::optional<double> {
        if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
        return std::nullopt;
    };

    Trade trade;
    try {
        trade.id = j.at("id").get<std::string>();
        trade.signal_id = j.value("signal_id", std::string());
        trade.symbol = j.at("symbol").get<std::string>();
        trade.direction = parseDirection(j.value("direction", std::string("BUY")));
        trade.mode = parseTradingMode(j.value("mode", std::string("INTRADAY")));
        trade.instrument = common::resolveInstrumentClass(j.value("instrument", std::string()), trade.symbol);
        trade.strategy = j.value("strategy", std::string());
        trade.entry_price = j.at("entry_price").get<double>();
        trade.quantity = j.at("quantity").get<double>();
        trade.stop_loss = j.value("stop_loss", 0.0);
        trade.take_profit = j.value("take_profit", 0.0);
        trade.take_profit_2 = optionalDouble("take_profit_2");
        trade.status = parseTradeStatus(j.value("status", std::string("OPEN")));
        trade.created_at = j.value("created_at", 0LL);
        trade.exit_price = optionalDouble("exit_price");
        trade.pnl = optionalDouble("pnl");
        if (j.contains("closed_at") && j["closed_at"].is_number()) {
            trade.closed_at = j["closed_at"].get<long long>();
        }
        if (j.contains("close_reason") && j["close_reason"].is_string()) {
            trade.close_reason = parseCloseReason(j["close_reason"].get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("malformed trade record: ") + e.what());
    }

    // CLOSED 면 종료 필드가 모두 있어야 한다
    if (trade.status == TradeStatus::CLOSED &&
        (!trade.exit_price || !trade.pnl || !trade.closed_at || !trade.close_reason)) {
        throw InvalidArgumentError("closed trade record missing exit fields: " + trade.id);
    }
    return trade;
}

} // namespace engine
} // namespace signaldesk
