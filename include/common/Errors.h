#pragma once

#include <stdexcept>
#include <string>

namespace signaldesk {

class DeskError : public std::runtime_error {
public:
    explicit DeskError(const std::string& message) : std::runtime_error(message) {}
};

// 캔들 수 부족 - 부분 결과 없이 호출자에게 전달
class InsufficientDataError : public DeskError {
public:
    InsufficientDataError(std::size_t available, std::size_t required)
        : DeskError("insufficient candles: " + std::to_string(available) +
                    " < " + std::to_string(required))
        , available_(available)
        , required_(required) {}

    std::size_t available() const { return available_; }
    std::size_t required() const { return required_; }

private:
    std::size_t available_;
    std::size_t required_;
};

class InvalidCandleError : public DeskError {
public:
    using DeskError::DeskError;
};

// NEUTRAL 방향, 손절 측 기준 레벨 부재, 또는 RR 계산 불가
class NoValidSetupError : public DeskError {
public:
    using DeskError::DeskError;
};

class PriceUnavailableError : public DeskError {
public:
    using DeskError::DeskError;
};

class TradeNotFoundError : public DeskError {
public:
    explicit TradeNotFoundError(const std::string& trade_id)
        : DeskError("trade not found: " + trade_id), trade_id_(trade_id) {}

    const std::string& tradeId() const { return trade_id_; }

private:
    std::string trade_id_;
};

class TradeAlreadyClosedError : public DeskError {
public:
    explicit TradeAlreadyClosedError(const std::string& trade_id)
        : DeskError("trade already closed: " + trade_id), trade_id_(trade_id) {}

    const std::string& tradeId() const { return trade_id_; }

private:
    std::string trade_id_;
};

class SignalNotFoundError : public DeskError {
public:
    explicit SignalNotFoundError(const std::string& signal_id)
        : DeskError("signal not found: " + signal_id) {}
};

// 신호 하나에 거래 하나
class SignalAlreadyConfirmedError : public DeskError {
public:
    SignalAlreadyConfirmedError(const std::string& signal_id, const std::string& trade_id)
        : DeskError("signal " + signal_id + " already confirmed as trade " + trade_id)
        , trade_id_(trade_id) {}

    const std::string& tradeId() const { return trade_id_; }

private:
    std::string trade_id_;
};

class MarketNotAllowedError : public DeskError {
public:
    using DeskError::DeskError;
};

class TradeLimitError : public DeskError {
public:
    using DeskError::DeskError;
};

class InvalidArgumentError : public DeskError {
public:
    using DeskError::DeskError;
};

class JournalWriteError : public DeskError {
public:
    using DeskError::DeskError;
};

class ConfigError : public DeskError {
public:
    using DeskError::DeskError;
};

} // namespace signaldesk
