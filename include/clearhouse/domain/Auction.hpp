#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "clearhouse/domain/Order.hpp"
#include "clearhouse/domain/Pool.hpp"
#include "clearhouse/domain/Token.hpp"
#include "clearhouse/infra/Clock.hpp"

namespace clearhouse {

// ---------------------------------------------------------------------------
// Immutable root of one solve call. Only AuctionBuilder can make one, so every
// Auction in the process has passed validation.
// ---------------------------------------------------------------------------
class Auction {
public:
    const std::string& id() const { return id_; }
    const TokenMap& tokens() const { return tokens_; }
    const std::vector<Order>& orders() const { return orders_; }
    const std::vector<LiquidityPool>& pools() const { return pools_; }
    infra::MonoTime deadline() const { return deadline_; }
    uint32_t now_unix() const { return now_unix_; }

    const Token* token(const TokenAddress& address) const;
    const Order* order(const OrderId& id) const;

    // Same snapshot, different order sequence (prioritization output). The
    // replacement must be drawn from this auction's orders.
    Auction with_orders(std::vector<Order> orders) const;

private:
    friend class AuctionBuilder;
    Auction() = default;

    std::string id_;
    TokenMap tokens_;
    std::vector<Order> orders_;
    std::vector<LiquidityPool> pools_;
    infra::MonoTime deadline_ = infra::MonoTime::max();   // none
    uint32_t now_unix_ = 0;
};

class AuctionBuilder {
public:
    AuctionBuilder& id(std::string id);
    AuctionBuilder& deadline(infra::MonoTime deadline);
    AuctionBuilder& now_unix(uint32_t now);

    AuctionBuilder& add_token(Token token);
    AuctionBuilder& add_order(Order order);
    AuctionBuilder& add_pool(LiquidityPool pool);

    // Validates everything. Throws InvalidOrder, UnknownToken or InvalidAuction.
    Auction build() const;

private:
    void validate_order(const Order& o, const TokenMap& tokens) const;
    void validate_pool(const LiquidityPool& p, const TokenMap& tokens) const;

    std::string id_;
    infra::MonoTime deadline_ = infra::MonoTime::max();   // none
    uint32_t now_unix_ = 0;
    std::vector<Token> tokens_;
    std::vector<Order> orders_;
    std::vector<LiquidityPool> pools_;
};

} // namespace clearhouse
