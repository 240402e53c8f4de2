#include "clearhouse/domain/Auction.hpp"

#include <set>

#include "clearhouse/domain/Errors.hpp"

namespace clearhouse {

namespace {

// Addresses that fail to normalize are left as-is; validation then reports
// them as unknown tokens.
void normalize_in_place(TokenAddress& address) {
    TokenAddress norm;
    if (normalize_address(address, norm)) address = std::move(norm);
}

void normalize_pool(LiquidityPool& pool) {
    if (auto* cp = std::get_if<ConstantProductPool>(&pool)) {
        for (auto& t : cp->tokens) normalize_in_place(t);
    } else if (auto* w = std::get_if<WeightedPool>(&pool)) {
        for (auto& t : w->tokens) normalize_in_place(t.token);
    } else if (auto* s = std::get_if<StableSwapPool>(&pool)) {
        for (auto& t : s->tokens) normalize_in_place(t.token);
    }
}

} // namespace

const Token* Auction::token(const TokenAddress& address) const {
    auto it = tokens_.find(address);
    return it == tokens_.end() ? nullptr : &it->second;
}

const Order* Auction::order(const OrderId& id) const {
    for (const auto& o : orders_) {
        if (o.id == id) return &o;
    }
    return nullptr;
}

Auction Auction::with_orders(std::vector<Order> orders) const {
    Auction next = *this;
    next.orders_ = std::move(orders);
    return next;
}

AuctionBuilder& AuctionBuilder::id(std::string id) {
    id_ = std::move(id);
    return *this;
}

AuctionBuilder& AuctionBuilder::deadline(infra::MonoTime deadline) {
    deadline_ = deadline;
    return *this;
}

AuctionBuilder& AuctionBuilder::now_unix(uint32_t now) {
    now_unix_ = now;
    return *this;
}

AuctionBuilder& AuctionBuilder::add_token(Token token) {
    tokens_.push_back(std::move(token));
    return *this;
}

AuctionBuilder& AuctionBuilder::add_order(Order order) {
    orders_.push_back(std::move(order));
    return *this;
}

AuctionBuilder& AuctionBuilder::add_pool(LiquidityPool pool) {
    pools_.push_back(std::move(pool));
    return *this;
}

Auction AuctionBuilder::build() const {
    Auction a;
    a.id_ = id_;
    a.deadline_ = deadline_;
    a.now_unix_ = now_unix_;

    for (const auto& t : tokens_) {
        TokenAddress norm;
        if (!normalize_address(t.address, norm)) {
            throw InvalidAuction("malformed token address '" + t.address + "'");
        }
        if (t.reference_price && *t.reference_price <= 0) {
            throw InvalidAuction("non-positive reference price for " + norm);
        }
        Token stored = t;
        stored.address = norm;
        if (!a.tokens_.emplace(norm, std::move(stored)).second) {
            throw InvalidAuction("duplicate token " + norm);
        }
    }

    std::set<OrderId> order_ids;
    for (Order o : orders_) {
        normalize_in_place(o.sell_token);
        normalize_in_place(o.buy_token);
        validate_order(o, a.tokens_);
        if (!order_ids.insert(o.id).second) {
            throw InvalidOrder("duplicate order id " + o.id);
        }
        a.orders_.push_back(std::move(o));
    }

    std::set<PoolId> pool_ids;
    for (LiquidityPool p : pools_) {
        normalize_pool(p);
        validate_pool(p, a.tokens_);
        if (!pool_ids.insert(pool_id(p)).second) {
            throw InvalidAuction("duplicate pool id " + pool_id(p));
        }
        a.pools_.push_back(std::move(p));
    }

    return a;
}

void AuctionBuilder::validate_order(const Order& o, const TokenMap& tokens) const {
    if (o.id.empty()) throw InvalidOrder("order without id");
    if (o.sell_amount <= 0 || o.buy_amount <= 0) {
        throw InvalidOrder(o.id + ": amounts must be positive");
    }
    if (o.fee_amount < 0) throw InvalidOrder(o.id + ": negative fee");
    if (o.valid_to < now_unix_) {
        throw InvalidOrder(o.id + ": expired (valid_to=" + std::to_string(o.valid_to) +
                           " now=" + std::to_string(now_unix_) + ")");
    }
    if (o.sell_token == o.buy_token) {
        throw InvalidOrder(o.id + ": sell and buy token are identical");
    }
    if (!tokens.count(o.sell_token) || !tokens.count(o.buy_token)) {
        throw InvalidOrder(o.id + ": references a token outside the snapshot");
    }
}

void AuctionBuilder::validate_pool(const LiquidityPool& p, const TokenMap& tokens) const {
    const PoolId& id = pool_id(p);
    if (id.empty()) throw InvalidAuction("pool without id");

    auto toks = pool_tokens(p);
    if (toks.size() < 2) throw InvalidAuction(id + ": pool needs at least two tokens");

    std::set<TokenAddress> seen;
    for (const auto& t : toks) {
        if (!tokens.count(t)) throw UnknownToken(id + " references unknown token " + t);
        if (!seen.insert(t).second) throw InvalidAuction(id + ": repeated token " + t);
        auto r = pool_reserve(p, t);
        if (!r || *r <= 0) throw InvalidAuction(id + ": non-positive reserve for " + t);
    }

    if (pool_fee_bps(p) >= BPS_DENOMINATOR) {
        throw InvalidAuction(id + ": fee must be below 10000 bps");
    }

    if (const auto* w = std::get_if<WeightedPool>(&p)) {
        for (const auto& t : w->tokens) {
            if (t.weight <= 0) throw InvalidAuction(id + ": non-positive weight");
        }
    }
    if (const auto* s = std::get_if<StableSwapPool>(&p)) {
        if (s->amplification <= 0) throw InvalidAuction(id + ": non-positive amplification");
        for (const auto& t : s->tokens) {
            if (t.decimals > 18) throw InvalidAuction(id + ": stable token above 18 decimals");
        }
    }
}

} // namespace clearhouse
