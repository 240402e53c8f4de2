#include "clearhouse/domain/Order.hpp"

namespace clearhouse {

Rational limit_price(const Order& o) {
    return ratio(o.buy_amount, o.sell_amount);
}

bool respects_limit(const Order& o, const Amount& executed_sell, const Amount& executed_buy) {
    return executed_buy * o.sell_amount >= executed_sell * o.buy_amount;
}

Amount fee_for(const Order& o, const Amount& executed_sell, const Amount& executed_buy) {
    if (o.fee_amount == 0) return Amount(0);
    if (o.kind == OrderKind::Sell) {
        return o.fee_amount * executed_sell / o.sell_amount;
    }
    return o.fee_amount * executed_buy / o.buy_amount;
}

const Amount& capped_amount(const Order& o) {
    return o.kind == OrderKind::Sell ? o.sell_amount : o.buy_amount;
}

} // namespace clearhouse
