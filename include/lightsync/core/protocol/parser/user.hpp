#pragma once

#include <vector>

#include "lightsync/core/protocol/enums.hpp"
#include "lightsync/core/protocol/schema/user.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol::parser {

/*
================================================================================
user payload parser
================================================================================

  event_type   snapshot | order (order_update) | balance_update | nonce
  orders       [Order]                                   (snapshot)
  balances     {any_key: BalanceEntry} or [BalanceEntry] (snapshot)
  order        OrderUpdate                               (order)
  balance      {outcomes: [OutcomeBalance]}              (balance_update)
  nonce        u64, also accepted as 'new_nonce'         (snapshot, nonce)

Amounts are exact decimals; 'side' is 0 (buy) or 1 (sell).
================================================================================
*/
struct user {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, schema::UserEvent& out) noexcept {
        out = schema::UserEvent{};

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'data' is not an object in user message -> ignore message.");
            return r;
        }

        std::string event_type;
        r = helper::parse_string_required(data, "event_type", event_type);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'event_type' missing in user message -> ignore message.");
            return r;
        }
        if (!schema::user_event_type_from_string(event_type, out.type)) {
            LS_DEBUG("[PARSER] Unknown user event_type '" << event_type << "' -> ignore message.");
            return Result::InvalidValue;
        }

        // Envelope fields shared by every alternative
        if ((r = helper::parse_text_or(data, "user", out.user)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "timestamp", out.timestamp)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "market_pubkey", out.market_pubkey)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "orderbook_id", out.orderbook_id)) != Result::Parsed ||
            (r = helper::parse_text_or(data, "deposit_mint", out.deposit_mint)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid envelope field in user message -> ignore message.");
            return r;
        }
        if (out.user.empty()) {
            r = helper::parse_text_or(data, "user_pubkey", out.user);
            if (r != Result::Parsed) {
                return r;
            }
        }

        r = helper::parse_uint64_optional(data, "nonce", out.nonce);
        if (r == Result::Parsed && !out.nonce) {
            r = helper::parse_uint64_optional(data, "new_nonce", out.nonce);
        }
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Field 'nonce' invalid in user message -> ignore message.");
            return r;
        }

        try {
            // orders (optional)
            simdjson::dom::array orders;
            bool present = false;
            r = helper::parse_array_optional(data, "orders", orders, present);
            if (r != Result::Parsed) {
                LS_DEBUG("[PARSER] Field 'orders' is not an array in user message -> ignore message.");
                return r;
            }
            if (present) {
                for (simdjson::dom::element el : orders) {
                    schema::Order o;
                    r = parse_order_(el, o);
                    if (r != Result::Parsed) {
                        return r;
                    }
                    out.orders.push_back(std::move(o));
                }
            }

            // balances (optional): object keyed by any string, or array
            simdjson::dom::element balances;
            if (helper::find(data, "balances", balances)) {
                if (balances.is_object()) {
                    for (auto [key, value] : simdjson::dom::object(balances)) {
                        schema::BalanceEntry b;
                        r = parse_balance_entry_(value, b);
                        if (r != Result::Parsed) {
                            return r;
                        }
                        out.balances.push_back(std::move(b));
                    }
                } else if (balances.is_array()) {
                    for (simdjson::dom::element value : simdjson::dom::array(balances)) {
                        schema::BalanceEntry b;
                        r = parse_balance_entry_(value, b);
                        if (r != Result::Parsed) {
                            return r;
                        }
                        out.balances.push_back(std::move(b));
                    }
                } else {
                    LS_DEBUG("[PARSER] Field 'balances' has an invalid type in user message -> ignore message.");
                    return Result::InvalidSchema;
                }
            }

            // order (optional)
            simdjson::dom::element order;
            r = helper::parse_object_optional(data, "order", order, present);
            if (r != Result::Parsed) {
                LS_DEBUG("[PARSER] Field 'order' is not an object in user message -> ignore message.");
                return r;
            }
            if (present) {
                schema::OrderUpdate upd;
                r = parse_order_update_(order, upd);
                if (r != Result::Parsed) {
                    return r;
                }
                out.order = std::move(upd);
            }

            // balance (optional)
            simdjson::dom::element balance;
            r = helper::parse_object_optional(data, "balance", balance, present);
            if (r != Result::Parsed) {
                LS_DEBUG("[PARSER] Field 'balance' is not an object in user message -> ignore message.");
                return r;
            }
            if (present) {
                std::vector<schema::OutcomeBalance> outcomes;
                r = parse_outcomes_(balance, outcomes);
                if (r != Result::Parsed) {
                    return r;
                }
                out.balance = std::move(outcomes);
            }
        } catch (const std::exception&) {
            return Result::InvalidValue;
        }

        return Result::Parsed;
    }

private:
    [[nodiscard]]
    static inline Result parse_side_(const simdjson::dom::element& obj, protocol::Side& out) noexcept {
        std::optional<std::int64_t> side;
        auto r = helper::parse_int64_optional(obj, "side", side);
        if (r != Result::Parsed) {
            return r;
        }
        if (side && !protocol::side_from_int(*side, out)) {
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }

    [[nodiscard]]
    static inline Result parse_status_(const simdjson::dom::element& obj, std::optional<protocol::OrderStatus>& out) noexcept {
        std::optional<std::string> status;
        auto r = helper::parse_string_optional(obj, "status", status);
        if (r != Result::Parsed) {
            return r;
        }
        if (status) {
            protocol::OrderStatus s;
            if (!protocol::order_status_from_string(*status, s)) {
                return Result::InvalidValue;
            }
            out = s;
        }
        return Result::Parsed;
    }

    [[nodiscard]]
    static inline Result parse_order_(const simdjson::dom::element& el, schema::Order& o) {
        Result r;
        if ((r = helper::require_object(el)) != Result::Parsed ||
            (r = helper::parse_string_required(el, "order_hash", o.order_hash)) != Result::Parsed ||
            (r = helper::parse_text_or(el, "market_pubkey", o.market_pubkey)) != Result::Parsed ||
            (r = helper::parse_text_or(el, "orderbook_id", o.orderbook_id)) != Result::Parsed ||
            (r = parse_side_(el, o.side)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "maker_amount", o.maker_amount)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "taker_amount", o.taker_amount)) != Result::Parsed ||
            (r = helper::parse_decimal_required(el, "remaining", o.remaining)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "filled", o.filled)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "price", o.price)) != Result::Parsed ||
            (r = helper::parse_int64_or(el, "created_at", o.created_at)) != Result::Parsed ||
            (r = helper::parse_int64_or(el, "expiration", o.expiration)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid order in user snapshot -> ignore message.");
            return r;
        }
        std::optional<protocol::OrderStatus> status;
        r = parse_status_(el, status);
        if (r != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid order status in user snapshot -> ignore message.");
            return r;
        }
        o.status = status.value_or(protocol::OrderStatus::Open);
        return Result::Parsed;
    }

    [[nodiscard]]
    static inline Result parse_order_update_(const simdjson::dom::element& el, schema::OrderUpdate& u) {
        Result r;
        if ((r = helper::parse_string_required(el, "order_hash", u.order_hash)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "price", u.price)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "fill_amount", u.fill_amount)) != Result::Parsed ||
            (r = helper::parse_decimal_required(el, "remaining", u.remaining)) != Result::Parsed ||
            (r = helper::parse_decimal_or_zero(el, "filled", u.filled)) != Result::Parsed ||
            (r = parse_side_(el, u.side)) != Result::Parsed ||
            (r = helper::parse_bool_or(el, "is_maker", u.is_maker)) != Result::Parsed ||
            (r = helper::parse_int64_or(el, "created_at", u.created_at)) != Result::Parsed ||
            (r = parse_status_(el, u.status)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid 'order' in user message -> ignore message.");
            return r;
        }
        simdjson::dom::element balance;
        bool present = false;
        r = helper::parse_object_optional(el, "balance", balance, present);
        if (r != Result::Parsed) {
            return r;
        }
        if (present) {
            std::vector<schema::OutcomeBalance> outcomes;
            r = parse_outcomes_(balance, outcomes);
            if (r != Result::Parsed) {
                return r;
            }
            u.balance = std::move(outcomes);
        }
        return Result::Parsed;
    }

    [[nodiscard]]
    static inline Result parse_balance_entry_(const simdjson::dom::element& el, schema::BalanceEntry& b) {
        Result r;
        if ((r = helper::require_object(el)) != Result::Parsed ||
            (r = helper::parse_string_required(el, "market_pubkey", b.market_pubkey)) != Result::Parsed ||
            (r = helper::parse_string_required(el, "deposit_mint", b.deposit_mint)) != Result::Parsed) {
            LS_DEBUG("[PARSER] Invalid balance entry in user snapshot -> ignore message.");
            return r;
        }
        return parse_outcomes_(el, b.outcomes);
    }

    [[nodiscard]]
    static inline Result parse_outcomes_(const simdjson::dom::element& el, std::vector<schema::OutcomeBalance>& out) {
        simdjson::dom::array outcomes;
        bool present = false;
        auto r = helper::parse_array_optional(el, "outcomes", outcomes, present);
        if (r != Result::Parsed || !present) {
            return r;
        }
        for (simdjson::dom::element o : outcomes) {
            schema::OutcomeBalance ob;
            std::int64_t index = 0;
            if ((r = helper::parse_int64_required(o, "outcome_index", index)) != Result::Parsed ||
                (r = helper::parse_text_or(o, "mint", ob.mint)) != Result::Parsed ||
                (r = helper::parse_decimal_or_zero(o, "idle", ob.idle)) != Result::Parsed ||
                (r = helper::parse_decimal_or_zero(o, "on_book", ob.on_book)) != Result::Parsed) {
                LS_DEBUG("[PARSER] Invalid outcome balance in user message -> ignore message.");
                return r;
            }
            ob.outcome_index = static_cast<std::int32_t>(index);
            out.push_back(std::move(ob));
        }
        return Result::Parsed;
    }
};

} // namespace lightsync::core::protocol::parser
