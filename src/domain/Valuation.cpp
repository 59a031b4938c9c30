#include "domain/Valuation.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

nlohmann::json holdingToJson(const HoldingValuation& h) {
    nlohmann::json j;
    j["holding_id"] = h.holdingId;
    j["investment_id"] = h.investmentId;
    j["description"] = h.description;
    j["public_id"] = optionalToJson(h.publicId);
    j["currency_code"] = h.currencyCode;
    j["quantity"] = h.quantity;
    j["average_cost"] = h.averageCost;
    j["has_price"] = h.hasPrice;
    j["price"] = optionalToJson(h.price);
    j["price_date"] = optionalToJson(h.priceDate);
    j["has_rate"] = h.hasRate;
    j["rate"] = optionalToJson(h.rate);
    j["rate_date"] = optionalToJson(h.rateDate);
    j["value_local"] = h.valueLocal;
    j["value_base"] = h.valueBase;
    return j;
}

nlohmann::json accountToJson(const AccountValuation& a) {
    nlohmann::json j;
    j["id"] = a.accountId;
    j["account_type"] = a.accountType;
    j["account_ref"] = a.accountRef;
    j["cash_balance"] = a.cashBalance;
    j["warn_cash"] = a.warnCash;
    j["cash_warning"] = a.cashWarning;
    j["investments_total"] = a.investmentsTotal;
    j["account_total"] = a.accountTotal;

    j["holdings"] = nlohmann::json::array();
    for (const auto& h : a.holdings) {
        j["holdings"].push_back(holdingToJson(h));
    }
    return j;
}

nlohmann::json userToJson(const UserValuation& u) {
    nlohmann::json j;
    j["user"] = {
        {"id", u.userId},
        {"first_name", u.firstName},
        {"last_name", u.lastName}
    };
    j["valuation_date"] = u.valuationDate;
    j["point_in_time"] = u.pointInTime;

    j["accounts"] = nlohmann::json::array();
    for (const auto& account : u.accounts) {
        j["accounts"].push_back(accountToJson(account));
    }

    j["totals"] = {
        {"investments", u.totals.investments},
        {"cash", u.totals.cash},
        {"grand_total", u.totals.grandTotal}
    };
    return j;
}

} // namespace

std::string UserValuation::toJson() const {
    return userToJson(*this).dump();
}

std::string toJson(const std::vector<UserValuation>& valuations) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& valuation : valuations) {
        j.push_back(userToJson(valuation));
    }
    return j.dump();
}

} // namespace ledger::domain
