// commission.hpp
// Commission models for the execution handlers

#pragma once

#include <algorithm>
#include <string>
#include "../core/exceptions.hpp"

namespace replay {

struct CommissionModel {
    enum class Kind { FIXED, INTERACTIVE_BROKERS };

    Kind kind = Kind::FIXED;
    double fixed_amount = 0.0;  // Per order, FIXED only

    static CommissionModel fixed(double amount) {
        if (amount < 0) {
            throw ConfigurationException("Commission must not be negative");
        }
        CommissionModel model;
        model.kind = Kind::FIXED;
        model.fixed_amount = amount;
        return model;
    }

    static CommissionModel interactiveBrokers() {
        CommissionModel model;
        model.kind = Kind::INTERACTIVE_BROKERS;
        return model;
    }

    // IB US API tiered: 0.013/share up to 500 shares, 0.008/share above, minimum 1.30
    double calculate(long quantity, double price) const {
        (void)price;
        if (kind == Kind::FIXED) {
            return fixed_amount;
        }
        double per_share = quantity <= 500 ? 0.013 : 0.008;
        return std::max(1.3, per_share * quantity);
    }
};

inline CommissionModel parseCommissionModel(const std::string& name, double fixed_amount = 0.0) {
    if (name == "fixed") return CommissionModel::fixed(fixed_amount);
    if (name == "ib") return CommissionModel::interactiveBrokers();
    throw ConfigurationException("Unknown commission model: " + name);
}

} // namespace replay
