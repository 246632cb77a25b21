// Collateralized debt positions ("safes") backed by the reference asset
#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace stablesim {
namespace protocol {

// Minimum collateralization in percent accepted when minting or modifying
constexpr double MIN_COLLATERALIZATION_PCT = 145.0;

template <typename T>
struct Safe {
    uint64_t owner{0};
    T collateral{0};   // reference asset
    T debt{0};         // stablecoin
};

template <typename T>
class SafeEngine {
public:
    using SafeId = uint64_t;

    // Debt that `collateral` supports at collateralization_pct
    static T max_debt(T collateral, T collateralization_pct, T ref_price, T redemption_price) {
        return (collateral * ref_price / (collateralization_pct / T(100))) / redemption_price;
    }

    static T collateralization_of(T collateral, T debt, T ref_price, T redemption_price) {
        if (!(debt > T(0))) return std::numeric_limits<T>::infinity();
        return T(100) * collateral * ref_price / (debt * redemption_price);
    }

    // Open a safe and mint the debt the requested collateralization allows
    std::pair<SafeId, T> open(uint64_t owner, T collateral, T collateralization_pct,
                              T ref_price, T redemption_price) {
        if (!(collateral > T(0))) {
            throw InvalidAmount("safe collateral must be positive");
        }
        if (!(collateralization_pct > T(MIN_COLLATERALIZATION_PCT))) {
            throw InvalidAmount("collateralization " + std::to_string(static_cast<double>(collateralization_pct)) +
                                "% is not above the minimum");
        }
        const T debt = require_finite(max_debt(collateral, collateralization_pct, ref_price, redemption_price),
                                      "minted debt");
        const SafeId id = next_id_++;
        journal(id);
        safes_[id] = Safe<T>{owner, collateral, debt};
        total_collateral_ += collateral;
        total_debt_ += debt;
        return {id, debt};
    }

    // Add (positive) or remove (negative) collateral and debt
    void modify(SafeId id, T d_collateral, T d_debt, T ref_price, T redemption_price) {
        Safe<T>& s = get_mut(id);
        const T collateral = s.collateral + d_collateral;
        const T debt = s.debt + d_debt;
        if (collateral < T(0) || debt < T(0)) {
            throw InvalidAmount("safe modification would make collateral or debt negative");
        }
        if (debt > T(0) &&
            !(collateralization_of(collateral, debt, ref_price, redemption_price) > T(MIN_COLLATERALIZATION_PCT))) {
            throw InvalidAmount("safe modification would breach the minimum collateralization");
        }
        journal(id);
        s.collateral = collateral;
        s.debt = debt;
        total_collateral_ += d_collateral;
        total_debt_ += d_debt;
    }

    // Close a safe whose debt the caller has repaid; returns the collateral
    T close(SafeId id) {
        const Safe<T> s = get(id);
        journal(id);
        total_collateral_ -= s.collateral;
        total_debt_ -= s.debt;
        safes_.erase(id);
        return s.collateral;
    }

    const Safe<T>& get(SafeId id) const {
        auto it = safes_.find(id);
        if (it == safes_.end()) {
            throw InvalidAmount("unknown safe id " + std::to_string(id));
        }
        return it->second;
    }

    T collateralization_pct(SafeId id, T ref_price, T redemption_price) const {
        const Safe<T>& s = get(id);
        return collateralization_of(s.collateral, s.debt, ref_price, redemption_price);
    }

    // Start recording an undo log; rollback() restores the state at this point
    void checkpoint() {
        undo_.clear();
        mark_ = Totals{total_collateral_, total_debt_, next_id_};
    }

    void rollback() {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            if (it->second) {
                safes_[it->first] = *it->second;
            } else {
                safes_.erase(it->first);
            }
        }
        undo_.clear();
        total_collateral_ = mark_.collateral;
        total_debt_ = mark_.debt;
        next_id_ = mark_.next_id;
    }

    size_t open_safes() const { return safes_.size(); }
    T total_collateral() const { return total_collateral_; }
    T total_debt() const { return total_debt_; }

private:
    Safe<T>& get_mut(SafeId id) {
        auto it = safes_.find(id);
        if (it == safes_.end()) {
            throw InvalidAmount("unknown safe id " + std::to_string(id));
        }
        return it->second;
    }

    // Prior value of a safe about to change (nullopt if it does not exist yet)
    void journal(SafeId id) {
        auto it = safes_.find(id);
        undo_.emplace_back(id, it == safes_.end() ? std::nullopt : std::optional<Safe<T>>(it->second));
    }

    struct Totals {
        T collateral{0};
        T debt{0};
        SafeId next_id{0};
    };

    std::map<SafeId, Safe<T>> safes_;
    std::vector<std::pair<SafeId, std::optional<Safe<T>>>> undo_;
    Totals mark_{};
    SafeId next_id_{0};
    T total_collateral_{0};
    T total_debt_{0};
};

} // namespace protocol
} // namespace stablesim
