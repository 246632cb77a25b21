// Redemption-rate feedback controller (P / PI / PID)
// Rate is a per-step proportional change applied to the redemption price every step;
// the rate itself is only recomputed on update steps.
#pragma once

#include <cmath>
#include <cstdint>

#include "core/errors.hpp"

namespace stablesim {
namespace protocol {

enum class ControllerMode { P, PI, PID };

inline const char* to_string(ControllerMode m) {
    switch (m) {
        case ControllerMode::P:   return "P";
        case ControllerMode::PI:  return "PI";
        case ControllerMode::PID: return "PID";
    }
    return "P";
}

template <typename T>
struct ControllerParams {
    T kp{T(2e-5)};
    T ki{T(0)};
    T kd{T(0)};
    uint64_t update_period{4};   // steps between rate updates
    uint64_t warmup_steps{3};    // no update before this step index
    T initial_redemption_price{T(3.14)};

    ControllerMode mode() const {
        if (kd != T(0)) return ControllerMode::PID;
        if (ki != T(0)) return ControllerMode::PI;
        return ControllerMode::P;
    }
};

template <typename T>
class Controller {
public:
    explicit Controller(const ControllerParams<T>& p)
        : params_(p), redemption_price_(p.initial_redemption_price) {
        if (!(redemption_price_ > T(0)) || !std::isfinite(static_cast<long double>(redemption_price_))) {
            throw InvalidConfiguration("initial redemption price must be positive and finite");
        }
        if (params_.update_period == 0) {
            throw InvalidConfiguration("controller update period must be at least one step");
        }
    }

    T redemption_price() const { return redemption_price_; }
    T redemption_rate() const { return redemption_rate_; }
    T integral() const { return integral_; }
    T last_error() const { return last_error_; }
    uint64_t updates() const { return updates_; }
    const ControllerParams<T>& params() const { return params_; }

    bool is_update_step(uint64_t step) const {
        return step >= params_.warmup_steps && step % params_.update_period == 0;
    }

    // Advance one step: compound the redemption price with the held rate, then
    // recompute the rate from twap_fiat if this step qualifies.
    // Returns true when the rate was updated.
    bool step(uint64_t step, T twap_fiat) {
        require_finite(twap_fiat, "TWAP");
        compound();
        if (!is_update_step(step)) {
            return false;
        }
        update_rate(step, twap_fiat);
        return true;
    }

    // Redemption price n steps ahead at the current rate
    T forward_redemption_price(uint64_t n) const {
        return redemption_price_ * std::pow(T(1) + redemption_rate_, static_cast<T>(n));
    }

private:
    void compound() {
        const T next = redemption_price_ * (T(1) + redemption_rate_);
        require_finite(next, "redemption price");
        if (!(next > T(0))) {
            throw NumericDivergence("redemption price fell to or below zero");
        }
        redemption_price_ = next;
    }

    void update_rate(uint64_t step, T twap_fiat) {
        // Positive error: market below target, redemption price pushed up
        const T error = redemption_price_ - twap_fiat;
        const T elapsed = has_update_ ? static_cast<T>(step - last_update_step_)
                                      : static_cast<T>(params_.update_period);

        T rate = params_.kp * error;
        if (params_.ki != T(0)) {
            integral_ += params_.ki * error * elapsed;
            rate += integral_;
        }
        if (params_.kd != T(0) && has_update_) {
            rate += params_.kd * (error - last_error_) / elapsed;
        }

        redemption_rate_ = require_finite(rate, "redemption rate");
        last_error_ = error;
        last_update_step_ = step;
        has_update_ = true;
        ++updates_;
    }

    ControllerParams<T> params_;
    T redemption_price_;
    T redemption_rate_{0};
    T integral_{0};
    T last_error_{0};
    uint64_t last_update_step_{0};
    bool has_update_{false};
    uint64_t updates_{0};
};

} // namespace protocol
} // namespace stablesim
