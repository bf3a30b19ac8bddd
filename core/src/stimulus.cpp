#include "schemasim/stimulus.hpp"
#include "schemasim/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numbers>
#include <sstream>

namespace schemasim {

namespace {

void require_finite(Real value, const char* what) {
    if (!std::isfinite(value)) {
        throw ParameterError(std::string("Stimulus parameter '") + what + "' must be finite");
    }
}

void require_non_negative(const std::optional<Real>& value, const char* what) {
    if (value && !(*value >= 0.0 && std::isfinite(*value))) {
        throw ParameterError(std::string("Stimulus parameter '") + what +
                             "' must be a finite non-negative time");
    }
}

void require_positive(const std::optional<Real>& value, const char* what) {
    if (value && !(*value > 0.0 && std::isfinite(*value))) {
        throw ParameterError(std::string("Stimulus parameter '") + what +
                             "' must be a finite positive time");
    }
}

void validate(const Waveform& waveform) {
    std::visit([](const auto& w) {
        using T = std::decay_t<decltype(w)>;

        if constexpr (std::is_same_v<T, ConstantWaveform>) {
            require_finite(w.value, "value");
        }
        else if constexpr (std::is_same_v<T, SineWaveform>) {
            require_finite(w.offset, "offset");
            require_finite(w.amplitude, "amplitude");
            require_finite(w.damping, "damping");
            require_finite(w.phase, "phase");
            if (!(w.frequency >= 0.0 && std::isfinite(w.frequency))) {
                throw ParameterError("Stimulus parameter 'frequency' must be finite and >= 0");
            }
            require_non_negative(w.delay, "delay");
        }
        else if constexpr (std::is_same_v<T, PulseWaveform>) {
            require_finite(w.v1, "v1");
            require_finite(w.v2, "v2");
            require_non_negative(w.td, "td");
            require_non_negative(w.tr, "tr");
            require_non_negative(w.tf, "tf");
            require_non_negative(w.pw, "pw");
            if (!(w.period > 0.0)) {
                throw ParameterError("Stimulus parameter 'per' must be positive");
            }
        }
        else if constexpr (std::is_same_v<T, ExponentialWaveform>) {
            require_finite(w.v1, "v1");
            require_finite(w.v2, "v2");
            require_non_negative(w.td1, "td1");
            require_positive(w.tau1, "tau1");
            require_positive(w.tau2, "tau2");
            require_non_negative(w.td2, "td2");
            if (w.td2 && *w.td2 < w.td1) {
                throw ParameterError("Stimulus parameter 'td2' must not precede 'td1'");
            }
        }
        else if constexpr (std::is_same_v<T, PwlWaveform>) {
            if (w.points.empty()) {
                throw ParameterError("PWL stimulus requires at least one point");
            }
            for (std::size_t i = 0; i < w.points.size(); ++i) {
                require_finite(w.points[i].first, "time");
                require_finite(w.points[i].second, "value");
                if (i > 0 && w.points[i].first < w.points[i - 1].first) {
                    throw ParameterError("PWL stimulus times must be non-decreasing");
                }
            }
        }
    }, waveform);
}

Real rise(Real t, Real t0, Real tau) {
    if (t <= t0) return 0.0;
    return 1.0 - std::exp(-(t - t0) / tau);
}

}  // namespace

Stimulus::Stimulus(Real constant)
    : waveform_(ConstantWaveform{constant}) {
    validate(waveform_);
}

Stimulus::Stimulus(Waveform waveform)
    : waveform_(std::move(waveform)) {
    validate(waveform_);
}

void Stimulus::bind_timestep(Real dt) {
    std::visit([dt](auto& w) {
        using T = std::decay_t<decltype(w)>;

        if constexpr (std::is_same_v<T, PulseWaveform>) {
            if (!w.tr) w.tr = dt;
            if (!w.tf) w.tf = dt;
            if (!w.pw) w.pw = dt;
        }
        else if constexpr (std::is_same_v<T, ExponentialWaveform>) {
            if (!w.tau1) w.tau1 = dt;
            if (!w.td2) w.td2 = w.td1 + dt;
            if (!w.tau2) w.tau2 = dt;
        }
    }, waveform_);
}

Real Stimulus::value(Real time) const {
    return std::visit([time](const auto& w) -> Real {
        using T = std::decay_t<decltype(w)>;

        if constexpr (std::is_same_v<T, ConstantWaveform>) {
            return w.value;
        }
        else if constexpr (std::is_same_v<T, SineWaveform>) {
            if (time < w.delay) return w.offset;
            Real t = time - w.delay;
            Real envelope = std::exp(-w.damping * t);
            return w.offset + w.amplitude * envelope *
                   std::sin(2.0 * std::numbers::pi * w.frequency * t + w.phase);
        }
        else if constexpr (std::is_same_v<T, PulseWaveform>) {
            if (time < w.td) return w.v1;

            const Real tr = w.tr.value_or(0.0);
            const Real tf = w.tf.value_or(0.0);
            const Real pw = w.pw.value_or(0.0);

            Real t = time - w.td;
            if (std::isfinite(w.period)) {
                t = std::fmod(t, w.period);
            }

            if (t < tr) {
                // Rising edge
                return w.v1 + (w.v2 - w.v1) * (t / tr);
            }
            t -= tr;

            if (t < pw) {
                return w.v2;
            }
            t -= pw;

            if (t < tf) {
                // Falling edge
                return w.v2 + (w.v1 - w.v2) * (t / tf);
            }

            return w.v1;
        }
        else if constexpr (std::is_same_v<T, ExponentialWaveform>) {
            if (time < w.td1) return w.v1;

            const Real tau1 = w.tau1.value_or(0.0);
            const Real tau2 = w.tau2.value_or(0.0);
            const Real td2 = w.td2.value_or(w.td1);

            Real v = w.v1 + (w.v2 - w.v1) * (tau1 > 0.0 ? rise(time, w.td1, tau1) : 1.0);
            if (time >= td2) {
                v += (w.v1 - w.v2) * (tau2 > 0.0 ? rise(time, td2, tau2) : 1.0);
            }
            return v;
        }
        else if constexpr (std::is_same_v<T, PwlWaveform>) {
            const auto& pts = w.points;
            if (time <= pts.front().first) return pts.front().second;
            if (time >= pts.back().first) return pts.back().second;

            auto it = std::upper_bound(pts.begin(), pts.end(), time,
                [](Real t, const std::pair<Real, Real>& p) { return t < p.first; });
            const auto& [t1, v1] = *it;
            const auto& [t0, v0] = *std::prev(it);
            if (t1 == t0) return v1;
            Real alpha = (time - t0) / (t1 - t0);
            return v0 + alpha * (v1 - v0);
        }
        else {
            return 0.0;
        }
    }, waveform_);
}

std::string Stimulus::describe() const {
    std::ostringstream os;
    auto opt = [](const std::optional<Real>& v) -> std::string {
        if (!v) return "-";
        std::ostringstream s;
        s << *v;
        return s.str();
    };

    std::visit([&](const auto& w) {
        using T = std::decay_t<decltype(w)>;

        if constexpr (std::is_same_v<T, ConstantWaveform>) {
            os << "DC " << w.value;
        }
        else if constexpr (std::is_same_v<T, SineWaveform>) {
            os << "SIN(" << w.offset << " " << w.amplitude << " " << w.frequency << " "
               << w.delay << " " << w.damping << " " << w.phase << ")";
        }
        else if constexpr (std::is_same_v<T, PulseWaveform>) {
            os << "PULSE(" << w.v1 << " " << w.v2 << " " << w.td << " " << opt(w.tr) << " "
               << opt(w.tf) << " " << opt(w.pw) << " " << w.period << ")";
        }
        else if constexpr (std::is_same_v<T, ExponentialWaveform>) {
            os << "EXP(" << w.v1 << " " << w.v2 << " " << w.td1 << " " << opt(w.tau1) << " "
               << opt(w.td2) << " " << opt(w.tau2) << ")";
        }
        else if constexpr (std::is_same_v<T, PwlWaveform>) {
            os << "PWL(";
            for (std::size_t i = 0; i < w.points.size(); ++i) {
                if (i > 0) os << " ";
                os << w.points[i].first << " " << w.points[i].second;
            }
            os << ")";
        }
    }, waveform_);

    return os.str();
}

}  // namespace schemasim
