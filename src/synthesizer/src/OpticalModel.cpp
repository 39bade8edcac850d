#include "OpticalModel.hpp"
#include "RandomUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

double jitter(pcg32& rng, double stddev) {
    return RandomUtils::truncated_normal(rng, 0.0, stddev);
}

}

OpticalReading OpticalModel::sample(const OpticalModule& module, const FaultState& fault, pcg32& rng) {
    OpticalReading r;
    r.temperature_c = module.temperature_c + jitter(rng, 1.0);
    r.voltage_v = module.voltage_v + jitter(rng, 0.01);
    r.bias_ma = module.bias_ma + jitter(rng, 1.5);
    r.tx_power_dbm = module.tx_power_dbm + jitter(rng, 0.15);
    r.rx_power_dbm = module.rx_power_dbm + jitter(rng, 0.3);

    const double s = fault.severity;
    switch (fault.kind) {
        case FaultKind::HighTemperature:
            r.temperature_c = OpticalThresholds::TEMPERATURE_HIGH_C + 0.5 + 15.0 * s + jitter(rng, 0.5);
            r.bias_ma += 10.0 * s;
            break;
        case FaultKind::LowRxPower:
            r.rx_power_dbm = OpticalThresholds::RX_POWER_LOW_DBM - 0.5 - 5.5 * s + jitter(rng, 0.2);
            break;
        case FaultKind::VoltageDrift:
            if (RandomUtils::chance(rng, 0.5)) {
                r.voltage_v = OpticalThresholds::VOLTAGE_LOW_V - 0.01 - 0.12 * s;
            } else {
                r.voltage_v = OpticalThresholds::VOLTAGE_HIGH_V + 0.01 + 0.12 * s;
            }
            break;
        case FaultKind::LinkFlap:
            // Loss of light while the link is down
            if (s >= 0.6) {
                r.rx_power_dbm = -40.0 + 10.0 * (1.0 - s);
            }
            break;
        case FaultKind::HighErrorRate:
            // Marginal optics: the margin above the alarm line shrinks but never closes
            {
                double floor = OpticalThresholds::RX_POWER_LOW_DBM + 1.0;
                r.rx_power_dbm = floor + (r.rx_power_dbm - floor) * (1.0 - 0.8 * s);
            }
            r.tx_power_dbm -= 1.0 * s;
            break;
        case FaultKind::None:
            break;
    }

    // A failing laser ages fast: bias climbs when the module is past design life
    double wear = static_cast<double>(module.age_days) / std::max<int64_t>(module.design_life_days, 1);
    if (wear > 1.0) {
        r.bias_ma += 5.0 * (wear - 1.0);
    }
    return r;
}

std::string OpticalModel::alarm_flags(const OpticalReading& reading) {
    std::vector<std::string> flags;
    if (reading.temperature_c > OpticalThresholds::TEMPERATURE_HIGH_C) flags.push_back("temp_high");
    if (reading.voltage_v < OpticalThresholds::VOLTAGE_LOW_V) flags.push_back("vcc_low");
    if (reading.voltage_v > OpticalThresholds::VOLTAGE_HIGH_V) flags.push_back("vcc_high");
    if (reading.bias_ma > OpticalThresholds::BIAS_HIGH_MA) flags.push_back("bias_high");
    if (reading.tx_power_dbm < OpticalThresholds::TX_POWER_LOW_DBM) flags.push_back("tx_low");
    if (reading.rx_power_dbm < OpticalThresholds::RX_POWER_LOW_DBM) flags.push_back("rx_low");
    return flags.empty() ? "none" : StringUtils::join(flags, "|");
}

double OpticalModel::dbm_to_mw(double dbm) {
    return std::pow(10.0, dbm / 10.0);
}
