#pragma once

#include "FaultInjector.hpp"
#include "Topology.hpp"
#include "pcg_random.hpp"
#include <string>

struct OpticalReading {
    double temperature_c = 0.0;
    double voltage_v = 0.0;
    double bias_ma = 0.0;
    double tx_power_dbm = 0.0;
    double rx_power_dbm = 0.0;
};

// Alarm thresholds shared by DDM rows, syslog messages and the lifecycle model
struct OpticalThresholds {
    static constexpr double TEMPERATURE_HIGH_C = 70.0;
    static constexpr double VOLTAGE_LOW_V = 3.13;
    static constexpr double VOLTAGE_HIGH_V = 3.47;
    static constexpr double BIAS_HIGH_MA = 85.0;
    static constexpr double TX_POWER_LOW_DBM = -8.0;
    static constexpr double RX_POWER_LOW_DBM = -14.0;
};

class OpticalModel {
public:
    // One sensor sample around the module's operating point, pushed past the
    // alarm thresholds according to the fault kind and severity
    static OpticalReading sample(const OpticalModule& module, const FaultState& fault, pcg32& rng);

    // "temp_high|rx_low" or "none"
    static std::string alarm_flags(const OpticalReading& reading);

    static double dbm_to_mw(double dbm);
};
