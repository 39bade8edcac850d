#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "FaultDecisionCache.hpp"
#include "FaultInjector.hpp"
#include "TelgenErrors.hpp"

constexpr Timestamp START = 1740787200;

void test_zero_ratio_never_faults() {
    FaultInjector injector(42, 0.0);
    for (int i = 0; i < 5000; ++i) {
        FaultState s = injector.decide("mod-" + std::to_string(i % 50), START + i * 60);
        (void)s;
        assert(!s.anomalous());
        assert(s.severity == 0.0);
    }
    std::cout << "test_zero_ratio_never_faults passed\n";
}

void test_full_ratio_always_faults() {
    FaultInjector injector(42, 1.0);
    for (int i = 0; i < 2000; ++i) {
        FaultState s = injector.decide("mod-" + std::to_string(i % 10), START + i * 300);
        (void)s;
        assert(s.anomalous());
        assert(s.severity > 0.0 && s.severity <= 1.0);
    }
    std::cout << "test_full_ratio_always_faults passed\n";
}

void test_ratio_tolerance() {
    const double ratio = 0.1;
    FaultInjector injector(7, ratio);
    int flagged = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        // Every row in its own bucket so draws are independent
        if (injector.decide("mod-" + std::to_string(i % 100), START + (i / 100) * 1800).anomalous()) {
            ++flagged;
        }
    }
    double observed = static_cast<double>(flagged) / n;
    (void)observed;
    assert(std::fabs(observed - ratio) <= 0.02);
    std::cout << "test_ratio_tolerance passed (" << observed << ")\n";
}

void test_decision_is_pure() {
    FaultInjector a(99, 0.3);
    FaultInjector b(99, 0.3);
    for (int i = 0; i < 500; ++i) {
        std::string id = "Finisar-DC1-Pod01-Rack01-leaf-001-Ethernet1/" + std::to_string(i % 32 + 1) + "-100G";
        FaultState x = a.decide(id, START + i * 97);
        FaultState y = b.decide(id, START + i * 97);
        (void)x;
        (void)y;
        assert(x.kind == y.kind);
        assert(x.severity == y.severity);
    }
    std::cout << "test_decision_is_pure passed\n";
}

void test_bucket_sharing() {
    FaultInjector injector(5, 0.5);
    assert(injector.bucket_seconds() == 1800);
    for (int k = 0; k < 50; ++k) {
        std::string id = "key-" + std::to_string(k);
        FaultState first = injector.decide(id, START);
        FaultState later = injector.decide(id, START + 1799);
        (void)first;
        (void)later;
        assert(first.kind == later.kind && first.severity == later.severity);
    }
    assert(injector.bucket_of(START) == START / 1800);
    assert(injector.bucket_of(-1) == -1);
    std::cout << "test_bucket_sharing passed\n";
}

void test_higher_ratio_only_adds_faults() {
    FaultInjector low(11, 0.05);
    FaultInjector high(11, 0.25);
    for (int i = 0; i < 3000; ++i) {
        std::string id = "key-" + std::to_string(i % 30);
        if (low.decide(id, START + i * 1800).anomalous()) {
            assert(high.decide(id, START + i * 1800).anomalous());
        }
    }
    std::cout << "test_higher_ratio_only_adds_faults passed\n";
}

void test_severity_ranges() {
    FaultInjector injector(3, 1.0);
    for (int i = 0; i < 5000; ++i) {
        FaultState s = injector.decide("k" + std::to_string(i), START);
        switch (s.kind) {
            case FaultKind::LinkFlap:        assert(s.severity >= 0.5 && s.severity <= 1.0); break;
            case FaultKind::HighTemperature: assert(s.severity >= 0.3 && s.severity <= 1.0); break;
            case FaultKind::HighErrorRate:   assert(s.severity >= 0.2 && s.severity <= 1.0); break;
            case FaultKind::LowRxPower:      assert(s.severity >= 0.3 && s.severity <= 1.0); break;
            case FaultKind::VoltageDrift:    assert(s.severity >= 0.2 && s.severity <= 0.8); break;
            case FaultKind::None:            assert(false); break;
        }
    }
    std::cout << "test_severity_ranges passed\n";
}

void test_invalid_ratio() {
    const double bad[] = {-0.1, 1.01, std::numeric_limits<double>::quiet_NaN()};
    for (double r : bad) {
        bool caught = false;
        try {
            FaultInjector injector(1, r);
        } catch (const ConfigurationError& e) {
            caught = e.field() == "fault_ratio";
        }
        (void)caught;
        assert(caught);
    }

    FaultInjector injector(1, 0.1);
    bool caught = false;
    try {
        injector.decide("k", START, 2.0);
    } catch (const ConfigurationError& e) {
        caught = e.field() == "fault_ratio";
    }
    (void)caught;
    assert(caught);
    assert(!injector.decide("k", START, 0.0).anomalous());
    std::cout << "test_invalid_ratio passed\n";
}

void test_kind_names() {
    assert(fault_kind_names().size() == 6);
    assert(std::string(fault_kind_to_string(FaultKind::LowRxPower)) == "low_rx_power");
    assert(std::string(fault_kind_to_string(FaultKind::None)) == "none");
    std::cout << "test_kind_names passed\n";
}

void test_cache_matches_injector() {
    FaultInjector injector(21, 0.4);
    FaultDecisionCache cache(injector, 16);
    for (int i = 0; i < 400; ++i) {
        std::string id = "key-" + std::to_string(i % 7);
        Timestamp ts = START + i * 600;
        FaultState cached = cache.decide(id, ts);
        FaultState direct = injector.decide(id, ts);
        (void)cached;
        (void)direct;
        assert(cached.kind == direct.kind && cached.severity == direct.severity);
        assert(cache.size() <= cache.capacity());
    }
    assert(cache.hits() > 0);
    assert(cache.hits() + cache.misses() == 400);
    std::cout << "test_cache_matches_injector passed\n";
}

int main() {
    test_zero_ratio_never_faults();
    test_full_ratio_always_faults();
    test_ratio_tolerance();
    test_decision_is_pure();
    test_bucket_sharing();
    test_higher_ratio_only_adds_faults();
    test_severity_ranges();
    test_invalid_ratio();
    test_kind_names();
    test_cache_matches_injector();
    std::cout << "All FaultInjector tests passed\n";
    return 0;
}
