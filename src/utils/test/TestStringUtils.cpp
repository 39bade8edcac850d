#include "StringUtils.hpp"
#include "ScopedEnvVar.hpp"
#include "TelgenErrors.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

void test_case_conversion() {
    assert(StringUtils::to_lower("GRPC") == "grpc");
    assert(StringUtils::to_upper("zstd") == "ZSTD");
    std::cout << "test_case_conversion passed.\n";
}

void test_trim_and_spaces() {
    std::string s = "  \tsnmp \n";
    StringUtils::trim(s);
    assert(s == "snmp");

    std::string t = " now - 7 d ";
    StringUtils::remove_all_spaces(t);
    assert(t == "now-7d");
    std::cout << "test_trim_and_spaces passed.\n";
}

void test_split_and_join() {
    auto parts = StringUtils::split(" grpc, snmp,,ddm ", ',');
    assert(parts.size() == 3);
    assert(parts[0] == "grpc");
    assert(parts[2] == "ddm");
    assert(StringUtils::join(parts, "|") == "grpc|snmp|ddm");
    assert(StringUtils::join({}, ",").empty());
    std::cout << "test_split_and_join passed.\n";
}

void test_scoped_env_var() {
    const char* name = "TELGEN_STRING_UTILS_TEST";
    unsetenv(name);
    {
        ScopedEnvVar env(name, std::string("42"));
        assert(std::string(std::getenv(name)) == "42");
        {
            ScopedEnvVar cleared(name, std::nullopt);
            assert(std::getenv(name) == nullptr);
        }
        assert(std::string(std::getenv(name)) == "42");
    }
    assert(std::getenv(name) == nullptr);
    std::cout << "test_scoped_env_var passed.\n";
}

void test_error_messages() {
    ConfigurationError cfg("fault_ratio", "must be within [0, 1]");
    assert(cfg.field() == "fault_ratio");
    assert(std::string(cfg.what()).find("fault_ratio") != std::string::npos);

    SchemaViolationError schema("ddm", "tx_power_mw", "-1", "below minimum");
    assert(schema.table() == "ddm");
    assert(schema.value() == "-1");

    SinkWriteError sink("snmp", 3, "disk full");
    assert(sink.last_batch_index() == 3);
    assert(std::string(sink.what()).find("disk full") != std::string::npos);
    std::cout << "test_error_messages passed.\n";
}

int main() {
    test_case_conversion();
    test_trim_and_spaces();
    test_split_and_join();
    test_scoped_env_var();
    test_error_messages();
    std::cout << "All StringUtils tests passed.\n";
    return 0;
}
