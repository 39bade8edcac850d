#pragma once

#include "ISynthesizer.hpp"
#include "SyslogCatalog.hpp"
#include "VendorCatalog.hpp"
#include "pcg_random.hpp"
#include <cstdint>
#include <vector>

// Vendor formatted syslog events; anomalies pick warning and error templates of the fault kind
class SyslogSynthesizer : public ISynthesizer {
public:
    SyslogSynthesizer(uint64_t run_seed, const Topology& topology);

    TableKind kind() const override { return TableKind::Syslog; }
    const TableSchema& schema() const override { return schema_; }

    Record synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) override;

    static TableSchema make_schema();

    struct RawLogParts {
        Timestamp timestamp = 0;
        std::string hostname;
        std::string ip;
        int64_t sequence = 0;
        int64_t pid = 0;
        const SyslogTemplate* tpl = nullptr;
        std::string message;
    };

    // One line in the layout of the vendor's network OS
    static std::string format_raw_log(SyslogStyle style, const RawLogParts& parts);

private:
    const SyslogTemplate& choose_template(const InterfaceRef& key, FaultKind kind);
    std::string render_message(const SyslogTemplate& tpl, const InterfaceRef& key, const FaultState& fault);

    TableSchema schema_;
    pcg32 rng_;
    std::vector<int64_t> sequences_;   // per key message counter for the Cisco layout
    std::vector<const SyslogTemplate*> eligible_;
};
