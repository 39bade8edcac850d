#include "SynthesizerFactory.hpp"
#include "DdmSynthesizer.hpp"
#include "GrpcSynthesizer.hpp"
#include "SnmpSynthesizer.hpp"
#include "SyslogSynthesizer.hpp"
#include <stdexcept>

std::unique_ptr<ISynthesizer> SynthesizerFactory::create(TableKind kind, uint64_t run_seed, const Topology& topology) {
    switch (kind) {
        case TableKind::Grpc:   return std::make_unique<GrpcSynthesizer>(run_seed, topology);
        case TableKind::Snmp:   return std::make_unique<SnmpSynthesizer>(run_seed, topology);
        case TableKind::Syslog: return std::make_unique<SyslogSynthesizer>(run_seed, topology);
        case TableKind::Ddm:    return std::make_unique<DdmSynthesizer>(run_seed);
        default:
            throw std::invalid_argument(std::string("No synthesizer for table ") + table_kind_to_string(kind));
    }
}
